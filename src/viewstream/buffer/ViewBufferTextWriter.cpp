#include <viewstream/buffer/ViewBufferTextWriter.hpp>

#include <viewstream/buffer/FlushMetrics.hpp>
#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/io/TextSink.hpp>
#include <viewstream/task/Executor.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace VS {

namespace {

auto outcomeFor(Expected<void> const& status) -> FlushOutcome {
    if (status) {
        return FlushOutcome::Completed;
    }
    return status.error().code == Error::Code::Cancelled ? FlushOutcome::Cancelled : FlushOutcome::Failed;
}

} // namespace

// Holds the in-use flag for the duration of a synchronous flush.
class ViewBufferTextWriter::InUseScope {
public:
    explicit InUseScope(ViewBufferTextWriter& writer)
        : writer(writer)
        , stop(writer.acquire()) {}
    ~InUseScope() { this->writer.release(); }

    InUseScope(InUseScope const&)            = delete;
    InUseScope& operator=(InUseScope const&) = delete;

    [[nodiscard]] auto token() const -> std::stop_token const& { return this->stop; }

private:
    ViewBufferTextWriter& writer;
    std::stop_token       stop;
};

ViewBufferTextWriter::ViewBufferTextWriter(ViewBuffer buffer)
    : viewBuffer(std::move(buffer))
    , sink(NoSink{})
    , htmlEncoder(&HtmlEncoder::Default()) {}

ViewBufferTextWriter::ViewBufferTextWriter(ViewBuffer buffer, TextSink& inner, HtmlEncoder const* encoder)
    : viewBuffer(std::move(buffer))
    , sink(TerminalSink{&inner})
    , htmlEncoder(encoder ? encoder : &HtmlEncoder::Default()) {}

ViewBufferTextWriter::ViewBufferTextWriter(ViewBuffer buffer, ViewBufferTextWriter& nested, HtmlEncoder const* encoder)
    : viewBuffer(std::move(buffer))
    , sink(NestedSink{&nested})
    , htmlEncoder(encoder ? encoder : &nested.encoder()) {
    if (&nested == this) {
        throw std::invalid_argument("ViewBufferTextWriter cannot nest itself");
    }
}

ViewBufferTextWriter::~ViewBufferTextWriter() {
    std::unique_lock<std::mutex> lock(this->idleMutex);
    this->idleCV.wait(lock, [this] { return !this->inUse.load(std::memory_order_acquire); });
}

void ViewBufferTextWriter::ensureIdle() {
    if (this->inUse.load(std::memory_order_acquire)) {
        if (this->metrics) {
            this->metrics->record_rejected_write();
        }
        vs_log("Write rejected on '" + this->viewBuffer.name() + "' while a flush is in flight", "Writer", "ERROR");
        throw std::logic_error("ViewBufferTextWriter used while a flush is in flight");
    }
}

auto ViewBufferTextWriter::acquire() -> std::stop_token {
    bool expected = false;
    if (!this->inUse.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        if (this->metrics) {
            this->metrics->record_rejected_write();
        }
        vs_log("Flush rejected on '" + this->viewBuffer.name() + "' while a flush is in flight", "Writer", "ERROR");
        throw std::logic_error("ViewBufferTextWriter flushed while a flush is in flight");
    }
    std::lock_guard<std::mutex> lock(this->stopMutex);
    this->stopSource = std::stop_source{};
    return this->stopSource.get_token();
}

// Notifies under the lock so a waiting destructor cannot finish before notify_all returns.
void ViewBufferTextWriter::release() {
    std::lock_guard<std::mutex> lock(this->idleMutex);
    this->inUse.store(false, std::memory_order_release);
    this->idleCV.notify_all();
}

auto ViewBufferTextWriter::state() const -> State {
    return this->inUse.load(std::memory_order_acquire) ? State::Draining : State::Idle;
}

auto ViewBufferTextWriter::terminalSink() const -> TextSink* {
    if (auto const* terminal = std::get_if<TerminalSink>(&this->sink)) {
        return terminal->sink;
    }
    return nullptr;
}

void ViewBufferTextWriter::write(char value) {
    this->ensureIdle();
    this->viewBuffer.appendHtml(TextChunk{value});
}

void ViewBufferTextWriter::write(std::string_view value) {
    this->ensureIdle();
    if (value.empty()) {
        return;
    }
    this->viewBuffer.appendHtml(TextChunk{std::string{value}});
}

void ViewBufferTextWriter::write(char const* value) {
    if (value == nullptr) {
        this->ensureIdle();
        return;
    }
    this->write(std::string_view{value});
}

void ViewBufferTextWriter::write(std::span<char const> buffer, std::size_t index, std::size_t count) {
    this->ensureIdle();
    TextChunk slice{buffer, index, count};
    this->viewBuffer.appendHtml(slice.toOwned());
}

void ViewBufferTextWriter::write(int value) {
    this->ensureIdle();
    this->viewBuffer.appendHtml(TextChunk{value});
}

void ViewBufferTextWriter::write(std::int64_t value) {
    this->ensureIdle();
    this->viewBuffer.appendHtml(TextChunk{value});
}

void ViewBufferTextWriter::write(std::shared_ptr<HtmlContent const> content) {
    this->ensureIdle();
    this->viewBuffer.appendHtml(std::move(content));
}

void ViewBufferTextWriter::write(HtmlContentContainer& container) {
    this->ensureIdle();
    container.moveTo(this->viewBuffer);
}

void ViewBufferTextWriter::writeLine() {
    this->write(std::string_view{this->lineEnding});
}

void ViewBufferTextWriter::writeLine(char value) {
    this->write(value);
    this->writeLine();
}

void ViewBufferTextWriter::writeLine(std::string_view value) {
    this->write(value);
    this->writeLine();
}

void ViewBufferTextWriter::writeLine(std::span<char const> buffer, std::size_t index, std::size_t count) {
    this->write(buffer, index, count);
    this->writeLine();
}

auto ViewBufferTextWriter::drainAndFlush(TextSink& target, std::stop_token const& stop) -> Expected<void> {
    auto const started = std::chrono::steady_clock::now();
    auto const values  = this->viewBuffer.count();

    CountingTextSink counting(target);
    auto status = this->viewBuffer.writeTo(counting, *this->htmlEncoder, stop);
    if (status) {
        this->viewBuffer.clear();
        status = counting.flush();
    }

    auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    if (this->metrics) {
        this->metrics->record_flush(outcomeFor(status), status ? values : 0, counting.bytesWritten(), elapsed);
    }
    if (status) {
        vs_log("Flushed " + std::to_string(values) + " values from '" + this->viewBuffer.name() + "'", "Writer");
    } else {
        vs_log("Flush of '" + this->viewBuffer.name() + "' failed: " + describeError(status.error()), "Writer", "ERROR");
    }
    return status;
}

auto ViewBufferTextWriter::flush() -> Expected<void> {
    auto* target = this->terminalSink();
    if (target == nullptr) {
        this->ensureIdle();
        if (this->metrics) {
            this->metrics->record_skipped_flush();
        }
        return {};
    }
    InUseScope scope(*this);
    return this->drainAndFlush(*target, scope.token());
}

auto ViewBufferTextWriter::flushAsync(Executor& executor) -> std::future<Expected<void>> {
    auto* target = this->terminalSink();
    if (target == nullptr) {
        this->ensureIdle();
        if (this->metrics) {
            this->metrics->record_skipped_flush();
        }
        std::promise<Expected<void>> done;
        done.set_value({});
        return done.get_future();
    }

    auto stop = this->acquire();
    std::packaged_task<Expected<void>()> task([this, target, stop = std::move(stop)]() -> Expected<void> {
        struct Release {
            ViewBufferTextWriter* writer;
            ~Release() { writer->release(); }
        } release{this};
        return this->drainAndFlush(*target, stop);
    });
    auto future = task.get_future();
    if (auto refused = executor.submit(std::move(task))) {
        this->release();
        vs_log("Async flush of '" + this->viewBuffer.name() + "' refused: " + describeError(*refused), "Writer", "ERROR");
        std::promise<Expected<void>> failed;
        failed.set_value(std::unexpected(*refused));
        return failed.get_future();
    }
    return future;
}

void ViewBufferTextWriter::cancelFlush() {
    std::lock_guard<std::mutex> lock(this->stopMutex);
    this->stopSource.request_stop();
}

} // namespace VS
