#include <viewstream/buffer/ViewBuffer.hpp>

#include <viewstream/buffer/HtmlEncoder.hpp>
#include <viewstream/io/TextSink.hpp>
#include <viewstream/task/Executor.hpp>

#include "log/TaggedLogger.hpp"

#include <stdexcept>
#include <utility>

namespace VS {

ViewBufferValue::ViewBufferValue(TextChunk chunk, Encoding encoding)
    : value_(std::move(chunk))
    , encoding_(encoding) {}

ViewBufferValue::ViewBufferValue(std::shared_ptr<HtmlContent const> content)
    : value_(std::move(content))
    , encoding_(Encoding::Markup) {}

auto ViewBufferValue::writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> {
    if (auto const* chunk = std::get_if<TextChunk>(&this->value_)) {
        if (this->encoding_ == Encoding::Encode) {
            return chunk->writeTo(sink, encoder);
        }
        return chunk->writeTo(sink);
    }
    return std::get<std::shared_ptr<HtmlContent const>>(this->value_)->writeTo(sink, encoder);
}

auto ViewBufferValue::isContent() const -> bool {
    return std::holds_alternative<std::shared_ptr<HtmlContent const>>(this->value_);
}

ViewBuffer::ViewBuffer(std::string name, std::size_t pageSize)
    : name_(std::move(name))
    , pageSize_(pageSize) {
    if (pageSize == 0) {
        throw std::invalid_argument("ViewBuffer page size must be positive");
    }
}

void ViewBuffer::push(ViewBufferValue value) {
    if (this->pages_.empty() || this->pages_.back().size() >= this->pageSize_) {
        auto& page = this->pages_.emplace_back();
        page.reserve(this->pageSize_);
    }
    this->pages_.back().push_back(std::move(value));
}

void ViewBuffer::append(TextChunk chunk) {
    if (chunk.empty()) {
        return;
    }
    this->push(ViewBufferValue{std::move(chunk), ViewBufferValue::Encoding::Encode});
}

void ViewBuffer::appendHtml(TextChunk chunk) {
    if (chunk.empty()) {
        return;
    }
    this->push(ViewBufferValue{std::move(chunk), ViewBufferValue::Encoding::Markup});
}

void ViewBuffer::appendHtml(std::shared_ptr<HtmlContent const> content) {
    if (!content) {
        return;
    }
    this->push(ViewBufferValue{std::move(content)});
}

auto ViewBuffer::writeTo(TextSink& sink, HtmlEncoder const& encoder) const -> Expected<void> {
    return this->writeTo(sink, encoder, std::stop_token{});
}

auto ViewBuffer::writeTo(TextSink& sink, HtmlEncoder const& encoder, std::stop_token const& stop) const
    -> Expected<void> {
    for (auto const& page : this->pages_) {
        for (auto const& entry : page) {
            if (stop.stop_requested()) {
                vs_log("ViewBuffer '" + this->name_ + "' drain cancelled", "Buffer");
                return std::unexpected(Error{Error::Code::Cancelled, "drain of '" + this->name_ + "' cancelled"});
            }
            if (auto status = entry.writeTo(sink, encoder); !status) {
                vs_log("ViewBuffer '" + this->name_ + "' drain failed: " + describeError(status.error()), "Buffer", "ERROR");
                return status;
            }
        }
    }
    return {};
}

auto ViewBuffer::writeToAsync(TextSink&          sink,
                              HtmlEncoder const& encoder,
                              Executor&          executor,
                              std::stop_token    stop) const -> std::future<Expected<void>> {
    std::packaged_task<Expected<void>()> task([this, &sink, &encoder, stop = std::move(stop)]() {
        return this->writeTo(sink, encoder, stop);
    });
    auto future = task.get_future();
    if (auto refused = executor.submit(std::move(task))) {
        std::promise<Expected<void>> failed;
        failed.set_value(std::unexpected(*refused));
        return failed.get_future();
    }
    return future;
}

void ViewBuffer::clear() {
    this->pages_.clear();
}

void ViewBuffer::copyTo(ViewBuffer& destination) const {
    if (&destination == this) {
        return;
    }
    this->forEachValue([&destination](ViewBufferValue const& entry) { destination.push(entry); });
}

void ViewBuffer::moveTo(ViewBuffer& destination) {
    if (&destination == this) {
        return;
    }
    for (auto& page : this->pages_) {
        for (auto& entry : page) {
            destination.push(std::move(entry));
        }
    }
    this->clear();
}

auto ViewBuffer::contents(HtmlEncoder const& encoder) const -> Expected<std::string> {
    StringTextSink sink;
    if (auto status = this->writeTo(sink, encoder); !status) {
        return std::unexpected(status.error());
    }
    return sink.take();
}

auto ViewBuffer::count() const -> std::size_t {
    std::size_t total = 0;
    for (auto const& page : this->pages_) {
        total += page.size();
    }
    return total;
}

} // namespace VS
