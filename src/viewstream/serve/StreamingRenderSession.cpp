#define CPPHTTPLIB_NO_EXCEPTIONS
#include "httplib.h"

#include <viewstream/serve/StreamingRenderSession.hpp>

#include <viewstream/buffer/FlushMetrics.hpp>
#include <viewstream/buffer/HtmlContent.hpp>
#include <viewstream/serve/ServeOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace VS::Serve {

namespace {

struct DemoPageState {
    std::string  title;
    std::int64_t fragments{0};
    std::int64_t batch_size{1};
    std::int64_t next{0};
    bool         started{false};
};

void write_header(ViewBufferTextWriter& writer, DemoPageState const& state) {
    writer.writeLine("<!doctype html>");
    writer.write("<html><head><meta charset=\"utf-8\"><title>");
    writer.writeValue(EncodedText{state.title});
    writer.writeLine("</title></head><body>");
    writer.write("<h1>");
    writer.writeValue(std::make_shared<EncodedText>(state.title));
    writer.writeLine("</h1>");
    writer.writeLine("<ol>");
}

void write_fragment(ViewBufferTextWriter& writer, std::int64_t index, std::int64_t total) {
    writer.write("<li id=\"fragment-");
    writer.write(index);
    writer.write("\">Fragment ");
    writer.write(index + 1);
    writer.write(" of ");
    writer.write(total);
    writer.writeLine("</li>");
}

void write_footer(ViewBufferTextWriter& writer) {
    writer.writeLine("</ol>");
    writer.writeLine("</body></html>");
}

} // namespace

auto MakeDemoPageSource(ServeOptions const& options) -> RenderSource {
    auto state        = std::make_shared<DemoPageState>();
    state->title      = options.title;
    state->fragments  = std::max<std::int64_t>(options.fragments, 0);
    state->batch_size = std::max<std::int64_t>(options.batch_size, 1);

    return [state](ViewBufferTextWriter& writer) -> bool {
        if (!state->started) {
            state->started = true;
            write_header(writer, *state);
        }
        auto const end = std::min(state->fragments, state->next + state->batch_size);
        for (; state->next < end; ++state->next) {
            write_fragment(writer, state->next, state->fragments);
        }
        if (state->next >= state->fragments) {
            write_footer(writer);
            return false;
        }
        return true;
    };
}

auto RenderBuffered(RenderSource source, std::size_t page_size, FlushMetrics* metrics) -> Expected<std::string> {
    ViewBufferTextWriter writer{ViewBuffer{"page", page_size}};
    writer.setMetrics(metrics);
    while (source(writer)) {
    }
    // No sink: flush leaves everything in the buffer.
    if (auto status = writer.flush(); !status) {
        return std::unexpected(status.error());
    }
    return writer.buffer().contents(writer.encoder());
}

StreamingRenderSession::StreamingRenderSession(RenderSource              source,
                                               std::size_t               page_size,
                                               FlushMetrics*             metrics,
                                               std::atomic<bool>&        should_stop,
                                               std::chrono::milliseconds flush_interval)
    : source_(std::move(source))
    , writer_(ViewBuffer{"stream", page_size}, sink_)
    , should_stop_(should_stop)
    , flush_interval_(flush_interval) {
    writer_.setMetrics(metrics);
}

auto StreamingRenderSession::pump(httplib::DataSink& sink) -> bool {
    if (finished_ || cancelled_.load(std::memory_order_acquire) || should_stop_.load(std::memory_order_acquire)) {
        return false;
    }

    sink_.bind(sink);
    bool more   = source_(writer_);
    auto status = writer_.flush();
    sink_.unbind();
    ++batches_;

    if (!status) {
        vs_log("Streaming flush failed after batch " + std::to_string(batches_) + ": " + describeError(status.error()),
               "Serve",
               "ERROR");
        return false;
    }

    if (!more) {
        finished_ = true;
        if (sink.done) {
            sink.done();
        }
        return true;
    }

    if (flush_interval_.count() > 0) {
        std::this_thread::sleep_for(flush_interval_);
    }
    return true;
}

void StreamingRenderSession::cancel() {
    cancelled_.store(true, std::memory_order_release);
}

} // namespace VS::Serve
