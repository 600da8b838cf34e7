#pragma once

#include <viewstream/buffer/ViewBufferTextWriter.hpp>
#include <viewstream/serve/DataSinkTextSink.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>

namespace httplib {
struct DataSink;
} // namespace httplib

namespace VS {
class FlushMetrics;
} // namespace VS

namespace VS::Serve {

struct ServeOptions;

// Renders the next batch into the writer; returns false once the page is complete.
using RenderSource = std::function<bool(ViewBufferTextWriter&)>;

auto MakeDemoPageSource(ServeOptions const& options) -> RenderSource;

// Renders a source to completion into a writer without a sink and returns the markup.
auto RenderBuffered(RenderSource source, std::size_t page_size, FlushMetrics* metrics) -> Expected<std::string>;

/**
 * StreamingRenderSession: drives one chunked response.
 *
 * Each pump() renders one batch into a ViewBufferTextWriter that sits over
 * the response stream and flushes it, so the client receives the page
 * progressively. The final pump() signals the end of the response.
 */
class StreamingRenderSession {
public:
    StreamingRenderSession(RenderSource              source,
                           std::size_t               page_size,
                           FlushMetrics*             metrics,
                           std::atomic<bool>&        should_stop,
                           std::chrono::milliseconds flush_interval = std::chrono::milliseconds{0});

    auto pump(httplib::DataSink& sink) -> bool;
    void cancel();

    [[nodiscard]] auto finished() const -> bool { return this->finished_; }
    [[nodiscard]] auto batches() const -> std::size_t { return this->batches_; }

private:
    RenderSource              source_;
    DataSinkTextSink          sink_;
    ViewBufferTextWriter      writer_;
    std::atomic<bool>         cancelled_{false};
    std::atomic<bool>&        should_stop_;
    std::chrono::milliseconds flush_interval_;
    std::size_t               batches_{0};
    bool                      finished_{false};
};

} // namespace VS::Serve
