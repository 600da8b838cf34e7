#pragma once

#include <viewstream/io/TextSink.hpp>

namespace httplib {
struct DataSink;
} // namespace httplib

namespace VS::Serve {

// TextSink over the DataSink of a chunked httplib response. The DataSink is
// only valid inside one content-provider call, so it is rebound per call.
class DataSinkTextSink final : public TextSink {
public:
    DataSinkTextSink() = default;
    explicit DataSinkTextSink(httplib::DataSink& sink);

    using TextSink::write;

    auto write(std::string_view text) -> Expected<void> override;
    auto flush() -> Expected<void> override;

    void bind(httplib::DataSink& sink) { this->sink_ = &sink; }
    void unbind() { this->sink_ = nullptr; }
    [[nodiscard]] auto bound() const -> bool { return this->sink_ != nullptr; }

private:
    httplib::DataSink* sink_{nullptr};
};

} // namespace VS::Serve
