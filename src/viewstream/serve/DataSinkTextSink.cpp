#define CPPHTTPLIB_NO_EXCEPTIONS
#include "httplib.h"

#include <viewstream/serve/DataSinkTextSink.hpp>

namespace VS::Serve {

DataSinkTextSink::DataSinkTextSink(httplib::DataSink& sink)
    : sink_(&sink) {}

auto DataSinkTextSink::write(std::string_view text) -> Expected<void> {
    if (this->sink_ == nullptr || !this->sink_->write) {
        return std::unexpected(Error{Error::Code::InvalidState, "no response stream bound"});
    }
    if (text.empty()) {
        return {};
    }
    if (!this->sink_->write(text.data(), text.size())) {
        return std::unexpected(Error{Error::Code::WriteFailed, "response stream refused write"});
    }
    return {};
}

// Chunks are pushed to the socket as they are written; flush only confirms the peer is still there.
auto DataSinkTextSink::flush() -> Expected<void> {
    if (this->sink_ == nullptr) {
        return std::unexpected(Error{Error::Code::InvalidState, "no response stream bound"});
    }
    if (this->sink_->is_writable && !this->sink_->is_writable()) {
        return std::unexpected(Error{Error::Code::FlushFailed, "response stream is no longer writable"});
    }
    return {};
}

} // namespace VS::Serve
