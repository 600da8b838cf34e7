#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace VS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidArgument,
        InvalidState,
        WriteFailed,
        FlushFailed,
        Cancelled,
        NotSupported,
        ExecutorShutdown
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::WriteFailed:
        return "write_failed";
    case Error::Code::FlushFailed:
        return "flush_failed";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::ExecutorShutdown:
        return "executor_shutdown";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace VS
