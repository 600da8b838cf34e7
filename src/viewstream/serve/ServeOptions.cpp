#include <viewstream/serve/ServeOptions.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace VS::Serve {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

constexpr std::int64_t kMaxInt64 = std::numeric_limits<std::int64_t>::max();

} // namespace

bool IsValidServePort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateServeOptions(ServeOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidServePort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.page_size < 1) {
        return std::string{"--page-size must be >= 1"};
    }
    if (options.fragments < 0) {
        return std::string{"--fragments must be >= 0"};
    }
    if (options.batch_size < 1) {
        return std::string{"--batch-size must be >= 1"};
    }
    if (options.flush_interval_ms < 0) {
        return std::string{"--flush-interval-ms must be >= 0"};
    }
    if (options.title.empty()) {
        return std::string{"--title must not be empty"};
    }
    return std::nullopt;
}

bool ApplyServeEnvOverrides(ServeOptions& options) {
    if (!apply_env("VIEWSTREAM_SERVE_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "VIEWSTREAM_SERVE_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("VIEWSTREAM_SERVE_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "VIEWSTREAM_SERVE_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    auto apply_i64 = [&](char const* key, std::int64_t min, std::int64_t& target, char const* message) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, min, kMaxInt64, parsed)) {
                std::cerr << key << ' ' << message << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_i64("VIEWSTREAM_SERVE_PAGE_SIZE", 1, options.page_size, "must be >= 1")) {
        return false;
    }
    if (!apply_i64("VIEWSTREAM_SERVE_FRAGMENTS", 0, options.fragments, "must be >= 0")) {
        return false;
    }
    if (!apply_i64("VIEWSTREAM_SERVE_BATCH_SIZE", 1, options.batch_size, "must be >= 1")) {
        return false;
    }
    if (!apply_i64("VIEWSTREAM_SERVE_FLUSH_INTERVAL_MS", 0, options.flush_interval_ms, "must be >= 0")) {
        return false;
    }

    if (!apply_env("VIEWSTREAM_SERVE_TITLE", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "VIEWSTREAM_SERVE_TITLE must not be empty\n";
                return false;
            }
            options.title = std::string{value};
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintServeUsage() {
    std::cout << "Usage: viewstream_serve [options]\n"
              << "  --host <host>              Bind address (default 127.0.0.1)\n"
              << "  --port <port>              Bind port (default 8080)\n"
              << "  --page-size <n>            Values per buffer page (default 256)\n"
              << "  --fragments <n>            Fragments rendered by the demo page (default 64)\n"
              << "  --batch-size <n>           Fragments rendered between flushes (default 8)\n"
              << "  --flush-interval-ms <ms>   Pause after each flushed batch (default 0)\n"
              << "  --title <text>             Demo page title\n"
              << "  --help                     Show this help\n"
              << "Request /?mode=buffered to render the page without intermediate flushes.\n";
}

std::optional<ServeOptions> ParseServeArguments(int argc, char** argv) {
    ServeOptions options{};
    if (!ApplyServeEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_i64_flag = [&](int& index, std::string_view flag, std::int64_t min, std::int64_t& target, char const* message) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, kMaxInt64, parsed)) {
            std::cerr << flag << ' ' << message << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--page-size") {
            if (!parse_i64_flag(i, "--page-size", 1, options.page_size, "must be >= 1")) {
                return std::nullopt;
            }
        } else if (arg == "--fragments") {
            if (!parse_i64_flag(i, "--fragments", 0, options.fragments, "must be >= 0")) {
                return std::nullopt;
            }
        } else if (arg == "--batch-size") {
            if (!parse_i64_flag(i, "--batch-size", 1, options.batch_size, "must be >= 1")) {
                return std::nullopt;
            }
        } else if (arg == "--flush-interval-ms") {
            if (!parse_i64_flag(i, "--flush-interval-ms", 0, options.flush_interval_ms, "must be >= 0")) {
                return std::nullopt;
            }
        } else if (arg == "--title") {
            if (auto value = require_value(i, "--title")) {
                if (value->empty()) {
                    std::cerr << "--title must not be empty\n";
                    return std::nullopt;
                }
                options.title = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateServeOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace VS::Serve
