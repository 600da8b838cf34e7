#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace VS::Serve {

struct ServeOptions {
    std::string  host{"127.0.0.1"};
    int          port{8080};
    std::int64_t page_size{256};
    std::int64_t fragments{64};
    std::int64_t batch_size{8};
    std::int64_t flush_interval_ms{0};
    std::string  title{"ViewStream demo"};
    bool         show_help{false};
};

auto ParseServeArguments(int argc, char** argv) -> std::optional<ServeOptions>;

void PrintServeUsage();

bool ApplyServeEnvOverrides(ServeOptions& options);

auto ValidateServeOptions(ServeOptions const& options) -> std::optional<std::string>;

bool IsValidServePort(int port);

} // namespace VS::Serve
