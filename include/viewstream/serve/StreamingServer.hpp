#pragma once

#include <viewstream/core/Error.hpp>
#include <viewstream/serve/ServeOptions.hpp>

#include <atomic>
#include <functional>
#include <string_view>

namespace VS::Serve {

struct ServeLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

// Runs until RequestServeStop() is called.
int RunStreamingServer(ServeOptions const&                     options,
                       ServeLogHooks const&                    log_hooks = {},
                       std::function<void(VS::Expected<void>)> on_listen = {});

int RunStreamingServerWithStopFlag(ServeOptions const&                  options,
                                   std::atomic<bool>&                   should_stop,
                                   ServeLogHooks const&                 log_hooks = {},
                                   std::function<void(VS::Expected<void>)> on_listen = {});

void RequestServeStop();
void ResetServeStopFlag();

} // namespace VS::Serve
