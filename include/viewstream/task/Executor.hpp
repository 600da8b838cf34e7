#pragma once

#include <viewstream/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <optional>

namespace VS {

/**
 * Executor: interface for running deferred work such as asynchronous drains.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (e.g., executor shutting down). A refused job is destroyed unrun.
 * - An accepted job runs exactly once, even if shutdown() is requested
 *   while it is still queued.
 * - Jobs must not throw; callers that need a result or an exception back
 *   wrap their work in a std::packaged_task.
 * - shutdown() stops accepting work and waits for queued jobs to finish.
 */
struct Executor {
    using Job = std::move_only_function<void()>;

    virtual ~Executor() = default;

    virtual auto submit(Job job) -> std::optional<Error> = 0;

    virtual auto shutdown() -> void = 0;

    // Implementation-defined capacity (e.g., number of workers).
    virtual auto size() const -> std::size_t = 0;
};

} // namespace VS
