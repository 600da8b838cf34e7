#pragma once
#include <viewstream/task/Executor.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace VS {

class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    [[nodiscard]] auto pending() const -> size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    mutable std::mutex        mutex;
    std::condition_variable   jobCV;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<size_t>       activeWorkers{0};
    std::atomic<size_t>       activeJobs{0};
};

} // namespace VS
