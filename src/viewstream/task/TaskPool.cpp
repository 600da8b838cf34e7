#include <viewstream/task/TaskPool.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <system_error>

namespace VS {

TaskPool::TaskPool(size_t threadCount) {
    vs_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    activeWorkers = 0;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            vs_log(std::string{"TaskPool::TaskPool failed to spawn worker: "} + error.what(), "TaskPool", "ERROR");
            if (workers.empty()) {
                throw;
            }
            break;
        }
    }
    vs_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    vs_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::InvalidArgument, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            vs_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::ExecutorShutdown, "Executor shutting down"};
        }
        this->jobs.push(std::move(job));
    }
    this->jobCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    vs_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown && this->workers.empty()) {
            return;
        }
        this->shuttingDown = true;
    }
    this->jobCV.notify_all();

    // Workers drain the queue before exiting, so accepted jobs always run.
    for (auto& th : this->workers) {
        if (th.joinable()) {
            th.join();
        }
    }
    this->workers.clear();
    vs_log("TaskPool::shutdown all workers joined", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::pending() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->jobs.size() + this->activeJobs.load();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            if (this->shuttingDown && this->jobs.empty()) {
                break;
            }

            job = std::move(this->jobs.front());
            this->jobs.pop();
            ++this->activeJobs;
        }

        job();
        --this->activeJobs;
    }

    vs_log("TaskPool::workerFunction exit", "TaskPool");
    --activeWorkers;
}

} // namespace VS
