#include <blueprint/task/TaskPool.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>

namespace BP {

TaskPool::TaskPool(size_t threadCount) {
    bp_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            bp_log(std::string{"TaskPool::TaskPool failed to spawn worker: "} + error.what(), "TaskPool", "Error");
            break;
        }
    }
    bp_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    bp_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::InvalidType, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            bp_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::NotSupported, "Executor shutting down"};
        }
        jobs.push(std::move(job));
    }
    jobCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    bp_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->shuttingDown = true;
    }
    this->jobCV.notify_all();

    // Workers drain the queue before exiting.
    for (auto& th : this->workers) {
        if (th.joinable() && th.get_id() != std::this_thread::get_id()) {
            th.join();
        }
    }
    activeWorkers = 0;

    std::lock_guard<std::mutex> lock(this->mutex);
    while (!this->jobs.empty()) {
        this->jobs.pop();
    }
    this->idleCV.notify_all();
    bp_log("TaskPool::shutdown ends", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::waitIdle() -> void {
    std::unique_lock<std::mutex> lock(mutex);
    idleCV.wait(lock, [this] { return this->jobs.empty() && this->activeJobs == 0; });
}

auto TaskPool::workerFunction() -> void {
#ifdef BP_LOG_DEBUG
    set_thread_name("TaskPool worker");
#endif
    bp_log("TaskPool::workerFunction start", "TaskPool");
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            if (this->shuttingDown && this->jobs.empty()) {
                break;
            }
            job = std::move(jobs.front());
            jobs.pop();
            ++activeJobs;
        }

        try {
            job();
        } catch (std::exception const& error) {
            bp_log(std::string{"Exception in running job: "} + error.what(), "Error", "Exception");
        }
        // Captures are released before the pool can report idle.
        job = nullptr;

        {
            std::lock_guard<std::mutex> lock(mutex);
            --activeJobs;
            if (this->jobs.empty() && this->activeJobs == 0) {
                idleCV.notify_all();
            }
        }
    }

    bp_log("TaskPool::workerFunction exit", "TaskPool");
    --activeWorkers;
}

} // namespace BP
