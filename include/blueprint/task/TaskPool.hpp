#pragma once
#include <blueprint/core/Error.hpp>
#include <blueprint/task/Executor.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace BP {

// FIFO worker pool. Jobs submitted to a pool with one worker run strictly in
// submission order.
class TaskPool : public Executor {
public:
    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> size_t override;

    // Blocks until the queue is empty and no job is running.
    auto waitIdle() -> void;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    std::mutex                mutex;
    std::condition_variable   jobCV;
    std::condition_variable   idleCV;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<size_t>       activeWorkers{0};
    size_t                    activeJobs = 0;
};

} // namespace BP
