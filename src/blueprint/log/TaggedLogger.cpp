#ifdef BP_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace BP {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            if (this->accepts(msg))
                this->writeToStderr(msg);
            lock.lock();
        }

        if (!this->running)
            return;
    }
}

auto TaggedLogger::accepts(const LogMessage& msg) const -> bool {
    for (auto const& tag : msg.tags)
        if (skipTags.contains(tag))
            return false;
    return true;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    std::filesystem::path p{filepath};
    if (p.has_parent_path())
        return (p.parent_path().filename() / p.filename()).string();
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    auto const nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";

    oss << '[' << msg.threadName << "] ";
    oss << '[' << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end())
        return it->second;
    auto name       = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id] = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace BP
#endif // BP_LOG_DEBUG
