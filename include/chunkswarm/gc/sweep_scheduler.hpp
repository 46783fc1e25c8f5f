#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace chunkswarm::gc {

// Runs a job on its own thread: once at start, then every interval until
// stopped. run_now() runs it synchronously on the caller's thread; runs
// never overlap.
class SweepScheduler {
public:
    using Job = std::function<void()>;

    SweepScheduler(std::string name, std::chrono::milliseconds interval, Job job);
    ~SweepScheduler();

    SweepScheduler(const SweepScheduler&) = delete;
    SweepScheduler& operator=(const SweepScheduler&) = delete;

    void start(bool run_immediately = true);
    void stop();
    void run_now();

    bool is_running() const { return running_.load(); }
    std::uint64_t run_count() const { return runs_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void loop(bool run_immediately);

    std::string name_;
    std::chrono::milliseconds interval_;
    Job job_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> runs_{0};
    std::mutex run_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;
};

}
