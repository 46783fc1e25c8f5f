#include "chunkswarm/gc/sweep_scheduler.hpp"
#include "chunkswarm/core/logger.hpp"
#include <exception>

namespace chunkswarm::gc {

SweepScheduler::SweepScheduler(std::string name, std::chrono::milliseconds interval, Job job)
    : name_(std::move(name)), interval_(interval), job_(std::move(job)) {}

SweepScheduler::~SweepScheduler() {
    stop();
}

void SweepScheduler::start(bool run_immediately) {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&SweepScheduler::loop, this, run_immediately);
    LOG_INFO("{} scheduled every {}s", name_, std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
}

void SweepScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("{} stopped after {} runs", name_, runs_.load());
}

void SweepScheduler::run_now() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    try {
        job_();
    } catch (const std::exception& e) {
        LOG_ERROR("{} failed: {}", name_, e.what());
    }
    ++runs_;
}

void SweepScheduler::loop(bool run_immediately) {
    if (run_immediately) {
        run_now();
    }
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wait_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); })) {
                return;
            }
        }
        run_now();
    }
}

}
