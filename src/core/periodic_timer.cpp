/*
 * HiveMem C++ - Periodic timer Implementation
 */
#include <hivemem/core/periodic_timer.hpp>
#include <hivemem/core/logger.hpp>
#include <chrono>
#include <exception>

namespace hivemem {

PeriodicTimer::PeriodicTimer()
    : interval_ms_(0)
    , running_(false)
    , ticks_(0)
{}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

bool PeriodicTimer::start(const std::string& name, int64_t interval_ms, Task task) {
    if (interval_ms <= 0 || !task) return false;
    if (running_.exchange(true)) return false;

    name_ = name;
    interval_ms_ = interval_ms;
    task_ = task;
    thread_ = std::thread([this]() { run_loop(); });

    LOG_DEBUG("[PeriodicTimer] %s started (every %lld ms)", name_.c_str(),
              static_cast<long long>(interval_ms_));
    return true;
}

void PeriodicTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("[PeriodicTimer] %s stopped after %llu ticks", name_.c_str(),
              static_cast<unsigned long long>(ticks_.load()));
}

void PeriodicTimer::run_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                           [this]() { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            task_();
        } catch (const std::exception& e) {
            // Background tasks report through the log only
            LOG_ERROR("[PeriodicTimer] %s task failed: %s", name_.c_str(), e.what());
        }
        ticks_++;
    }
}

} // namespace hivemem
