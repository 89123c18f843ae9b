/*
 * HiveMem C++ - Periodic timer
 *
 * Runs a task on its own thread every interval_ms until stopped.
 * stop() wakes the sleeping thread immediately and joins it; a task
 * already running is allowed to finish its current batch.
 */
#ifndef hivemem_CORE_PERIODIC_TIMER_HPP
#define hivemem_CORE_PERIODIC_TIMER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace hivemem {

class PeriodicTimer {
public:
    typedef std::function<void()> Task;

    PeriodicTimer();
    ~PeriodicTimer();

    // false when already running or interval_ms <= 0
    bool start(const std::string& name, int64_t interval_ms, Task task);
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t ticks() const { return ticks_.load(); }

private:
    PeriodicTimer(const PeriodicTimer&);
    PeriodicTimer& operator=(const PeriodicTimer&);

    void run_loop();

    std::string name_;
    int64_t interval_ms_;
    Task task_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> ticks_;
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
};

} // namespace hivemem

#endif // hivemem_CORE_PERIODIC_TIMER_HPP
