#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace tether::events {

// Cooperative, single-threaded interval timer. Driven by process() from the
// thread that owns the overlay; tasks never run concurrently.
class Scheduler {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task, Clock::time_point now);
    void unschedule(const std::string& name);
    bool is_scheduled(const std::string& name) const;
    bool empty() const { return tasks_.empty(); }

    // Runs every task whose interval has elapsed. Returns how many ran.
    int process();
    int process(Clock::time_point now);

    // Time until the earliest task is due (zero if one is overdue).
    // Returns `idle` when nothing is scheduled.
    std::chrono::milliseconds time_until_next(Clock::time_point now, std::chrono::milliseconds idle) const;

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace tether::events
