#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace tether::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    schedule(name, interval, std::move(task), Clock::now());
}

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                         Clock::time_point now) {
    tether::util::Logger::debug("Scheduler: Scheduling task '" + name + "' every " +
        std::to_string(interval.count()) + "ms");

    tasks_[name] = {std::move(task), interval, now};
}

void Scheduler::unschedule(const std::string& name) {
    if (tasks_.erase(name) > 0) {
        tether::util::Logger::debug("Scheduler: Unscheduled task '" + name + "'");
    }
}

bool Scheduler::is_scheduled(const std::string& name) const {
    return tasks_.count(name) > 0;
}

int Scheduler::process() {
    return process(Clock::now());
}

int Scheduler::process(Clock::time_point now) {
    // Collect first: a task may unschedule itself or others while running
    std::vector<std::string> due;
    for (const auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            due.push_back(name);
        }
    }

    int ran = 0;
    for (const auto& name : due) {
        auto it = tasks_.find(name);
        if (it == tasks_.end()) continue;

        it->second.last_run = now;
        Task task = it->second.task;
        task();
        ++ran;
    }
    return ran;
}

std::chrono::milliseconds Scheduler::time_until_next(Clock::time_point now,
                                                     std::chrono::milliseconds idle) const {
    if (tasks_.empty()) return idle;

    auto next = std::chrono::milliseconds::max();
    for (const auto& [name, task] : tasks_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - task.last_run);
        auto remaining = task.interval - elapsed;
        next = std::min(next, std::max(remaining, std::chrono::milliseconds(0)));
    }
    return next;
}

}  // namespace tether::events
