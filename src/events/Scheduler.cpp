#include "events/Scheduler.hpp"
#include "util/Logger.hpp"

namespace lyre::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    util::Logger::debug("Scheduler: Scheduling " + name + " every " + std::to_string(interval.count()) + "ms");

    tasks_[name] = {std::move(task), interval, Clock::now()};
}

void Scheduler::unschedule(const std::string& name) {
    util::Logger::debug("Scheduler: Unscheduling " + name);

    tasks_.erase(name);
}

void Scheduler::process() {
    process(Clock::now());
}

void Scheduler::process(Clock::time_point now) {
    for (auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            task.task();
            task.last_run = now;
        }
    }
}

bool Scheduler::run_now(const std::string& name) {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return false;
    }
    it->second.task();
    it->second.last_run = Clock::now();
    return true;
}

}  // namespace lyre::events
