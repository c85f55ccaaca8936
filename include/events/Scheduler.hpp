#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace lyre::events {

// Runs named periodic tasks from the UI loop. process() is called once per
// tick; a task fires on the first tick at least interval after its last run.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void unschedule(const std::string& name);
    void process();
    void process(Clock::time_point now);

    // Runs a task immediately regardless of its interval (shutdown flush)
    bool run_now(const std::string& name);

    [[nodiscard]] bool has(const std::string& name) const { return tasks_.count(name) > 0; }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace lyre::events
