#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace sextant::events {

/**
 * Named periodic tasks run from the host loop. Nothing runs on its own
 * thread; process() fires every task whose interval has elapsed.
 */
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                  Clock::time_point start);
    void unschedule(const std::string& name);

    // Returns how many tasks ran
    int process();
    int process(Clock::time_point now);

    size_t size() const { return tasks_.size(); }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace sextant::events
