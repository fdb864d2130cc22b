#include "events/Scheduler.hpp"
#include "util/Logger.hpp"

namespace sextant::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    schedule(name, interval, std::move(task), Clock::now());
}

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                         Clock::time_point start) {
    sextant::util::Logger::debug("Scheduler: Scheduling " + name);

    tasks_[name] = {std::move(task), interval, start};
}

void Scheduler::unschedule(const std::string& name) {
    sextant::util::Logger::debug("Scheduler: Unscheduling " + name);

    tasks_.erase(name);
}

int Scheduler::process() {
    return process(Clock::now());
}

int Scheduler::process(Clock::time_point now) {
    int ran = 0;
    for (auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            task.task();
            task.last_run = now;
            ++ran;
        }
    }
    return ran;
}

}  // namespace sextant::events
