#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace owlink::system {

/**
 * @brief Cooperative timer set serviced from the main loop.
 *
 * Tasks are due once `nowMs` reaches their deadline; periodic tasks are
 * re-armed before they run, one-shot tasks (period 0) are removed before they
 * run. A task may schedule or cancel any task, itself included, from inside
 * its callback.
 *
 * Example:
 * @code
 * TaskScheduler scheduler;
 * auto id = scheduler.schedule("watchdog", 2000, 5000, millis(), [](uint64_t now) {
 *     checkLink(now);
 * });
 *
 * scheduler.service(millis());
 * scheduler.cancel(id);
 * @endcode
 */
class TaskScheduler {
public:
    using TaskId = uint32_t;
    using Task = std::function<void(uint64_t nowMs)>;

    static constexpr TaskId kInvalidTask = 0;

    TaskId schedule(const char* name, uint32_t firstDelayMs, uint32_t periodMs, uint64_t nowMs, Task task);
    void cancel(TaskId id);
    void cancelAll();
    void service(uint64_t nowMs);

    [[nodiscard]] bool active(TaskId id) const;
    [[nodiscard]] size_t size() const { return tasks_.size(); }

private:
    struct Entry {
        char name[16] = {0};
        uint64_t dueAtMs = 0;
        uint32_t periodMs = 0;
        Task task;
    };

    std::map<TaskId, Entry> tasks_;
    TaskId nextId_ = 1;
    bool servicing_ = false;
};

}  // namespace owlink::system
