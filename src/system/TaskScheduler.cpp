#include "system/TaskScheduler.h"

#include "system/Log.h"

#include <cstring>
#include <utility>
#include <vector>

namespace owlink::system {

TaskScheduler::TaskId TaskScheduler::schedule(const char* name, uint32_t firstDelayMs, uint32_t periodMs,
                                              uint64_t nowMs, Task task) {
    if (!task) {
        return kInvalidTask;
    }

    const TaskId id = nextId_++;
    if (nextId_ == kInvalidTask) {
        nextId_ = 1;
    }

    Entry entry;
    const char* safeName = (name && name[0] != '\0') ? name : "task";
    std::strncpy(entry.name, safeName, sizeof(entry.name) - 1);
    entry.dueAtMs = nowMs + firstDelayMs;
    entry.periodMs = periodMs;
    entry.task = std::move(task);
    tasks_[id] = std::move(entry);

    traceLine("TASK", "scheduled %s id=%lu first=%lums period=%lums", safeName,
              static_cast<unsigned long>(id), static_cast<unsigned long>(firstDelayMs),
              static_cast<unsigned long>(periodMs));
    return id;
}

void TaskScheduler::cancel(TaskId id) {
    tasks_.erase(id);
}

void TaskScheduler::cancelAll() {
    tasks_.clear();
}

bool TaskScheduler::active(TaskId id) const {
    return id != kInvalidTask && tasks_.count(id) > 0;
}

void TaskScheduler::service(uint64_t nowMs) {
    if (servicing_) {
        return;
    }
    servicing_ = true;

    std::vector<TaskId> due;
    for (const auto& item : tasks_) {
        if (nowMs >= item.second.dueAtMs) {
            due.push_back(item.first);
        }
    }

    for (TaskId id : due) {
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            continue;
        }
        Task task = it->second.task;
        if (it->second.periodMs == 0) {
            tasks_.erase(it);
        } else {
            it->second.dueAtMs = nowMs + it->second.periodMs;
        }
        task(nowMs);
    }

    servicing_ = false;
}

}  // namespace owlink::system
