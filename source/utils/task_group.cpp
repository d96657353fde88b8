#include "utils/task_group.hpp"

#include <exception>
#include <iterator>
#include <utility>

#include "utils/debug_log.hpp"

namespace task_group {

TaskGroup::~TaskGroup() {
    join_all();
}

void TaskGroup::spawn(const std::string &label, std::function<void()> work) {
    reap_finished();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([label, work = std::move(work), finished]() {
        try {
            work();
        } catch (const std::exception &error) {
            debug_log::notice("Task " + label + " failed: " + error.what());
        }
        finished->store(true);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(Task{std::move(thread), finished});
}

void TaskGroup::reap_finished() {
    std::list<Task> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto iterator = tasks_.begin(); iterator != tasks_.end();) {
            if (iterator->finished->load()) {
                auto next = std::next(iterator);
                done.splice(done.end(), tasks_, iterator);
                iterator = next;
            } else {
                ++iterator;
            }
        }
    }
    for (Task &task : done) {
        task.thread.join();
    }
}

void TaskGroup::join_all() {
    std::list<Task> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(tasks_);
    }
    for (Task &task : remaining) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
}

size_t TaskGroup::active_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace task_group
