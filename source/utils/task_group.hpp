#ifndef TOOLGATE_TASK_GROUP_HPP
#define TOOLGATE_TASK_GROUP_HPP

// Owns one thread per in-flight request so that nothing is detached.
// Finished threads are joined on the next spawn; join_all waits for the rest.

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace task_group {

class TaskGroup {
public:
    TaskGroup() = default;
    TaskGroup(const TaskGroup &) = delete;
    TaskGroup &operator=(const TaskGroup &) = delete;
    ~TaskGroup();

    // Run work on a new thread. An exception escaping work is reported with
    // label and ends only that thread.
    void spawn(const std::string &label, std::function<void()> work);

    // Join threads that have already finished.
    void reap_finished();

    // Join every thread, waiting for those still running.
    void join_all();

    size_t active_count();

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::mutex mutex_;
    std::list<Task> tasks_;
};

} // namespace task_group

#endif // TOOLGATE_TASK_GROUP_HPP
