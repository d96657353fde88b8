#include "mcp/mcp_sessions.hpp"

#include <utility>
#include <vector>

namespace mcp_sessions {

// --- MessageQueue ---

bool MessageQueue::push(json message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        messages_.push_back(std::move(message));
    }
    condition_.notify_all();
    return true;
}

WaitStatus MessageQueue::wait_pop(json &message, std::chrono::milliseconds timeout) {
    return wait_pop(message, timeout, interrupt_generation());
}

WaitStatus MessageQueue::wait_pop(json &message, std::chrono::milliseconds timeout, uint64_t observed_generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t start_generation = observed_generation;

    bool woken = condition_.wait_for(lock, timeout, [this, start_generation] {
        return closed_ || !messages_.empty() || interrupt_generation_ != start_generation;
    });

    if (closed_) {
        return WaitStatus::kClosed;
    }
    if (!messages_.empty()) {
        message = std::move(messages_.front());
        messages_.pop_front();
        return WaitStatus::kMessage;
    }
    if (woken) {
        return WaitStatus::kInterrupted;
    }
    return WaitStatus::kTimeout;
}

uint64_t MessageQueue::interrupt_generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupt_generation_;
}

void MessageQueue::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++interrupt_generation_;
    }
    condition_.notify_all();
}

void MessageQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool MessageQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

// --- SessionRegistry ---

QueueHandle SessionRegistry::get_or_create(const std::string &connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueHandle &slot = sessions_[connection_id];
    if (!slot) {
        slot = std::make_shared<MessageQueue>();
    }
    return slot;
}

QueueHandle SessionRegistry::lookup(const std::string &connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_iterator = sessions_.find(connection_id);
    if (session_iterator == sessions_.end()) {
        return nullptr;
    }
    return session_iterator->second;
}

bool SessionRegistry::push_if_present(const std::string &connection_id, const json &message) {
    QueueHandle queue = lookup(connection_id);
    if (!queue) {
        return false;
    }
    return queue->push(message);
}

bool SessionRegistry::remove(const std::string &connection_id, const QueueHandle &queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_iterator = sessions_.find(connection_id);
    if (session_iterator == sessions_.end() || session_iterator->second != queue) {
        return false;
    }
    sessions_.erase(session_iterator);
    return true;
}

bool SessionRegistry::contains(const std::string &connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(connection_id) != 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::close_all() {
    std::vector<QueueHandle> queues;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &entry : sessions_) {
            queues.push_back(entry.second);
        }
        sessions_.clear();
    }
    for (auto &queue : queues) {
        queue->close();
    }
}

} // namespace mcp_sessions
