#ifndef TOOLGATE_MCP_SESSIONS_HPP
#define TOOLGATE_MCP_SESSIONS_HPP

// SSE sessions: one FIFO delivery queue per connection id.
//
// A session is created when an SSE stream subscribes, looked up (never
// created) by POST handlers that mirror responses, and removed by the owning
// stream when it ends. The registry map is the only state shared by every
// request thread; all map operations are serialized by one mutex.

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcp_sessions {

using json = nlohmann::json;

// Connection id used when a client sends no X-Connection-ID header.
constexpr const char *DEFAULT_CONNECTION_ID = "default";

enum class WaitStatus {
    kMessage,      // A message was dequeued.
    kTimeout,      // The bounded wait elapsed with nothing to deliver.
    kInterrupted,  // interrupt() was called; the consumer should re-check its stream.
    kClosed,       // The queue was closed; the consumer must stop.
};

// Unbounded FIFO of outbound messages. Any number of producers, normally one consumer.
class MessageQueue {
public:
    // Append a message. Returns false if the queue has been closed.
    bool push(json message);

    // Wait up to timeout for the next message.
    WaitStatus wait_pop(json &message, std::chrono::milliseconds timeout);

    // As above, but an interrupt() issued after observed_generation was read
    // (see interrupt_generation) returns kInterrupted at once, even if it
    // happened before this call started waiting.
    WaitStatus wait_pop(json &message, std::chrono::milliseconds timeout, uint64_t observed_generation);

    // Count of interrupt() calls so far.
    uint64_t interrupt_generation() const;

    // Wake every current waiter with kInterrupted without closing the queue.
    void interrupt();

    // Wake every waiter with kClosed; later pushes are rejected.
    void close();

    bool is_closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<json> messages_;
    uint64_t interrupt_generation_ = 0;
    bool closed_ = false;
};

using QueueHandle = std::shared_ptr<MessageQueue>;

class SessionRegistry {
public:
    // The queue for connection_id, created empty if absent. Idempotent.
    QueueHandle get_or_create(const std::string &connection_id);

    // The queue for connection_id, or nullptr. Never creates a session.
    QueueHandle lookup(const std::string &connection_id) const;

    // Push onto an existing session. Returns false (and does nothing) when no
    // session exists for connection_id.
    bool push_if_present(const std::string &connection_id, const json &message);

    // Remove the session if it still maps to queue, so a stream that ends late
    // cannot remove a newer session that reused its id. Returns true if removed.
    bool remove(const std::string &connection_id, const QueueHandle &queue);

    bool contains(const std::string &connection_id) const;
    size_t size() const;

    // Close every queue and forget all sessions (server shutdown).
    void close_all();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, QueueHandle> sessions_;
};

} // namespace mcp_sessions

#endif // TOOLGATE_MCP_SESSIONS_HPP
