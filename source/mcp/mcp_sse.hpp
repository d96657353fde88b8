#ifndef TOOLGATE_MCP_SSE_HPP
#define TOOLGATE_MCP_SSE_HPP

// Server-Sent Events emitter: drains one session queue into one open stream.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <string>

#include "mcp/mcp_sessions.hpp"

namespace mcp_sse {

using json = nlohmann::json;

// Destination of the frames of one open SSE stream.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Deliver one complete frame. Returns false once the client is gone.
    virtual bool write_frame(const std::string &frame) = 0;

    // False once the client has disconnected.
    virtual bool is_open() const = 0;
};

// Encode a message as one SSE frame: "data: <compact JSON>\n\n".
std::string format_frame(const json &message);

// Keepalive notification sent when the queue stays idle for a whole window.
json build_ping();

// Final notification sent when the stream loop hits an unrecoverable fault.
json build_error_notification(const std::string &message);

struct StreamSummary {
    size_t messages_sent = 0;
    size_t pings_sent = 0;
    bool faulted = false;
};

class SseEmitter {
public:
    SseEmitter(mcp_sessions::SessionRegistry &sessions, std::chrono::milliseconds keepalive_interval);

    // Run the stream loop until the sink closes or the queue is closed.
    // Each wait on the queue is bounded by the keepalive interval; an idle
    // window produces a ping frame instead of ending the stream. Whatever ends
    // the loop, the session is removed from the registry before returning.
    StreamSummary run(const std::string &connection_id, const mcp_sessions::QueueHandle &queue, FrameSink &sink);

private:
    mcp_sessions::SessionRegistry &sessions_;
    std::chrono::milliseconds keepalive_interval_;
};

} // namespace mcp_sse

#endif // TOOLGATE_MCP_SSE_HPP
