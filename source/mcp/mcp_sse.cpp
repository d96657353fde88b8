#include "mcp/mcp_sse.hpp"

#include <cstdint>
#include <exception>

#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

namespace mcp_sse {

std::string format_frame(const json &message) {
    return "data: " + message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

json build_ping() {
    return json_rpc::build_notification("ping", json::object());
}

json build_error_notification(const std::string &message) {
    json params;
    params["code"] = json_rpc::INTERNAL_ERROR;
    params["message"] = "Internal error: " + message;
    return json_rpc::build_notification("error", params);
}

SseEmitter::SseEmitter(mcp_sessions::SessionRegistry &sessions, std::chrono::milliseconds keepalive_interval)
    : sessions_(sessions), keepalive_interval_(keepalive_interval) {}

namespace {

// Removes the session when the stream loop is left, however it is left.
class SessionRemoval {
public:
    SessionRemoval(mcp_sessions::SessionRegistry &sessions, const std::string &connection_id,
                   const mcp_sessions::QueueHandle &queue, const StreamSummary &summary)
        : sessions_(sessions), connection_id_(connection_id), queue_(queue), summary_(summary) {}
    SessionRemoval(const SessionRemoval &) = delete;
    SessionRemoval &operator=(const SessionRemoval &) = delete;

    ~SessionRemoval() {
        bool removed = sessions_.remove(connection_id_, queue_);
        debug_log::log("SSE stream loop ended for connection " + connection_id_ +
                       (removed ? " (session removed)" : " (session already gone)") +
                       ", messages=" + std::to_string(summary_.messages_sent) +
                       ", pings=" + std::to_string(summary_.pings_sent));
    }

private:
    mcp_sessions::SessionRegistry &sessions_;
    const std::string &connection_id_;
    const mcp_sessions::QueueHandle &queue_;
    const StreamSummary &summary_;
};

} // namespace

StreamSummary SseEmitter::run(const std::string &connection_id, const mcp_sessions::QueueHandle &queue,
                              FrameSink &sink) {
    StreamSummary summary;
    SessionRemoval removal(sessions_, connection_id, queue, summary);
    debug_log::log("SSE stream loop started for connection " + connection_id);

    try {
        for (;;) {
            // Read the generation before checking the sink: a disconnect that
            // lands between the check and the wait must still wake the wait.
            uint64_t observed_generation = queue->interrupt_generation();
            if (!sink.is_open()) {
                break;
            }

            json message;
            mcp_sessions::WaitStatus status = queue->wait_pop(message, keepalive_interval_, observed_generation);

            if (status == mcp_sessions::WaitStatus::kClosed) {
                break;
            }
            if (status == mcp_sessions::WaitStatus::kInterrupted) {
                // Woken by a disconnect or shutdown; the sink check decides.
                continue;
            }

            bool is_ping = (status == mcp_sessions::WaitStatus::kTimeout);
            std::string frame = format_frame(is_ping ? build_ping() : message);
            if (!sink.write_frame(frame)) {
                break;
            }
            if (is_ping) {
                summary.pings_sent++;
            } else {
                summary.messages_sent++;
            }
        }
    } catch (const std::exception &error) {
        summary.faulted = true;
        debug_log::notice("SSE stream for connection " + connection_id + " failed: " + error.what());
        try {
            if (!sink.write_frame(format_frame(build_error_notification(error.what())))) {
                debug_log::log("Could not deliver the error frame; client already gone.");
            }
        } catch (const std::exception &write_error) {
            debug_log::notice("SSE error frame for connection " + connection_id + " failed: " + write_error.what());
        }
    }

    return summary;
}

} // namespace mcp_sse
