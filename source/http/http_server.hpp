#ifndef TOOLGATE_HTTP_SERVER_HPP
#define TOOLGATE_HTTP_SERVER_HPP

// libwebsockets HTTP server hosting the gateway routes.
//
// One service thread owns every socket. Each request is handed to a worker
// thread (handle() or an SSE emitter loop); workers publish results into the
// request's HttpExchange and wake the service thread, which does all writes.

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/server_config.hpp"
#include "http/gateway_routes.hpp"
#include "http/http_types.hpp"
#include "mcp/mcp_sessions.hpp"
#include "mcp/mcp_sse.hpp"
#include "utils/task_group.hpp"

struct lws;
struct lws_context;

namespace http {

// State shared between the service thread and the worker serving one request.
struct HttpExchange {
    std::mutex mutex;
    // Set by the service thread once the socket is gone.
    bool closed = false;
    bool response_ready = false;
    HttpResponse response;
    // Event streams only.
    bool streaming = false;
    std::deque<std::string> pending_frames;
    bool stream_finished = false;
    mcp_sessions::QueueHandle queue;

    // Service thread only.
    struct lws *connection = nullptr;
    bool headers_sent = false;
    bool body_sent = false;
};

using ExchangeHandle = std::shared_ptr<HttpExchange>;

class HttpServer {
public:
    HttpServer(const config::ServerConfig &server_config, GatewayRoutes &routes,
               mcp_sessions::SessionRegistry &sessions);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    // Create the listening context. Returns false if the port cannot be bound.
    bool start();

    // Service sockets until request_stop(), then shut down in order:
    // close every session, join workers, destroy the context.
    void run();

    // Safe to call from a signal handler.
    void request_stop();

    // Worker side: schedule a write for an exchange from any thread.
    void wake(const ExchangeHandle &exchange);

    // libwebsockets entry point (service thread).
    int on_http_event(struct lws *connection, int reason, void *user_data, void *input, size_t length);

    // Per-transaction state of one connection.
    struct ConnectionState;

private:
    ConnectionState *find_connection(struct lws *connection);
    ConnectionState *begin_transaction(struct lws *connection, const char *uri);
    void release_connection(struct lws *connection);
    void dispatch(ConnectionState &state);
    void start_event_stream(ConnectionState &state);
    int write_pending(struct lws *connection, ConnectionState &state);
    void drain_wake_list();

    const config::ServerConfig &server_config_;
    GatewayRoutes &routes_;
    mcp_sessions::SessionRegistry &sessions_;
    mcp_sse::SseEmitter emitter_;
    task_group::TaskGroup workers_;

    struct lws_context *context_ = nullptr;
    std::atomic<bool> stop_requested_{false};

    // Service thread only. A keep-alive connection's entry is replaced by each
    // new transaction and erased when the connection closes.
    std::unordered_map<struct lws *, std::unique_ptr<ConnectionState>> connections_;

    std::mutex wake_mutex_;
    std::vector<ExchangeHandle> wake_list_;
};

} // namespace http

#endif // TOOLGATE_HTTP_SERVER_HPP
