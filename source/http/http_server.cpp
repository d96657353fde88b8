#include "http/http_server.hpp"

#include <libwebsockets.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <utility>

#include "utils/debug_log.hpp"

namespace http {

// Larger request bodies are answered with 413.
constexpr size_t MAX_BODY_BYTES = 4 * 1024 * 1024;

struct HttpServer::ConnectionState {
    HttpRequest request;
    ExchangeHandle exchange;
    size_t content_length = 0;
    bool body_too_large = false;
};

// Forward declaration of the HTTP callback.
static int gateway_callback(struct lws *connection, enum lws_callback_reasons reason,
                            void *user_data, void *input, size_t length);

// HTTP protocol definition for libwebsockets.
static const struct lws_protocols gateway_protocols[] = {
    {
        "http",
        gateway_callback,
        0,                      // per-session data size (state lives in the server)
        0                       // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int gateway_callback(struct lws *connection, enum lws_callback_reasons reason,
                            void *user_data, void *input, size_t length) {
    struct lws_context *context = lws_get_context(connection);
    HttpServer *server = context != nullptr ? static_cast<HttpServer *>(lws_context_user(context)) : nullptr;
    if (server == nullptr) {
        return lws_callback_http_dummy(connection, reason, user_data, input, length);
    }
    return server->on_http_event(connection, static_cast<int>(reason), user_data, input, length);
}

// --- Request decoding ---

static std::string copy_token(struct lws *connection, enum lws_token_indexes token) {
    int length = lws_hdr_total_length(connection, token);
    if (length <= 0) {
        return "";
    }
    std::string value(static_cast<size_t>(length) + 1, '\0');
    int copied = lws_hdr_copy(connection, &value[0], length + 1, token);
    if (copied < 0) {
        return "";
    }
    value.resize(static_cast<size_t>(copied));
    return value;
}

struct MethodToken {
    const char *method;
    enum lws_token_indexes token;
};

static const MethodToken METHOD_TOKENS[] = {
    {"GET", WSI_TOKEN_GET_URI},
    {"POST", WSI_TOKEN_POST_URI},
#if defined(LWS_WITH_HTTP_UNCOMMON_HEADERS) || defined(LWS_HTTP_HEADERS_ALL)
    {"OPTIONS", WSI_TOKEN_OPTIONS_URI},
    {"PUT", WSI_TOKEN_PUT_URI},
    {"PATCH", WSI_TOKEN_PATCH_URI},
    {"DELETE", WSI_TOKEN_DELETE_URI},
#endif
};

struct HeaderToken {
    const char *name;
    enum lws_token_indexes token;
};

// Headers libwebsockets parses into fixed tokens; anything else arrives as a custom header.
static const HeaderToken HEADER_TOKENS[] = {
    {"host", WSI_TOKEN_HOST},
    {"origin", WSI_TOKEN_ORIGIN},
    {"accept", WSI_TOKEN_HTTP_ACCEPT},
    {"authorization", WSI_TOKEN_HTTP_AUTHORIZATION},
    {"content-type", WSI_TOKEN_HTTP_CONTENT_TYPE},
    {"content-length", WSI_TOKEN_HTTP_CONTENT_LENGTH},
#if defined(LWS_WITH_HTTP_UNCOMMON_HEADERS) || defined(LWS_HTTP_HEADERS_ALL)
    {"user-agent", WSI_TOKEN_HTTP_USER_AGENT},
    {"access-control-request-headers", WSI_TOKEN_HTTP_AC_REQUEST_HEADERS},
#endif
};

#if defined(LWS_WITH_CUSTOM_HEADERS)
struct CustomHeaderWalk {
    struct lws *connection;
    HeaderMap *headers;
};

static void collect_custom_header(const char *name, int name_length, void *opaque) {
    CustomHeaderWalk *walk = static_cast<CustomHeaderWalk *>(opaque);
    int value_length = lws_hdr_custom_length(walk->connection, name, name_length);
    if (value_length < 0) {
        return;
    }
    std::string value(static_cast<size_t>(value_length) + 1, '\0');
    int copied = lws_hdr_custom_copy(walk->connection, &value[0], value_length + 1, name, name_length);
    if (copied < 0) {
        return;
    }
    value.resize(static_cast<size_t>(copied));

    std::string header_name(name, static_cast<size_t>(name_length));
    if (!header_name.empty() && header_name.back() == ':') {
        header_name.pop_back();
    }
    (*walk->headers)[to_lower(header_name)] = value;
}
#endif

static void read_request(struct lws *connection, const char *uri, HttpRequest &request) {
    for (const MethodToken &candidate : METHOD_TOKENS) {
        if (lws_hdr_total_length(connection, candidate.token) > 0) {
            request.method = candidate.method;
            request.path = copy_token(connection, candidate.token);
            break;
        }
    }
    if (request.path.empty() && uri != nullptr) {
        request.path = uri;
    }
    size_t query_position = request.path.find('?');
    if (query_position != std::string::npos) {
        request.path.erase(query_position);
    }

    for (const HeaderToken &header : HEADER_TOKENS) {
        std::string value = copy_token(connection, header.token);
        if (!value.empty()) {
            request.headers[header.name] = value;
        }
    }
#if defined(LWS_WITH_CUSTOM_HEADERS)
    CustomHeaderWalk walk{connection, &request.headers};
    lws_hdr_custom_name_foreach(connection, collect_custom_header, &walk);
#endif

    char peer_address[128];
    const char *peer = lws_get_peer_simple(connection, peer_address, sizeof(peer_address));
    if (peer != nullptr) {
        request.peer_address = peer;
    }
}

// --- Event stream sink ---

// Queues frames on the exchange for the service thread to write.
class ExchangeFrameSink : public mcp_sse::FrameSink {
public:
    ExchangeFrameSink(HttpServer &server, ExchangeHandle exchange)
        : server_(server), exchange_(std::move(exchange)) {}

    bool write_frame(const std::string &frame) override {
        {
            std::lock_guard<std::mutex> lock(exchange_->mutex);
            if (exchange_->closed) {
                return false;
            }
            exchange_->pending_frames.push_back(frame);
        }
        server_.wake(exchange_);
        return true;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(exchange_->mutex);
        return !exchange_->closed;
    }

private:
    HttpServer &server_;
    ExchangeHandle exchange_;
};

// --- Server ---

HttpServer::HttpServer(const config::ServerConfig &server_config, GatewayRoutes &routes,
                       mcp_sessions::SessionRegistry &sessions)
    : server_config_(server_config),
      routes_(routes),
      sessions_(sessions),
      emitter_(sessions, std::chrono::seconds(server_config.sse_keepalive_seconds)) {}

HttpServer::~HttpServer() {
    if (context_ != nullptr) {
        sessions_.close_all();
        workers_.join_all();
        lws_context_destroy(context_);
        context_ = nullptr;
    }
}

bool HttpServer::start() {
    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = server_config_.port;
    const std::string &host = server_config_.host;
    context_info.iface = (host.empty() || host == "0.0.0.0") ? nullptr : host.c_str();
    context_info.protocols = gateway_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    context_ = lws_create_context(&context_info);
    if (context_ == nullptr) {
        debug_log::notice("Failed to create HTTP listener on " + host + ":" + std::to_string(server_config_.port));
        return false;
    }
    debug_log::notice("Listening on http://" + host + ":" + std::to_string(server_config_.port));
    return true;
}

void HttpServer::run() {
    while (!stop_requested_.load()) {
        if (lws_service(context_, 0) < 0) {
            debug_log::notice("Service loop ended with an error.");
            break;
        }
    }

    debug_log::notice("Shutting down: closing " + std::to_string(sessions_.size()) + " SSE sessions.");
    sessions_.close_all();
    workers_.join_all();
    lws_context_destroy(context_);
    context_ = nullptr;
    debug_log::notice("Server stopped.");
}

void HttpServer::request_stop() {
    stop_requested_.store(true);
    if (context_ != nullptr) {
        lws_cancel_service(context_);
    }
}

void HttpServer::wake(const ExchangeHandle &exchange) {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_list_.push_back(exchange);
    }
    lws_cancel_service(context_);
}

void HttpServer::drain_wake_list() {
    std::vector<ExchangeHandle> pending;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        pending.swap(wake_list_);
    }
    for (const ExchangeHandle &exchange : pending) {
        struct lws *connection = nullptr;
        {
            std::lock_guard<std::mutex> lock(exchange->mutex);
            if (!exchange->closed) {
                connection = exchange->connection;
            }
        }
        if (connection != nullptr) {
            lws_callback_on_writable(connection);
        }
    }
}

HttpServer::ConnectionState *HttpServer::find_connection(struct lws *connection) {
    auto found = connections_.find(connection);
    return found == connections_.end() ? nullptr : found->second.get();
}

HttpServer::ConnectionState *HttpServer::begin_transaction(struct lws *connection, const char *uri) {
    release_connection(connection);

    auto state = std::make_unique<ConnectionState>();
    state->exchange = std::make_shared<HttpExchange>();
    state->exchange->connection = connection;
    read_request(connection, uri, state->request);

    std::string content_length = state->request.header("content-length");
    if (!content_length.empty()) {
        state->content_length = static_cast<size_t>(std::strtoull(content_length.c_str(), nullptr, 10));
    }

    ConnectionState *current = state.get();
    connections_[connection] = std::move(state);
    return current;
}

void HttpServer::release_connection(struct lws *connection) {
    auto found = connections_.find(connection);
    if (found == connections_.end()) {
        return;
    }
    std::unique_ptr<ConnectionState> state = std::move(found->second);
    connections_.erase(found);

    mcp_sessions::QueueHandle queue;
    {
        std::lock_guard<std::mutex> lock(state->exchange->mutex);
        state->exchange->closed = true;
        state->exchange->connection = nullptr;
        queue = state->exchange->queue;
    }
    // Wake the emitter so it notices the closed sink.
    if (queue) {
        queue->interrupt();
    }
}

void HttpServer::dispatch(ConnectionState &state) {
    ExchangeHandle exchange = state.exchange;

    if (state.body_too_large) {
        {
            std::lock_guard<std::mutex> lock(exchange->mutex);
            exchange->response = HttpResponse::with_detail(413, "Request body too large");
            exchange->response_ready = true;
        }
        lws_callback_on_writable(exchange->connection);
        return;
    }

    if (routes_.classify(state.request) == RouteAction::kEventStream) {
        start_event_stream(state);
        return;
    }

    HttpRequest request = std::move(state.request);
    std::string label = request.method + " " + request.path;
    workers_.spawn(label, [this, exchange, request]() {
        HttpResponse response;
        try {
            response = routes_.handle(request);
        } catch (const std::exception &error) {
            debug_log::notice("Request " + request.method + " " + request.path + " failed: " + error.what());
            response = HttpResponse::with_detail(500, "Internal server error");
        }
        {
            std::lock_guard<std::mutex> lock(exchange->mutex);
            exchange->response = std::move(response);
            exchange->response_ready = true;
        }
        wake(exchange);
    });
}

void HttpServer::start_event_stream(ConnectionState &state) {
    ExchangeHandle exchange = state.exchange;
    EventStream stream = routes_.open_event_stream(state.request);
    {
        std::lock_guard<std::mutex> lock(exchange->mutex);
        exchange->streaming = true;
        exchange->queue = stream.queue;
        exchange->response = stream.head;
        exchange->response_ready = true;
    }
    lws_callback_on_writable(exchange->connection);

    workers_.spawn("sse " + stream.connection_id, [this, exchange, stream]() {
        ExchangeFrameSink sink(*this, exchange);
        mcp_sse::StreamSummary summary = emitter_.run(stream.connection_id, stream.queue, sink);
        debug_log::notice("SSE stream closed for connection " + stream.connection_id + " (" +
                          std::to_string(summary.messages_sent) + " messages, " +
                          std::to_string(summary.pings_sent) + " pings" +
                          (summary.faulted ? ", faulted)" : ")"));
        {
            std::lock_guard<std::mutex> lock(exchange->mutex);
            exchange->stream_finished = true;
        }
        wake(exchange);
    });
}

static int complete_transaction(struct lws *connection) {
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

int HttpServer::write_pending(struct lws *connection, ConnectionState &state) {
    enum class Step { kHeaders, kBody, kFrame, kFinish };

    ExchangeHandle exchange = state.exchange;
    Step step = Step::kFinish;
    HttpResponse head;
    std::string payload;
    bool streaming = false;
    bool more_to_write = false;
    {
        std::lock_guard<std::mutex> lock(exchange->mutex);
        if (!exchange->response_ready) {
            return 0;
        }
        streaming = exchange->streaming;
        if (!exchange->headers_sent) {
            step = Step::kHeaders;
            head = exchange->response;
        } else if (!streaming) {
            if (exchange->body_sent) {
                return 0;
            }
            step = Step::kBody;
            payload = exchange->response.body;
        } else if (!exchange->pending_frames.empty()) {
            step = Step::kFrame;
            payload = std::move(exchange->pending_frames.front());
            exchange->pending_frames.pop_front();
            more_to_write = !exchange->pending_frames.empty() || exchange->stream_finished;
        } else if (exchange->stream_finished) {
            step = Step::kFinish;
        } else {
            return 0;
        }
    }

    // No exchange lock is held below: completing a transaction can re-enter
    // the callback and release the connection state.
    switch (step) {
    case Step::kHeaders: {
        size_t header_bytes = 1024 + head.content_type.size();
        for (const auto &header : head.headers) {
            header_bytes += header.first.size() + header.second.size() + 8;
        }
        std::vector<unsigned char> buffer(LWS_PRE + header_bytes);
        unsigned char *start = buffer.data() + LWS_PRE;
        unsigned char *position = start;
        unsigned char *end = buffer.data() + buffer.size() - 1;

        lws_filepos_t content_length = streaming ? LWS_ILLEGAL_HTTP_CONTENT_LEN
                                                 : static_cast<lws_filepos_t>(head.body.size());
        if (lws_add_http_common_headers(connection, static_cast<unsigned int>(head.status),
                                        head.content_type.c_str(), content_length, &position, end)) {
            return 1;
        }
        for (const auto &header : head.headers) {
            std::string name = to_lower(header.first) + ":";
            if (lws_add_http_header_by_name(connection, reinterpret_cast<const unsigned char *>(name.c_str()),
                                            reinterpret_cast<const unsigned char *>(header.second.c_str()),
                                            static_cast<int>(header.second.size()), &position, end)) {
                return 1;
            }
        }
        if (lws_finalize_write_http_header(connection, start, &position, end)) {
            return 1;
        }
        exchange->headers_sent = true;

        if (!streaming && head.body.empty()) {
            exchange->body_sent = true;
            return complete_transaction(connection);
        }
        lws_callback_on_writable(connection);
        return 0;
    }
    case Step::kBody: {
        std::vector<unsigned char> buffer(LWS_PRE + payload.size());
        memcpy(buffer.data() + LWS_PRE, payload.data(), payload.size());
        int written = lws_write(connection, buffer.data() + LWS_PRE, payload.size(), LWS_WRITE_HTTP_FINAL);
        if (written < static_cast<int>(payload.size())) {
            return -1;
        }
        exchange->body_sent = true;
        return complete_transaction(connection);
    }
    case Step::kFrame: {
        std::vector<unsigned char> buffer(LWS_PRE + payload.size());
        memcpy(buffer.data() + LWS_PRE, payload.data(), payload.size());
        int written = lws_write(connection, buffer.data() + LWS_PRE, payload.size(), LWS_WRITE_HTTP);
        if (written < static_cast<int>(payload.size())) {
            return -1;
        }
        if (more_to_write) {
            lws_callback_on_writable(connection);
        }
        return 0;
    }
    case Step::kFinish:
        // The stream has no content length; closing the connection ends it.
        return -1;
    }
    return 0;
}

int HttpServer::on_http_event(struct lws *connection, int reason, void *user_data, void *input, size_t length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_HTTP: {
        ConnectionState *state = begin_transaction(connection, static_cast<const char *>(input));
        // Tool calls and streams may legitimately stay silent for a long time.
        lws_set_timeout(connection, NO_PENDING_TIMEOUT, 0);
        debug_log::log(state->request.method + " " + state->request.path);
        if (state->request.method == "POST" && state->content_length > 0) {
            return 0; // Wait for LWS_CALLBACK_HTTP_BODY_COMPLETION.
        }
        dispatch(*state);
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY: {
        ConnectionState *state = find_connection(connection);
        if (state == nullptr) {
            return -1;
        }
        if (state->request.body.size() + length > MAX_BODY_BYTES) {
            state->body_too_large = true;
        } else if (!state->body_too_large) {
            state->request.body.append(static_cast<const char *>(input), length);
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION: {
        ConnectionState *state = find_connection(connection);
        if (state == nullptr) {
            return -1;
        }
        dispatch(*state);
        return 0;
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        ConnectionState *state = find_connection(connection);
        if (state == nullptr) {
            return 0;
        }
        return write_pending(connection, *state);
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        drain_wake_list();
        return 0;

    case LWS_CALLBACK_HTTP_DROP_PROTOCOL:
    case LWS_CALLBACK_CLOSED_HTTP:
        release_connection(connection);
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, static_cast<enum lws_callback_reasons>(reason), user_data, input, length);
}

} // namespace http
