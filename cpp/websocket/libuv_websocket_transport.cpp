#include "libuv_websocket_transport.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include <cstring>
#include <netdb.h>
#include <openssl/err.h>

namespace websocket_transport {

namespace {

std::string uv_error(int code) {
    return std::string(uv_strerror(code));
}

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown TLS error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}

} // namespace

LibuvWebSocketTransport::LibuvWebSocketTransport()
    : read_buffer_(65536) {}

LibuvWebSocketTransport::~LibuvWebSocketTransport() {
    abort();
}

// ---------------------------------------------------------------------------
// Caller side
// ---------------------------------------------------------------------------

void LibuvWebSocketTransport::connect(const std::string& url, const ConnectOptions& options,
                                      const cancellation::CancellationToken& cancel) {
    cancel.throw_if_cancellation_requested();

    WebSocketState expected = WebSocketState::DISCONNECTED;
    if (!state_.compare_exchange_strong(expected, WebSocketState::CONNECTING)) {
        throw TransportError("WebSocket transport instances are single use");
    }

    auto parsed = parse_url(url);
    if (!parsed) {
        state_.store(WebSocketState::ERROR);
        throw TransportError("Invalid WebSocket URL: " + url);
    }
    url_ = *parsed;
    options_ = options;
    handshake_key_ = generate_websocket_key();

    if (url_.secure) {
        ssl_ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ssl_ctx_) {
            state_.store(WebSocketState::ERROR);
            throw TransportError("Failed to create TLS context: " + ssl_error_string());
        }
        SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);
        if (options_.verify_tls) {
            SSL_CTX_set_default_verify_paths(ssl_ctx_);
            SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        }

        ssl_ = SSL_new(ssl_ctx_);
        rbio_ = BIO_new(BIO_s_mem());
        wbio_ = BIO_new(BIO_s_mem());
        if (!ssl_ || !rbio_ || !wbio_) {
            if (!ssl_) {
                if (rbio_) BIO_free(rbio_);
                if (wbio_) BIO_free(wbio_);
                rbio_ = wbio_ = nullptr;
            }
            release_tls();
            state_.store(WebSocketState::ERROR);
            throw TransportError("Failed to create TLS session");
        }
        SSL_set_bio(ssl_, rbio_, wbio_);
        SSL_set_connect_state(ssl_);
        SSL_set_tlsext_host_name(ssl_, url_.host.c_str());
        if (options_.verify_tls) {
            SSL_set1_host(ssl_, url_.host.c_str());
        }
    }

    int err = uv_loop_init(&loop_);
    if (err != 0) {
        release_tls();
        state_.store(WebSocketState::ERROR);
        throw TransportError("Failed to create event loop: " + uv_error(err));
    }
    loop_.data = this;
    uv_async_init(&loop_, &async_, on_async);
    async_.data = this;
    uv_timer_init(&loop_, &keep_alive_timer_);
    keep_alive_timer_.data = this;
    uv_timer_init(&loop_, &pong_timer_);
    pong_timer_.data = this;
    timers_initialized_ = true;
    loop_initialized_ = true;

    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        accepting_commands_ = true;
    }
    loop_thread_ = std::thread(&LibuvWebSocketTransport::run_loop, this);

    LOG_DEBUG_COMP("WS_TRANSPORT", "Connecting to " + url_.host + ":" + std::to_string(url_.port) + url_.resource);
    post([this]() { start_resolve(); });

    bool done = false;
    std::string error;
    {
        auto registration = cancel.register_callback([this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return connect_done_ || cancel.is_cancellation_requested(); });
        done = connect_done_;
        error = connect_error_;
    }

    if (cancel.is_cancellation_requested()) {
        abort();
        throw cancellation::OperationCancelledError("WebSocket connect cancelled");
    }
    if (!done || !error.empty()) {
        abort();
        state_.store(WebSocketState::ERROR);
        throw TransportError(error.empty() ? "WebSocket connect failed" : error);
    }

    LOG_DEBUG_COMP("WS_TRANSPORT", "Connected to " + url);
}

ReceiveResult LibuvWebSocketTransport::receive(size_t max_bytes, const cancellation::CancellationToken& cancel) {
    WebSocketState state = state_.load();
    if (state == WebSocketState::DISCONNECTED || state == WebSocketState::CONNECTING) {
        throw TransportError("Cannot receive: WebSocket is not connected");
    }

    auto registration = cancel.register_callback([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() {
        return !inbox_.empty() || failed_ || remote_closed_ || cancel.is_cancellation_requested();
    });

    if (cancel.is_cancellation_requested()) {
        throw cancellation::OperationCancelledError("WebSocket receive cancelled");
    }

    ReceiveResult result;
    if (!inbox_.empty()) {
        InboundFrame& front = inbox_.front();
        if (front.is_close) {
            inbox_.pop_front();
            result.is_close = true;
            return result;
        }

        size_t remaining = front.payload.size() - front.offset;
        size_t take = (max_bytes == 0 || remaining <= max_bytes) ? remaining : max_bytes;
        result.data = front.payload.substr(front.offset, take);
        result.is_binary = front.is_binary;
        front.offset += take;

        if (front.offset >= front.payload.size()) {
            result.end_of_message = front.fin;
            inbox_.pop_front();
        } else {
            result.end_of_message = false;
        }
        return result;
    }

    if (remote_closed_) {
        result.is_close = true;
        return result;
    }

    throw TransportError(failure_.empty() ? "WebSocket connection failed" : failure_);
}

void LibuvWebSocketTransport::send_text(const std::string& text, const cancellation::CancellationToken& cancel) {
    cancel.throw_if_cancellation_requested();
    if (!is_open()) {
        throw TransportError("Cannot send: WebSocket is not open");
    }
    write_frame_and_wait(encode_frame(WebSocketFrame::OPCODE_TEXT, text), cancel);
}

void LibuvWebSocketTransport::write_frame_and_wait(const std::string& frame,
                                                   const cancellation::CancellationToken& cancel) {
    auto pending = std::make_shared<PendingWrite>();
    post([this, frame, pending]() {
        send_frame(frame, [this, pending](int status) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending->done = true;
                pending->status = status;
            }
            cv_.notify_all();
        });
    });

    auto registration = cancel.register_callback([this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() { return pending->done || cancel.is_cancellation_requested(); });

    if (!pending->done) {
        throw cancellation::OperationCancelledError("WebSocket send cancelled");
    }
    if (pending->status < 0) {
        throw TransportError("WebSocket write failed: " + uv_error(pending->status));
    }
}

void LibuvWebSocketTransport::close(uint16_t code, const std::string& reason) {
    WebSocketState expected = WebSocketState::CONNECTED;
    if (!state_.compare_exchange_strong(expected, WebSocketState::CLOSING)) {
        abort();
        return;
    }

    try {
        std::string frame = encode_frame(WebSocketFrame::OPCODE_CLOSE, encode_close_payload(code, reason));
        post([this, frame]() {
            if (!close_sent_ && !tcp_closed_) {
                close_sent_ = true;
                send_frame(frame);
            }
        });

        std::unique_lock<std::mutex> lock(mutex_);
        bool acknowledged = cv_.wait_for(lock, std::chrono::milliseconds(constants::timeout::CLOSE_HANDSHAKE_MS),
                                         [this]() { return remote_closed_ || failed_; });
        if (!acknowledged) {
            LOG_DEBUG_COMP("WS_TRANSPORT", "Close handshake not acknowledged, dropping connection");
        }
    } catch (const std::exception& e) {
        LOG_DEBUG_COMP("WS_TRANSPORT", std::string("Close handshake failed: ") + e.what());
    }

    abort();
}

void LibuvWebSocketTransport::abort() {
    teardown();
}

void LibuvWebSocketTransport::post(std::function<void()> command) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (!accepting_commands_) {
        throw TransportError("WebSocket transport is closed");
    }
    commands_.push_back(std::move(command));
    // Sent under the lock so teardown cannot close the handle in between
    uv_async_send(&async_);
}

void LibuvWebSocketTransport::teardown() {
    std::lock_guard<std::mutex> guard(teardown_mutex_);

    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        if (accepting_commands_) {
            accepting_commands_ = false;
            commands_.push_back([this]() { close_all_handles(); });
            uv_async_send(&async_);
        }
    }

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    if (loop_initialized_) {
        if (uv_loop_close(&loop_) == UV_EBUSY) {
            // Let remaining close callbacks run
            uv_run(&loop_, UV_RUN_DEFAULT);
            uv_loop_close(&loop_);
        }
        loop_initialized_ = false;
    }

    release_tls();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connect_done_) {
            connect_done_ = true;
            connect_error_ = "WebSocket transport aborted";
        }
        if (!remote_closed_ && !failed_) {
            failed_ = true;
            failure_ = "WebSocket transport aborted";
        }
    }
    cv_.notify_all();

    WebSocketState state = state_.load();
    if (state != WebSocketState::ERROR && state != WebSocketState::DISCONNECTED) {
        state_.store(WebSocketState::CLOSED);
    }
}

void LibuvWebSocketTransport::release_tls() {
    if (ssl_) {
        SSL_free(ssl_);   // owns both BIOs
        ssl_ = nullptr;
        rbio_ = nullptr;
        wbio_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// Loop thread
// ---------------------------------------------------------------------------

void LibuvWebSocketTransport::run_loop() {
    uv_run(&loop_, UV_RUN_DEFAULT);
    LOG_DEBUG_COMP("WS_TRANSPORT", "Event loop finished");
}

void LibuvWebSocketTransport::on_async(uv_async_t* handle) {
    static_cast<LibuvWebSocketTransport*>(handle->data)->process_commands();
}

void LibuvWebSocketTransport::process_commands() {
    std::vector<std::function<void()>> commands;
    {
        std::lock_guard<std::mutex> lock(command_mutex_);
        commands.swap(commands_);
    }

    for (auto& command : commands) {
        try {
            command();
        } catch (const std::exception& e) {
            fail_connection(std::string("Transport command failed: ") + e.what());
        }
    }
}

void LibuvWebSocketTransport::start_resolve() {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    resolver_.data = this;
    int err = uv_getaddrinfo(&loop_, &resolver_, on_resolved, url_.host.c_str(),
                             std::to_string(url_.port).c_str(), &hints);
    if (err != 0) {
        fail_connection("DNS lookup for " + url_.host + " failed: " + uv_error(err));
        return;
    }
    resolving_ = true;
}

void LibuvWebSocketTransport::on_resolved(uv_getaddrinfo_t* req, int status, struct addrinfo* res) {
    auto* self = static_cast<LibuvWebSocketTransport*>(req->data);
    self->resolving_ = false;

    if (status < 0 || !res) {
        uv_freeaddrinfo(res);
        if (!self->handles_closing_) {
            self->fail_connection("DNS lookup for " + self->url_.host + " failed: " + uv_error(status));
        }
        return;
    }

    if (!self->handles_closing_) {
        self->start_tcp_connect(res->ai_addr);
    }
    uv_freeaddrinfo(res);
}

void LibuvWebSocketTransport::start_tcp_connect(const struct sockaddr* address) {
    int err = uv_tcp_init(&loop_, &tcp_);
    if (err != 0) {
        fail_connection("Failed to create TCP handle: " + uv_error(err));
        return;
    }
    tcp_.data = this;
    tcp_initialized_ = true;

    connect_req_.data = this;
    err = uv_tcp_connect(&connect_req_, &tcp_, address, on_connect);
    if (err != 0) {
        fail_connection("TCP connect failed: " + uv_error(err));
    }
}

void LibuvWebSocketTransport::on_connect(uv_connect_t* req, int status) {
    auto* self = static_cast<LibuvWebSocketTransport*>(req->data);
    if (self->handles_closing_ || self->tcp_closed_) {
        return;
    }
    if (status < 0) {
        self->fail_connection("TCP connect to " + self->url_.host + " failed: " + uv_error(status));
        return;
    }
    self->on_tcp_connected();
}

void LibuvWebSocketTransport::on_tcp_connected() {
    uv_tcp_nodelay(&tcp_, 1);

    int err = uv_read_start(reinterpret_cast<uv_stream_t*>(&tcp_), on_alloc, on_read);
    if (err != 0) {
        fail_connection("Failed to start reading: " + uv_error(err));
        return;
    }

    if (ssl_) {
        drive_tls_handshake();
    } else {
        write_plaintext(build_handshake_request(url_, handshake_key_, options_.headers), nullptr);
    }
}

void LibuvWebSocketTransport::drive_tls_handshake() {
    int result = SSL_do_handshake(ssl_);
    flush_tls_output(nullptr);

    if (result == 1) {
        LOG_DEBUG_COMP("WS_TRANSPORT", "TLS session established with " + url_.host);
        write_plaintext(build_handshake_request(url_, handshake_key_, options_.headers), nullptr);
        return;
    }

    int error = SSL_get_error(ssl_, result);
    if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
        return;
    }
    fail_connection("TLS handshake failed: " + ssl_error_string());
}

void LibuvWebSocketTransport::on_alloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf) {
    (void)suggested_size;
    auto* self = static_cast<LibuvWebSocketTransport*>(handle->data);
    buf->base = self->read_buffer_.data();
    buf->len = self->read_buffer_.size();
}

void LibuvWebSocketTransport::on_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* self = static_cast<LibuvWebSocketTransport*>(stream->data);
    if (self->handles_closing_ || self->tcp_closed_) {
        return;
    }

    if (nread < 0) {
        self->on_stream_end(nread == UV_EOF ? "Connection closed by peer" : "Read failed: " + uv_error(static_cast<int>(nread)));
        return;
    }

    if (nread == 0) {
        return;
    }

    if (self->ssl_) {
        self->on_ciphertext(buf->base, static_cast<size_t>(nread));
    } else {
        self->on_plaintext(buf->base, static_cast<size_t>(nread));
    }
}

void LibuvWebSocketTransport::on_stream_end(const std::string& reason) {
    if (close_sent_) {
        // Peer dropped the socket after our close frame; treat as closed
        mark_remote_closed();
        close_tcp();
        return;
    }
    fail_connection(reason);
}

void LibuvWebSocketTransport::on_ciphertext(const char* data, size_t length) {
    BIO_write(rbio_, data, static_cast<int>(length));

    if (!SSL_is_init_finished(ssl_)) {
        drive_tls_handshake();
        if (!ssl_ || !SSL_is_init_finished(ssl_) || tcp_closed_) {
            return;
        }
    }

    char plaintext[16384];
    while (!tcp_closed_) {
        int n = SSL_read(ssl_, plaintext, sizeof(plaintext));
        if (n > 0) {
            on_plaintext(plaintext, static_cast<size_t>(n));
            continue;
        }

        int error = SSL_get_error(ssl_, n);
        if (error == SSL_ERROR_WANT_READ) {
            break;
        }
        if (error == SSL_ERROR_ZERO_RETURN) {
            on_stream_end("TLS session closed by peer");
            return;
        }
        fail_connection("TLS read failed: " + ssl_error_string());
        return;
    }

    if (!tcp_closed_) {
        flush_tls_output(nullptr);
    }
}

void LibuvWebSocketTransport::on_plaintext(const char* data, size_t length) {
    if (!handshake_complete_) {
        on_handshake_bytes(data, length);
        return;
    }
    decoder_.feed(data, length);
    process_frames();
}

void LibuvWebSocketTransport::on_handshake_bytes(const char* data, size_t length) {
    handshake_buffer_.append(data, length);

    size_t end = handshake_buffer_.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (handshake_buffer_.size() > constants::websocket::MAX_HANDSHAKE_BYTES) {
            fail_connection("WebSocket handshake response too large");
        }
        return;
    }

    std::string head = handshake_buffer_.substr(0, end);
    std::string rest = handshake_buffer_.substr(end + 4);
    handshake_buffer_.clear();

    auto response = parse_handshake_response(head);
    if (!response) {
        fail_connection("Malformed WebSocket handshake response");
        return;
    }

    try {
        validate_handshake_response(*response, handshake_key_);
    } catch (const TransportError& e) {
        fail_connection(e.what());
        return;
    }

    handshake_complete_ = true;
    start_keep_alive();
    complete_connect("");

    if (!rest.empty()) {
        decoder_.feed(rest);
        process_frames();
    }
}

void LibuvWebSocketTransport::process_frames() {
    try {
        WebSocketFrame frame;
        while (!tcp_closed_ && decoder_.next(frame)) {
            handle_frame(frame);
        }
    } catch (const TransportError& e) {
        LOG_WARN_COMP("WS_TRANSPORT", std::string("Protocol error: ") + e.what());
        if (!close_sent_) {
            close_sent_ = true;
            send_frame(encode_frame(WebSocketFrame::OPCODE_CLOSE,
                                    encode_close_payload(constants::websocket::CLOSE_PROTOCOL_ERROR, "protocol error")));
        }
        fail_connection(std::string("Protocol error: ") + e.what());
    }
}

void LibuvWebSocketTransport::handle_frame(WebSocketFrame& frame) {
    note_activity();

    switch (frame.opcode) {
        case WebSocketFrame::OPCODE_TEXT:
        case WebSocketFrame::OPCODE_BINARY:
            message_is_binary_ = (frame.opcode == WebSocketFrame::OPCODE_BINARY);
            [[fallthrough]];
        case WebSocketFrame::OPCODE_CONTINUATION: {
            InboundFrame item;
            item.payload = std::move(frame.payload);
            item.fin = frame.fin;
            item.is_binary = message_is_binary_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inbox_.push_back(std::move(item));
            }
            cv_.notify_all();
            break;
        }
        case WebSocketFrame::OPCODE_PING:
            if (!close_sent_) {
                send_frame(encode_frame(WebSocketFrame::OPCODE_PONG, frame.payload));
            }
            break;
        case WebSocketFrame::OPCODE_PONG:
            break;
        case WebSocketFrame::OPCODE_CLOSE:
            on_remote_close(frame.payload);
            break;
        default:
            break;
    }
}

void LibuvWebSocketTransport::on_remote_close(const std::string& payload) {
    auto [code, reason] = decode_close_payload(payload);
    LOG_DEBUG_COMP("WS_TRANSPORT", "Close frame received: " + std::to_string(code) +
                   (reason.empty() ? "" : " " + reason));

    if (!close_sent_) {
        close_sent_ = true;
        // Echo the status code; 1005 is never put on the wire
        std::string echo = payload.size() >= 2 ? encode_close_payload(code, "") : std::string();
        send_frame(encode_frame(WebSocketFrame::OPCODE_CLOSE, echo), [this](int) { close_tcp(); });
    } else {
        close_tcp();
    }

    mark_remote_closed();
}

void LibuvWebSocketTransport::mark_remote_closed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!remote_closed_) {
            remote_closed_ = true;
            InboundFrame item;
            item.is_close = true;
            inbox_.push_back(std::move(item));
        }
    }
    cv_.notify_all();

    WebSocketState state = state_.load();
    if (state != WebSocketState::ERROR) {
        state_.store(WebSocketState::CLOSED);
    }
}

void LibuvWebSocketTransport::send_frame(const std::string& frame, std::function<void(int)> on_complete) {
    write_plaintext(frame, std::move(on_complete));
}

void LibuvWebSocketTransport::write_plaintext(const std::string& data, std::function<void(int)> on_complete) {
    if (!ssl_) {
        write_tcp(data, std::move(on_complete));
        return;
    }

    int written = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
    if (written <= 0) {
        if (on_complete) {
            on_complete(UV_EIO);
        }
        fail_connection("TLS write failed: " + ssl_error_string());
        return;
    }
    flush_tls_output(std::move(on_complete));
}

void LibuvWebSocketTransport::flush_tls_output(std::function<void(int)> on_complete) {
    std::string pending;
    char chunk[16384];
    int n;
    while ((n = BIO_read(wbio_, chunk, sizeof(chunk))) > 0) {
        pending.append(chunk, static_cast<size_t>(n));
    }

    if (pending.empty()) {
        if (on_complete) {
            on_complete(0);
        }
        return;
    }
    write_tcp(std::move(pending), std::move(on_complete));
}

void LibuvWebSocketTransport::write_tcp(std::string data, std::function<void(int)> on_complete) {
    if (!tcp_initialized_ || tcp_closed_) {
        if (on_complete) {
            on_complete(UV_ENOTCONN);
        }
        return;
    }

    auto* request = new WriteRequest();
    request->owner = this;
    request->data = std::move(data);
    request->on_complete = std::move(on_complete);
    request->req.data = request;

    uv_buf_t buf = uv_buf_init(&request->data[0], static_cast<unsigned int>(request->data.size()));
    int err = uv_write(&request->req, reinterpret_cast<uv_stream_t*>(&tcp_), &buf, 1, on_write);
    if (err != 0) {
        auto callback = std::move(request->on_complete);
        delete request;
        if (callback) {
            callback(err);
        }
        fail_connection("WebSocket write failed: " + uv_error(err));
    }
}

void LibuvWebSocketTransport::on_write(uv_write_t* req, int status) {
    auto* request = static_cast<WriteRequest*>(req->data);
    LibuvWebSocketTransport* self = request->owner;
    auto callback = std::move(request->on_complete);
    delete request;

    if (callback) {
        callback(status);
    }
    if (status < 0 && status != UV_ECANCELED && !self->handles_closing_) {
        self->fail_connection("WebSocket write failed: " + uv_error(status));
    }
}

void LibuvWebSocketTransport::start_keep_alive() {
    auto interval = static_cast<uint64_t>(options_.keep_alive_interval.count());
    if (interval == 0) {
        return;
    }
    uv_timer_start(&keep_alive_timer_, on_keep_alive_timer, interval, interval);
}

void LibuvWebSocketTransport::on_keep_alive_timer(uv_timer_t* timer) {
    static_cast<LibuvWebSocketTransport*>(timer->data)->send_keep_alive_ping();
}

void LibuvWebSocketTransport::send_keep_alive_ping() {
    if (close_sent_ || tcp_closed_) {
        return;
    }

    try {
        send_frame(encode_frame(WebSocketFrame::OPCODE_PING, ""));
    } catch (const TransportError& e) {
        fail_connection(e.what());
        return;
    }

    auto timeout = static_cast<uint64_t>(options_.pong_timeout.count());
    if (timeout > 0 && !uv_is_active(reinterpret_cast<uv_handle_t*>(&pong_timer_))) {
        uv_timer_start(&pong_timer_, on_pong_timer, timeout, 0);
    }
}

void LibuvWebSocketTransport::on_pong_timer(uv_timer_t* timer) {
    auto* self = static_cast<LibuvWebSocketTransport*>(timer->data);
    self->fail_connection("Keep-alive timed out after " + std::to_string(self->options_.pong_timeout.count()) +
                          "ms without a pong");
}

void LibuvWebSocketTransport::note_activity() {
    // Any inbound frame proves the peer is alive
    uv_timer_stop(&pong_timer_);
}

void LibuvWebSocketTransport::complete_connect(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connect_done_) {
            return;
        }
        connect_done_ = true;
        connect_error_ = error;
        if (error.empty()) {
            WebSocketState expected = WebSocketState::CONNECTING;
            state_.compare_exchange_strong(expected, WebSocketState::CONNECTED);
        }
    }
    cv_.notify_all();
}

void LibuvWebSocketTransport::fail_connection(const std::string& error) {
    bool during_connect = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connect_done_) {
            during_connect = true;
            connect_done_ = true;
            connect_error_ = error;
        } else if (!failed_ && !remote_closed_) {
            failed_ = true;
            failure_ = error;
        }
    }
    cv_.notify_all();

    if (state_.load() != WebSocketState::CLOSED) {
        state_.store(WebSocketState::ERROR);
    }

    if (during_connect) {
        LOG_DEBUG_COMP("WS_TRANSPORT", "Connect failed: " + error);
    } else {
        LOG_WARN_COMP("WS_TRANSPORT", error);
    }
    close_tcp();
}

void LibuvWebSocketTransport::close_tcp() {
    if (timers_initialized_) {
        uv_timer_stop(&keep_alive_timer_);
        uv_timer_stop(&pong_timer_);
    }
    if (tcp_initialized_ && !tcp_closed_) {
        tcp_closed_ = true;
        uv_close(reinterpret_cast<uv_handle_t*>(&tcp_), nullptr);
    }
}

void LibuvWebSocketTransport::close_all_handles() {
    handles_closing_ = true;

    if (resolving_) {
        uv_cancel(reinterpret_cast<uv_req_t*>(&resolver_));
    }

    close_tcp();

    if (timers_initialized_) {
        uv_close(reinterpret_cast<uv_handle_t*>(&keep_alive_timer_), nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&pong_timer_), nullptr);
    }
    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
}

} // namespace websocket_transport
