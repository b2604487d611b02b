#pragma once
#include "i_websocket_transport.hpp"
#include "websocket_frame.hpp"
#include "websocket_handshake.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <uv.h>
#include <openssl/ssl.h>

namespace websocket_transport {

/**
 * libuv implementation of IWebSocketTransport.
 *
 * Each instance owns a private uv loop running on its own thread. Every libuv
 * call happens on that thread; callers hand work over through a uv_async_t
 * command queue and block on a condition variable for the result. wss:// is
 * served by OpenSSL through memory BIOs so the socket stays under libuv.
 */
class LibuvWebSocketTransport : public IWebSocketTransport {
public:
    LibuvWebSocketTransport();
    ~LibuvWebSocketTransport() override;

    LibuvWebSocketTransport(const LibuvWebSocketTransport&) = delete;
    LibuvWebSocketTransport& operator=(const LibuvWebSocketTransport&) = delete;

    void connect(const std::string& url, const ConnectOptions& options,
                 const cancellation::CancellationToken& cancel) override;
    ReceiveResult receive(size_t max_bytes, const cancellation::CancellationToken& cancel) override;
    void send_text(const std::string& text, const cancellation::CancellationToken& cancel) override;
    void close(uint16_t code, const std::string& reason) override;
    void abort() override;

    WebSocketState get_state() const override { return state_.load(); }
    bool is_open() const override { return state_.load() == WebSocketState::CONNECTED; }

private:
    struct InboundFrame {
        std::string payload;
        size_t offset{0};
        bool fin{true};
        bool is_binary{false};
        bool is_close{false};
    };

    struct WriteRequest {
        uv_write_t req;
        LibuvWebSocketTransport* owner{nullptr};
        std::string data;
        std::function<void(int)> on_complete;
    };

    struct PendingWrite {
        bool done{false};
        int status{0};
    };

    // Caller side
    void post(std::function<void()> command);
    void write_frame_and_wait(const std::string& frame, const cancellation::CancellationToken& cancel);
    void teardown();
    void release_tls();

    // Loop thread
    void run_loop();
    void process_commands();
    void start_resolve();
    void start_tcp_connect(const struct sockaddr* address);
    void on_tcp_connected();
    void drive_tls_handshake();
    void on_ciphertext(const char* data, size_t length);
    void on_plaintext(const char* data, size_t length);
    void on_handshake_bytes(const char* data, size_t length);
    void process_frames();
    void handle_frame(WebSocketFrame& frame);
    void send_frame(const std::string& frame, std::function<void(int)> on_complete = nullptr);
    void write_plaintext(const std::string& data, std::function<void(int)> on_complete);
    void write_tcp(std::string data, std::function<void(int)> on_complete);
    void flush_tls_output(std::function<void(int)> on_complete);
    void start_keep_alive();
    void send_keep_alive_ping();
    void note_activity();
    void complete_connect(const std::string& error);
    void fail_connection(const std::string& error);
    void on_remote_close(const std::string& payload);
    void mark_remote_closed();
    void on_stream_end(const std::string& reason);
    void close_tcp();
    void close_all_handles();

    // libuv callbacks
    static void on_async(uv_async_t* handle);
    static void on_resolved(uv_getaddrinfo_t* req, int status, struct addrinfo* res);
    static void on_connect(uv_connect_t* req, int status);
    static void on_alloc(uv_handle_t* handle, size_t suggested_size, uv_buf_t* buf);
    static void on_read(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf);
    static void on_write(uv_write_t* req, int status);
    static void on_keep_alive_timer(uv_timer_t* timer);
    static void on_pong_timer(uv_timer_t* timer);

    // Connection parameters
    WebSocketUrl url_;
    ConnectOptions options_;
    std::string handshake_key_;

    std::atomic<WebSocketState> state_{WebSocketState::DISCONNECTED};

    // libuv objects, touched only on the loop thread after connect() starts it
    uv_loop_t loop_;
    uv_async_t async_;
    uv_getaddrinfo_t resolver_;
    uv_connect_t connect_req_;
    uv_tcp_t tcp_;
    uv_timer_t keep_alive_timer_;
    uv_timer_t pong_timer_;
    bool loop_initialized_{false};
    bool tcp_initialized_{false};
    bool timers_initialized_{false};
    bool handles_closing_{false};
    bool resolving_{false};
    bool tcp_closed_{false};
    std::thread loop_thread_;

    // Command queue
    std::mutex command_mutex_;
    std::vector<std::function<void()>> commands_;
    bool accepting_commands_{false};

    // TLS
    SSL_CTX* ssl_ctx_{nullptr};
    SSL* ssl_{nullptr};
    BIO* rbio_{nullptr};
    BIO* wbio_{nullptr};

    // Protocol state, loop thread only
    std::string handshake_buffer_;
    bool handshake_complete_{false};
    bool close_sent_{false};
    bool message_is_binary_{false};
    FrameDecoder decoder_;
    std::vector<char> read_buffer_;

    // Shared with callers, guarded by mutex_
    std::mutex mutex_;
    std::condition_variable cv_;
    bool connect_done_{false};
    std::string connect_error_;
    std::deque<InboundFrame> inbox_;
    bool remote_closed_{false};
    bool failed_{false};
    std::string failure_;

    std::mutex teardown_mutex_;
};

} // namespace websocket_transport
