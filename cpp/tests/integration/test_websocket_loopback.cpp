#include "doctest.h"
#include "../../client/websocket_chat_client.hpp"
#include "../../websocket/libuv_websocket_transport.hpp"
#include "../../websocket/websocket_frame.hpp"
#include "../../websocket/websocket_handshake.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace {

// Server side of one accepted WebSocket connection, frames sent unmasked
class LoopbackPeer {
public:
    explicit LoopbackPeer(int fd) : fd_(fd) {}

    bool handshake() {
        std::string head;
        while (head.find("\r\n\r\n") == std::string::npos) {
            if (!read_some(head)) {
                return false;
            }
        }
        const std::string marker = "Sec-WebSocket-Key: ";
        size_t start = head.find(marker);
        if (start == std::string::npos) {
            return false;
        }
        start += marker.size();
        std::string key = head.substr(start, head.find("\r\n", start) - start);
        request_line_ = head.substr(0, head.find("\r\n"));

        return write_all("HTTP/1.1 101 Switching Protocols\r\n"
                         "Upgrade: websocket\r\n"
                         "Connection: Upgrade\r\n"
                         "Sec-WebSocket-Accept: " + websocket_transport::compute_accept_key(key) + "\r\n\r\n");
    }

    bool send_frame(uint8_t first_byte, const std::string& payload) {
        std::string frame;
        frame.push_back(static_cast<char>(first_byte));
        frame.push_back(static_cast<char>(payload.size()));
        frame += payload;
        return write_all(frame);
    }

    bool send_text(const std::string& payload) { return send_frame(0x81, payload); }

    bool send_close(uint16_t code) {
        return send_frame(0x88, websocket_transport::encode_close_payload(code, ""));
    }

    // Next data or close frame from the client; pings are skipped
    bool read_frame(websocket_transport::WebSocketFrame& frame) {
        for (;;) {
            if (decoder_.next(frame)) {
                if (frame.opcode == websocket_transport::WebSocketFrame::OPCODE_PING ||
                    frame.opcode == websocket_transport::WebSocketFrame::OPCODE_PONG) {
                    continue;
                }
                return true;
            }
            std::string chunk;
            if (!read_some(chunk)) {
                return false;
            }
            decoder_.feed(chunk);
        }
    }

    const std::string& request_line() const { return request_line_; }

private:
    bool read_some(std::string& out) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 3000) <= 0) {
            return false;
        }
        char buffer[4096];
        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return false;
        }
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }

    bool write_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    int fd_;
    websocket_transport::FrameDecoder decoder_;
    std::string request_line_;
};

// Accepts one connection on 127.0.0.1 and runs the script against it
class LoopbackServer {
public:
    explicit LoopbackServer(std::function<void(LoopbackPeer&)> script) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address));
        ::listen(listen_fd_, 1);

        socklen_t length = sizeof(address);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&address), &length);
        port_ = ntohs(address.sin_port);

        thread_ = std::thread([this, script]() {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 5000) <= 0) {
                return;
            }
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            LoopbackPeer peer(fd);
            if (peer.handshake()) {
                script(peer);
                completed_.store(true);
            }
            ::close(fd);
        });
    }

    ~LoopbackServer() {
        join();
        ::close(listen_fd_);
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "ws://127.0.0.1:" + std::to_string(port_) + path;
    }

    bool completed() const { return completed_.load(); }

private:
    int listen_fd_{-1};
    uint16_t port_{0};
    std::thread thread_;
    std::atomic<bool> completed_{false};
};

std::string receive_whole_message(websocket_transport::IWebSocketTransport& transport) {
    std::string message;
    for (;;) {
        auto result = transport.receive(0, cancellation::CancellationToken::none());
        if (result.is_close) {
            return message;
        }
        message += result.data;
        if (result.end_of_message) {
            return message;
        }
    }
}

} // namespace

TEST_CASE("LibuvWebSocketTransport - Loopback Exchange") {
    std::mutex mutex;
    std::string received_by_server;

    LoopbackServer server([&](LoopbackPeer& peer) {
        peer.send_text("{\"type\":\"connection_status\",\"message\":\"ready\"}");

        websocket_transport::WebSocketFrame frame;
        if (!peer.read_frame(frame)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            received_by_server = frame.payload;
        }

        peer.send_frame(0x01, "Hel");
        peer.send_frame(0x80, "lo");
        peer.send_close(1000);
        peer.read_frame(frame);
    });

    websocket_transport::LibuvWebSocketTransport transport;
    websocket_transport::ConnectOptions options;
    options.keep_alive_interval = std::chrono::milliseconds(0);

    transport.connect(server.url("/api/v1/ws/chat"), options, cancellation::CancellationToken::none());
    CHECK(transport.is_open());

    CHECK(receive_whole_message(transport) == "{\"type\":\"connection_status\",\"message\":\"ready\"}");
    transport.send_text("{\"type\":\"chat_request\"}", cancellation::CancellationToken::none());
    CHECK(receive_whole_message(transport) == "Hello");

    auto close = transport.receive(0, cancellation::CancellationToken::none());
    CHECK(close.is_close);

    server.join();
    CHECK(server.completed());
    std::lock_guard<std::mutex> lock(mutex);
    CHECK(received_by_server == "{\"type\":\"chat_request\"}");
}

TEST_CASE("LibuvWebSocketTransport - Connection Refused") {
    websocket_transport::LibuvWebSocketTransport transport;
    CHECK_THROWS_AS(transport.connect("ws://127.0.0.1:1/ws", websocket_transport::ConnectOptions(),
                                      cancellation::CancellationToken::none()),
                    websocket_transport::TransportError);
    CHECK(!transport.is_open());
}

TEST_CASE("LibuvWebSocketTransport - Rejects Non WebSocket Url") {
    websocket_transport::LibuvWebSocketTransport transport;
    CHECK_THROWS_AS(transport.connect("http://127.0.0.1/ws", websocket_transport::ConnectOptions(),
                                      cancellation::CancellationToken::none()),
                    websocket_transport::TransportError);
}

TEST_CASE("WebSocketChatClient - Loopback Conversation") {
    std::mutex mutex;
    std::string request;

    LoopbackServer server([&](LoopbackPeer& peer) {
        peer.send_text("{\"type\":\"connection_status\",\"message\":\"ready\"}");

        websocket_transport::WebSocketFrame frame;
        if (!peer.read_frame(frame)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            request = frame.payload;
        }
        peer.send_text("{\"type\":\"text_chunk\",\"chunk\":\"Hi \"}");
        peer.send_text("{\"type\":\"text_chunk\",\"chunk\":\"u1\"}");
        peer.send_text("{\"type\":\"complete\"}");
        peer.read_frame(frame);
    });

    auto settings = chat_client::ChatSettings::defaults();
    settings.server_uri = server.url("/api/v1/ws/chat");
    settings.user_id = "u1";

    chat_client::WebSocketConfig::Values values;
    values.connect_timeout = std::chrono::milliseconds(2000);
    values.max_reconnect_attempts = 0;
    values.infinite_reconnect = false;

    std::mutex event_mutex;
    std::condition_variable event_cv;
    std::string reply;
    bool completed = false;

    chat_client::WebSocketChatClient client(settings, chat_client::WebSocketConfig(values));
    client.events().subscribe([&](const chat_client::ChatEvent& event) {
        std::lock_guard<std::mutex> lock(event_mutex);
        if (event.type == chat_client::ChatEventType::TEXT_CHUNK_RECEIVED) {
            reply += event.text;
        } else if (event.type == chat_client::ChatEventType::RESPONSE_COMPLETED) {
            completed = true;
            event_cv.notify_all();
        }
    });

    REQUIRE(client.connect());
    client.send("Hello");

    {
        std::unique_lock<std::mutex> lock(event_mutex);
        CHECK(event_cv.wait_for(lock, std::chrono::seconds(3), [&] { return completed; }));
        CHECK(reply == "Hi u1");
    }

    client.disconnect();
    server.join();

    std::lock_guard<std::mutex> lock(mutex);
    CHECK(request.find("\"type\":\"chat_request\"") != std::string::npos);
    CHECK(request.find("\"message\":\"Hello\"") != std::string::npos);
}
