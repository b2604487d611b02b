#include "doctest.h"
#include "../../../client/chat_error.hpp"
#include "../../../client/socket_connection.hpp"
#include "../../mocks/mock_websocket_transport.hpp"
#include <thread>

using chat_client::ChatError;
using chat_client::ErrorCode;
using chat_client::SocketConnection;
using chat_client::WebSocketConfig;

namespace {

WebSocketConfig short_timeout_config(int timeout_ms) {
    WebSocketConfig::Values values;
    values.connect_timeout = std::chrono::milliseconds(timeout_ms);
    values.keep_alive_interval = std::chrono::milliseconds(1234);
    values.pong_timeout = std::chrono::milliseconds(567);
    return WebSocketConfig(values);
}

ErrorCode connect_error_code(SocketConnection& connection, const cancellation::CancellationToken& cancel) {
    try {
        connection.connect("ws://localhost:8000/ws", cancel);
    } catch (const ChatError& e) {
        return e.code();
    }
    FAIL("connect did not throw");
    return ErrorCode::CONNECTION_FAILED;
}

} // namespace

TEST_CASE("SocketConnection - Connect Passes Keep Alive Options") {
    test_utils::MockTransportFactory factory;
    auto transport = factory.add();
    SocketConnection connection(short_timeout_config(1000), factory.factory());

    connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());

    CHECK(connection.is_open());
    CHECK(connection.transport() == transport);
    CHECK(transport->connected_url() == "ws://localhost:8000/ws");
    CHECK(transport->last_options().keep_alive_interval == std::chrono::milliseconds(1234));
    CHECK(transport->last_options().pong_timeout == std::chrono::milliseconds(567));
    CHECK(connection.token().can_be_cancelled());
    CHECK(!connection.token().is_cancellation_requested());
}

TEST_CASE("SocketConnection - Timeout Maps To Connect Timeout") {
    test_utils::MockTransportFactory factory;
    auto transport = factory.add();
    transport->block_connect_until_cancelled();
    SocketConnection connection(short_timeout_config(50), factory.factory());

    CHECK(connect_error_code(connection, cancellation::CancellationToken::none()) == ErrorCode::CONNECT_TIMEOUT);
    CHECK(transport->was_aborted());
    CHECK(!connection.is_open());
    CHECK(connection.transport() == nullptr);
}

TEST_CASE("SocketConnection - Caller Cancellation Maps To Operation Cancelled") {
    test_utils::MockTransportFactory factory;
    auto transport = factory.add();
    transport->block_connect_until_cancelled();
    SocketConnection connection(short_timeout_config(5000), factory.factory());

    cancellation::CancellationSource caller;
    caller.cancel_after(std::chrono::milliseconds(30));

    CHECK(connect_error_code(connection, caller.token()) == ErrorCode::OPERATION_CANCELLED);
    CHECK(connection.transport() == nullptr);
}

TEST_CASE("SocketConnection - Transport Failure Maps To Connection Failed") {
    test_utils::MockTransportFactory factory;
    factory.add()->fail_connect("Connection refused");
    SocketConnection connection(short_timeout_config(1000), factory.factory());

    try {
        connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());
        FAIL("connect should fail");
    } catch (const ChatError& e) {
        CHECK(e.code() == ErrorCode::CONNECTION_FAILED);
        CHECK(std::string(e.what()) == "Connection refused");
    }
    CHECK(!connection.is_open());
}

TEST_CASE("SocketConnection - Reconnect Disposes Previous Transport") {
    test_utils::MockTransportFactory factory;
    auto first = factory.add();
    auto second = factory.add();
    SocketConnection connection(short_timeout_config(1000), factory.factory());

    connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());
    auto first_token = connection.token();
    connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());

    CHECK(first->was_closed());
    CHECK(first->was_aborted());
    CHECK(first_token.is_cancellation_requested());
    CHECK(connection.transport() == second);
    CHECK(second->is_open());
}

TEST_CASE("SocketConnection - Dispose Cancels Lifetime And Closes Normally") {
    test_utils::MockTransportFactory factory;
    auto transport = factory.add();
    SocketConnection connection(short_timeout_config(1000), factory.factory());
    connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());
    auto lifetime = connection.token();

    connection.dispose();

    CHECK(lifetime.is_cancellation_requested());
    CHECK(transport->was_closed());
    CHECK(transport->close_code() == 1000);
    CHECK(!connection.is_open());
    CHECK(!connection.token().can_be_cancelled());

    // Idempotent
    connection.dispose();
    connection.close();
}

TEST_CASE("SocketConnection - Dispose During Connect Cancels It") {
    test_utils::MockTransportFactory factory;
    auto transport = factory.add();
    transport->block_connect_until_cancelled();
    SocketConnection connection(short_timeout_config(5000), factory.factory());

    std::thread disposer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        connection.dispose();
    });
    CHECK(connect_error_code(connection, cancellation::CancellationToken::none()) == ErrorCode::OPERATION_CANCELLED);
    disposer.join();
    CHECK(!connection.is_open());
}
