#include "doctest.h"
#include "../../../client/chat_error.hpp"
#include "../../../client/socket_receiver.hpp"
#include "../../mocks/mock_websocket_transport.hpp"
#include <thread>

using chat_client::ChatError;
using chat_client::ErrorCode;
using chat_client::SocketConnection;
using chat_client::SocketReceiver;

namespace {

struct ReceiverFixture {
    test_utils::MockTransportFactory factory;
    std::shared_ptr<test_utils::MockWebSocketTransport> transport;
    SocketConnection connection;

    ReceiverFixture()
        : transport(factory.add()),
          connection(chat_client::WebSocketConfig::mobile(), factory.factory()) {
        connection.connect("ws://localhost:8000/ws", cancellation::CancellationToken::none());
    }
};

ErrorCode receive_one_error_code(const SocketReceiver& receiver, const SocketConnection& connection,
                                 const cancellation::CancellationToken& cancel) {
    try {
        receiver.receive_one(connection, cancel);
    } catch (const ChatError& e) {
        return e.code();
    }
    FAIL("receive_one did not throw");
    return ErrorCode::RECEIVE_FAILED;
}

} // namespace

TEST_CASE("SocketReceiver - Reassembles Chunked Messages") {
    ReceiverFixture fixture;
    SocketReceiver receiver(4);

    fixture.transport->push_message("{\"type\":\"text_chunk\",\"chunk\":\"hello\"}");
    fixture.transport->push_frame("{\"type\":", false);
    fixture.transport->push_frame("\"complete\"}", true);

    auto stream = receiver.create_receive_stream(fixture.connection, cancellation::CancellationToken::none());
    auto first = stream.next();
    auto second = stream.next();

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == "{\"type\":\"text_chunk\",\"chunk\":\"hello\"}");
    CHECK(*second == "{\"type\":\"complete\"}");
    CHECK(!stream.is_completed());
}

TEST_CASE("SocketReceiver - Close Frame Completes Stream") {
    ReceiverFixture fixture;
    SocketReceiver receiver(8192);

    fixture.transport->push_message("one");
    fixture.transport->push_close();
    fixture.transport->push_message("never seen");

    auto stream = receiver.create_receive_stream(fixture.connection, cancellation::CancellationToken::none());
    CHECK(stream.next() == std::optional<std::string>("one"));
    CHECK(!stream.next().has_value());
    CHECK(stream.is_completed());
    CHECK(!stream.next().has_value());
}

TEST_CASE("SocketReceiver - Partial Message Discarded On Close") {
    ReceiverFixture fixture;
    SocketReceiver receiver(8192);

    fixture.transport->push_frame("half a mess", false);
    fixture.transport->push_close();

    auto stream = receiver.create_receive_stream(fixture.connection, cancellation::CancellationToken::none());
    CHECK(!stream.next().has_value());
    CHECK(stream.is_completed());
}

TEST_CASE("SocketReceiver - Cancellation Completes Stream") {
    ReceiverFixture fixture;
    SocketReceiver receiver(8192);
    cancellation::CancellationSource cancel;

    auto stream = receiver.create_receive_stream(fixture.connection, cancel.token());
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancel.cancel();
    });
    CHECK(!stream.next().has_value());
    canceller.join();
    CHECK(stream.is_completed());
}

TEST_CASE("SocketReceiver - Dispose Completes Stream") {
    ReceiverFixture fixture;
    SocketReceiver receiver(8192);

    auto stream = receiver.create_receive_stream(fixture.connection, cancellation::CancellationToken::none());
    std::thread disposer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        fixture.connection.dispose();
    });
    CHECK(!stream.next().has_value());
    disposer.join();
}

TEST_CASE("SocketReceiver - Transport Error Surfaces As Receive Failed") {
    ReceiverFixture fixture;
    SocketReceiver receiver(8192);
    fixture.transport->push_error("Connection reset by peer");

    auto stream = receiver.create_receive_stream(fixture.connection, cancellation::CancellationToken::none());
    CHECK_THROWS_AS(stream.next(), ChatError);
    CHECK(stream.is_completed());
    CHECK(!stream.next().has_value());
}

TEST_CASE("SocketReceiver - Stream Over Closed Connection Is Empty") {
    test_utils::MockTransportFactory factory;
    SocketConnection connection(chat_client::WebSocketConfig::mobile(), factory.factory());
    SocketReceiver receiver(8192);

    auto stream = receiver.create_receive_stream(connection, cancellation::CancellationToken::none());
    CHECK(stream.is_completed());
    CHECK(!stream.next().has_value());
}

TEST_CASE("SocketReceiver - Receive One Returns Single Message") {
    ReceiverFixture fixture;
    SocketReceiver receiver(3);
    fixture.transport->push_message("{\"type\":\"connection_status\",\"message\":\"ok\"}");
    fixture.transport->push_message("second");

    CHECK(receiver.receive_one(fixture.connection, cancellation::CancellationToken::none()) ==
          "{\"type\":\"connection_status\",\"message\":\"ok\"}");
    CHECK(receiver.receive_one(fixture.connection, cancellation::CancellationToken::none()) == "second");
}

TEST_CASE("SocketReceiver - Receive One Failure Codes") {
    SocketReceiver receiver(8192);

    ReceiverFixture closed;
    closed.transport->push_close();
    CHECK(receive_one_error_code(receiver, closed.connection, cancellation::CancellationToken::none()) ==
          ErrorCode::TRANSPORT_CLOSED_DURING_READ);

    ReceiverFixture failing;
    failing.transport->push_error("boom");
    CHECK(receive_one_error_code(receiver, failing.connection, cancellation::CancellationToken::none()) ==
          ErrorCode::RECEIVE_FAILED);

    ReceiverFixture cancelled;
    cancellation::CancellationSource cancel;
    cancel.cancel_after(std::chrono::milliseconds(20));
    CHECK(receive_one_error_code(receiver, cancelled.connection, cancel.token()) == ErrorCode::OPERATION_CANCELLED);

    test_utils::MockTransportFactory factory;
    SocketConnection never_opened(chat_client::WebSocketConfig::mobile(), factory.factory());
    CHECK(receive_one_error_code(receiver, never_opened, cancellation::CancellationToken::none()) ==
          ErrorCode::TRANSPORT_CLOSED_DURING_READ);
}
