#pragma once
#include "chat_events.hpp"
#include "event_stream.hpp"
#include "../utils/cancellation/cancellation.hpp"
#include <string>

namespace chat_client {

// Chat client interface
class IChatClient {
public:
    virtual ~IChatClient() = default;

    // Returns false on failure; an ErrorOccurred event carries the reason
    virtual bool connect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) = 0;

    // Throws ChatError(SEND_WHILE_DISCONNECTED) unless connected
    virtual void send(const std::string& message,
                      const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) = 0;

    virtual void disconnect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none()) = 0;

    virtual EventStream& events() = 0;
    virtual ConnectionState state() const = 0;
    virtual int reconnect_attempts() const = 0;
};

} // namespace chat_client
