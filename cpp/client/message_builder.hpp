#pragma once
#include "chat_request_message.hpp"
#include "chat_settings.hpp"

namespace chat_client {

class MessageBuilder {
public:
    // Snapshot of the whole agent configuration plus the user's text
    static ChatRequestMessage create_request(const ChatSettings& settings, const std::string& text);
};

} // namespace chat_client
