#include "chat_session.hpp"
#include "chat_error.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"

namespace chat_client {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

const char* to_string(MessageRole role) {
    switch (role) {
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::SYSTEM: return "system";
        default: return "unknown";
    }
}

ChatSession::ChatSession(std::shared_ptr<IChatClient> client, std::shared_ptr<audio::IAudioPlayer> audio_player)
    : client_(std::move(client)), audio_(std::move(audio_player)) {
    subscription_ = client_->events().subscribe([this](const ChatEvent& event) { handle_event(event); });
}

ChatSession::~ChatSession() {
    client_->events().unsubscribe(subscription_);
    if (audio_) {
        audio_->stop();
    }
}

bool ChatSession::connect(const cancellation::CancellationToken& cancel) {
    LOG_INFO_COMP("CHAT_SESSION", "Connecting to server...");
    return client_->connect(cancel);
}

void ChatSession::disconnect(const cancellation::CancellationToken& cancel) {
    LOG_INFO_COMP("CHAT_SESSION", "Disconnecting...");
    client_->disconnect(cancel);
}

bool ChatSession::send_message(const std::string& text, const cancellation::CancellationToken& cancel) {
    std::string message = trim(text);
    if (message.empty()) {
        return false;
    }

    // New turn interrupts any audio still playing from the last one
    if (audio_) {
        audio_->reset();
    }

    ChatMessage user;
    ChatMessage assistant;
    std::optional<ChatMessage> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned = finish_current_locked("");
        user = add_message_locked(MessageRole::USER, message);
        assistant = add_message_locked(MessageRole::ASSISTANT, "", true);
        current_index_ = messages_.size() - 1;
        processing_ = true;
    }
    notify_updated(abandoned);
    notify_added(user);
    notify_added(assistant);

    try {
        client_->send(message, cancel);
    } catch (const ChatError& e) {
        LOG_ERROR_COMP("CHAT_SESSION", "Send failed: " + std::string(e.what()));
        handle_error(e.what());
        return false;
    }
    return true;
}

std::vector<ChatMessage> ChatSession::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::optional<ChatMessage> ChatSession::current_response() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_index_) {
        return std::nullopt;
    }
    return messages_[*current_index_];
}

bool ChatSession::is_processing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processing_;
}

ConnectionState ChatSession::connection_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_state_;
}

void ChatSession::set_message_added_callback(ChatMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_added_ = std::move(callback);
}

void ChatSession::set_message_updated_callback(ChatMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_updated_ = std::move(callback);
}

void ChatSession::handle_event(const ChatEvent& event) {
    switch (event.type) {
        case ChatEventType::CONNECTION_STATE_CHANGED: {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_state_ = event.state;
            break;
        }
        case ChatEventType::TEXT_CHUNK_RECEIVED:
            handle_text_chunk(event.text);
            break;
        case ChatEventType::AUDIO_CHUNK_RECEIVED:
            handle_audio_chunk(event.audio);
            break;
        case ChatEventType::RESPONSE_COMPLETED:
            handle_complete();
            break;
        case ChatEventType::RESPONSE_INTERRUPTED:
            handle_interrupted();
            break;
        case ChatEventType::ERROR_OCCURRED:
            handle_error(event.message);
            break;
        case ChatEventType::STATUS_MESSAGE_RECEIVED: {
            LOG_INFO_COMP("CHAT_SESSION", "Status: " + event.message);
            ChatMessage added;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                added = add_message_locked(MessageRole::SYSTEM, event.message);
            }
            notify_added(added);
            break;
        }
    }
}

void ChatSession::handle_text_chunk(const std::string& chunk) {
    std::optional<ChatMessage> updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        updated = update_current_locked([&chunk](ChatMessage& message) { message.content += chunk; });
    }
    notify_updated(updated);
}

void ChatSession::handle_audio_chunk(const std::vector<uint8_t>& audio) {
    std::optional<ChatMessage> updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_index_) {
            return;
        }
        if (!messages_[*current_index_].has_audio) {
            updated = update_current_locked([](ChatMessage& message) { message.has_audio = true; });
        }
    }
    if (audio_) {
        audio_->queue(audio);
    }
    notify_updated(updated);
}

void ChatSession::handle_complete() {
    std::optional<ChatMessage> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = finish_current_locked("");
        processing_ = false;
    }
    if (audio_) {
        audio_->flush();
    }
    notify_updated(finished);
}

void ChatSession::handle_interrupted() {
    std::optional<ChatMessage> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = finish_current_locked(" [Interrupted]");
        processing_ = false;
    }
    if (audio_) {
        audio_->clear();
    }
    notify_updated(finished);
}

void ChatSession::handle_error(const std::string& message) {
    LOG_ERROR_COMP("CHAT_SESSION", "Chat error: " + message);
    ChatMessage added;
    std::optional<ChatMessage> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        added = add_message_locked(MessageRole::SYSTEM, "Error: " + message);
        finished = finish_current_locked("");
        processing_ = false;
    }
    notify_added(added);
    notify_updated(finished);
}

ChatMessage ChatSession::add_message_locked(MessageRole role, const std::string& content, bool streaming) {
    ChatMessage message;
    message.id = next_id_++;
    message.role = role;
    message.content = content;
    message.is_streaming = streaming;
    messages_.push_back(message);
    return message;
}

std::optional<ChatMessage> ChatSession::update_current_locked(const std::function<void(ChatMessage&)>& change) {
    if (!current_index_) {
        return std::nullopt;
    }
    ChatMessage& message = messages_[*current_index_];
    change(message);
    return message;
}

std::optional<ChatMessage> ChatSession::finish_current_locked(const std::string& suffix) {
    auto finished = update_current_locked([&suffix](ChatMessage& message) {
        message.content += suffix;
        message.is_streaming = false;
    });
    current_index_.reset();
    return finished;
}

void ChatSession::notify_added(const ChatMessage& message) {
    ChatMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_added_;
    }
    error_handling::safe_callback(callback, "CHAT_SESSION", "message added", message);
}

void ChatSession::notify_updated(const std::optional<ChatMessage>& message) {
    if (!message) {
        return;
    }
    ChatMessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_updated_;
    }
    error_handling::safe_callback(callback, "CHAT_SESSION", "message updated", *message);
}

} // namespace chat_client
