#pragma once
#include "i_chat_client.hpp"
#include "../audio/i_audio_player.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chat_client {

enum class MessageRole {
    USER,
    ASSISTANT,
    SYSTEM
};

const char* to_string(MessageRole role);

struct ChatMessage {
    uint64_t id{0};
    MessageRole role{MessageRole::SYSTEM};
    std::string content;
    bool is_streaming{false};
    bool has_audio{false};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

using ChatMessageCallback = std::function<void(const ChatMessage&)>;

/**
 * Conversation state on top of a chat client and an audio player.
 *
 * Sending a message resets audio first, so a new turn interrupts whatever the
 * previous one was still playing. Audio chunks are only forwarded while an
 * assistant response is in progress.
 */
class ChatSession {
public:
    ChatSession(std::shared_ptr<IChatClient> client, std::shared_ptr<audio::IAudioPlayer> audio_player);
    ~ChatSession();

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    bool connect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none());
    void disconnect(const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none());

    // Returns false for blank input or when the send failed; a failure is
    // recorded as a system message
    bool send_message(const std::string& text,
                      const cancellation::CancellationToken& cancel = cancellation::CancellationToken::none());

    std::vector<ChatMessage> messages() const;
    std::optional<ChatMessage> current_response() const;
    bool is_processing() const;
    ConnectionState connection_state() const;

    void set_message_added_callback(ChatMessageCallback callback);
    void set_message_updated_callback(ChatMessageCallback callback);

private:
    void handle_event(const ChatEvent& event);
    void handle_text_chunk(const std::string& chunk);
    void handle_audio_chunk(const std::vector<uint8_t>& audio);
    void handle_complete();
    void handle_interrupted();
    void handle_error(const std::string& message);

    // Return the message to report, if any; called with mutex_ held
    ChatMessage add_message_locked(MessageRole role, const std::string& content, bool streaming = false);
    std::optional<ChatMessage> update_current_locked(const std::function<void(ChatMessage&)>& change);
    std::optional<ChatMessage> finish_current_locked(const std::string& suffix);

    void notify_added(const ChatMessage& message);
    void notify_updated(const std::optional<ChatMessage>& message);

    std::shared_ptr<IChatClient> client_;
    std::shared_ptr<audio::IAudioPlayer> audio_;
    size_t subscription_{0};

    mutable std::mutex mutex_;
    std::vector<ChatMessage> messages_;
    std::optional<size_t> current_index_;
    bool processing_{false};
    ConnectionState connection_state_{ConnectionState::DISCONNECTED};
    uint64_t next_id_{1};

    std::mutex callback_mutex_;
    ChatMessageCallback on_added_;
    ChatMessageCallback on_updated_;
};

} // namespace chat_client
