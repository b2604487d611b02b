#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

// Include all test files

// Unit tests - Core utilities
#include "unit/utils/test_base64.cpp"
#include "unit/utils/test_cancellation.cpp"
#include "unit/config/test_process_config_manager.cpp"

// Unit tests - WebSocket protocol
#include "unit/websocket/test_websocket_frame.cpp"
#include "unit/websocket/test_websocket_handshake.cpp"

// Unit tests - Chat client
#include "unit/client/test_reconnect_strategy.cpp"
#include "unit/client/test_message_protocol.cpp"
#include "unit/client/test_event_stream.cpp"
#include "unit/client/test_socket_connection.cpp"
#include "unit/client/test_socket_receiver.cpp"
#include "unit/client/test_websocket_chat_client.cpp"
#include "unit/client/test_chat_session.cpp"

// Unit tests - Audio
#include "unit/audio/test_wav_utils.cpp"
#include "unit/audio/test_audio_stream_buffer.cpp"
#include "unit/audio/test_file_playback_adapter.cpp"

// Unit tests - LiveKit and CLI
#include "unit/livekit/test_token_client.cpp"
#include "unit/chat_cli/test_chat_cli_service.cpp"

// Integration tests
#include "integration/test_websocket_loopback.cpp"

// Add timeout to prevent hanging
int main(int argc, char** argv) {
    // Set a timeout for the entire test suite
    std::thread timeout_thread([]() {
        std::this_thread::sleep_for(std::chrono::seconds(120));
        std::cout << "\n[TEST_RUNNER] Timeout reached, forcing exit..." << std::endl;
        std::exit(1);
    });
    timeout_thread.detach();
    
    return doctest::Context(argc, argv).run();
}
