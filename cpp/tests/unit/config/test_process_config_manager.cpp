#include "doctest.h"
#include "../../../utils/config/process_config_manager.hpp"
#include "../../../client/chat_settings.hpp"
#include "../../../client/websocket_config.hpp"
#include <fstream>
#include <iostream>

TEST_CASE("ProcessConfigManager - Load Valid Config") {
    // Create a test config file
    std::ofstream config_file("test_config.ini");
    config_file << "[server]\n";
    config_file << "uri = ws://chat.example:8000/ws\n";
    config_file << "user_id = alice\n";
    config_file << "[agent]\n";
    config_file << "provider = openai\n";
    config_file.close();
    
    config::ProcessConfigManager manager;
    bool loaded = manager.load_config("test_config.ini");
    
    CHECK(loaded == true);
    
    // Test reading values
    CHECK(manager.get_server_uri() == "ws://chat.example:8000/ws");
    CHECK(manager.get_user_id() == "alice");
    CHECK(manager.get_string("agent", "provider", "") == "openai");
    CHECK(manager.has_section("server"));
    CHECK(!manager.has_section("livekit"));
    
    // Clean up
    std::remove("test_config.ini");
}

TEST_CASE("ProcessConfigManager - Load Invalid Config") {
    config::ProcessConfigManager manager;
    bool loaded = manager.load_config("nonexistent_config.ini");
    
    CHECK(loaded == false);
}

TEST_CASE("ProcessConfigManager - Default Values") {
    config::ProcessConfigManager manager;
    
    // Test default values when config not loaded
    std::string default_value = manager.get_string("section", "key", "default");
    CHECK(default_value == "default");
    
    int default_int = manager.get_int("section", "key", 42);
    CHECK(default_int == 42);
    
    double default_double = manager.get_double("section", "key", 3.14);
    CHECK(default_double == 3.14);
}

TEST_CASE("ProcessConfigManager - Numeric Values") {
    // Create a test config file with numeric values
    std::ofstream config_file("test_numeric_config.ini");
    config_file << "[numeric_section]\n";
    config_file << "int_value = 123\n";
    config_file << "double_value = 3.14159\n";
    config_file << "bool_value = true\n";
    config_file.close();
    
    config::ProcessConfigManager manager;
    manager.load_config("test_numeric_config.ini");
    
    int int_val = manager.get_int("numeric_section", "int_value", 0);
    double double_val = manager.get_double("numeric_section", "double_value", 0.0);
    bool bool_val = manager.get_bool("numeric_section", "bool_value", false);
    
    CHECK(int_val == 123);
    CHECK(double_val == 3.14159);
    CHECK(bool_val == true);
    
    // Clean up
    std::remove("test_numeric_config.ini");
}

TEST_CASE("ProcessConfigManager - Missing Keys") {
    std::ofstream config_file("test_missing_keys.ini");
    config_file << "[section]\n";
    config_file << "existing_key = value\n";
    config_file.close();
    
    config::ProcessConfigManager manager;
    manager.load_config("test_missing_keys.ini");
    
    // Test missing keys return defaults
    std::string missing_str = manager.get_string("section", "missing_key", "default");
    int missing_int = manager.get_int("section", "missing_key", 999);
    
    CHECK(missing_str == "default");
    CHECK(missing_int == 999);
    
    // Clean up
    std::remove("test_missing_keys.ini");
}

TEST_CASE("ProcessConfigManager - Comments And Key Outside Section") {
    config::ProcessConfigManager manager;
    bool loaded = manager.load_config_from_string(
        "# comment\n"
        "; another comment\n"
        "orphan = 1\n"
        "[server]\n"
        "uri = ws://host/ws\n");

    CHECK(loaded == false);
    CHECK(manager.get_string("server", "uri", "") == "ws://host/ws");
}

TEST_CASE("ProcessConfigManager - Malformed Number Falls Back To Default") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string("[agent]\nmax_tokens = lots\ntemperature = warm\n");

    CHECK(manager.get_int("agent", "max_tokens", 500) == 500);
    CHECK(manager.get_double("agent", "temperature", 0.7) == doctest::Approx(0.7));
}

TEST_CASE("ProcessConfigManager - Validation Rejects Bad WebSocket Values") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[websocket]\n"
        "profile = turbo\n"
        "connect_timeout_ms = -5\n");

    CHECK(manager.validate_config() == false);
    CHECK(manager.get_validation_errors().size() == 2);
}

TEST_CASE("ProcessConfigManager - Validation Accepts Chat Config") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[websocket]\n"
        "profile = stable\n"
        "connect_timeout_ms = 5000\n"
        "infinite_reconnect = false\n"
        "[audio]\n"
        "sample_rate = 24000\n"
        "[livekit]\n"
        "ttl_seconds = 600\n");

    CHECK(manager.validate_config() == true);
    CHECK(manager.get_validation_errors().empty());
}

TEST_CASE("ProcessConfigManager - Default Config Path") {
    CHECK(config::get_config_file_path("chat_cli") == "config/chat_cli.ini");
}

TEST_CASE("WebSocketConfig - Mobile Profile Defaults") {
    auto config = chat_client::WebSocketConfig::mobile();

    CHECK(config.connect_timeout() == std::chrono::milliseconds(30000));
    CHECK(config.ping_interval() == std::chrono::milliseconds(15000));
    CHECK(config.reconnect_base_delay() == std::chrono::milliseconds(1000));
    CHECK(config.reconnect_max_delay() == std::chrono::milliseconds(30000));
    CHECK(config.keep_alive_interval() == std::chrono::milliseconds(30000));
    CHECK(config.pong_timeout() == std::chrono::milliseconds(10000));
    CHECK(config.max_reconnect_attempts() == INT_MAX);
    CHECK(config.receive_buffer_size() == 8192);
    CHECK(config.infinite_reconnect());
}

TEST_CASE("WebSocketConfig - Stable Profile Is Bounded") {
    auto config = chat_client::WebSocketConfig::stable();

    CHECK(config.ping_interval() == std::chrono::milliseconds(30000));
    CHECK(config.keep_alive_interval() == std::chrono::milliseconds(60000));
    CHECK(config.max_reconnect_attempts() == 10);
    CHECK(!config.infinite_reconnect());
}

TEST_CASE("WebSocketConfig - From Config Applies Overrides On Profile") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[websocket]\n"
        "profile = stable\n"
        "connect_timeout_ms = 2500\n"
        "max_reconnect_attempts = 3\n"
        "receive_buffer_size = 16\n"
        "expect_status_message = false\n");

    auto config = chat_client::WebSocketConfig::from_config(manager);

    CHECK(config.connect_timeout() == std::chrono::milliseconds(2500));
    CHECK(config.max_reconnect_attempts() == 3);
    CHECK(config.receive_buffer_size() == 16);
    CHECK(!config.expect_status_message());
    CHECK(!config.infinite_reconnect());
    CHECK(config.keep_alive_interval() == std::chrono::milliseconds(60000));
}

TEST_CASE("WebSocketConfig - Max Delay Raised To Base Delay") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[websocket]\n"
        "reconnect_base_delay_ms = 5000\n"
        "reconnect_max_delay_ms = 100\n");

    auto config = chat_client::WebSocketConfig::from_config(manager);
    CHECK(config.reconnect_max_delay() == std::chrono::milliseconds(5000));
}

TEST_CASE("WebSocketConfig - Profile Name Is Case Insensitive") {
    config::ProcessConfigManager stable_manager;
    stable_manager.load_config_from_string("[websocket]\nprofile = Stable\n");
    CHECK(!chat_client::WebSocketConfig::from_config(stable_manager).infinite_reconnect());

    config::ProcessConfigManager unknown_manager;
    unknown_manager.load_config_from_string("[websocket]\nprofile = turbo\n");
    auto config = chat_client::WebSocketConfig::from_config(unknown_manager);
    CHECK(config.infinite_reconnect());
    CHECK(config.ping_interval() == std::chrono::milliseconds(15000));
}

TEST_CASE("ChatSettings - Defaults") {
    auto settings = chat_client::ChatSettings::defaults();

    CHECK(settings.server_uri == "ws://localhost:8000/api/v1/ws/chat");
    CHECK(settings.user_id == "User");
    CHECK(settings.audio_enabled);
    CHECK(settings.agent.provider == "langraph");
    CHECK(settings.agent.model_name == "gpt-4o-mini");
    CHECK(settings.agent.voice_id == "lhTvHflPVOqgSWyuWQry");
    CHECK(settings.agent.temperature == doctest::Approx(0.7));
    CHECK(settings.agent.max_tokens == 500);
    CHECK(settings.agent.personality.name == "Homunculy");
    CHECK(settings.agent.personality.mood == "cheerful");
    CHECK(settings.agent.system_prompt.find("Homunculy") != std::string::npos);
}

TEST_CASE("ChatSettings - From Config") {
    config::ProcessConfigManager manager;
    manager.load_config_from_string(
        "[server]\n"
        "user_id = u1\n"
        "[agent]\n"
        "model_name = gpt-4o\n"
        "temperature = 0.2\n"
        "max_tokens = 64\n"
        "trait.humor = dry\n"
        "[audio]\n"
        "enabled = false\n");

    auto settings = chat_client::ChatSettings::from_config(manager);

    CHECK(settings.user_id == "u1");
    CHECK(settings.agent.model_name == "gpt-4o");
    CHECK(settings.agent.temperature == doctest::Approx(0.2));
    CHECK(settings.agent.max_tokens == 64);
    CHECK(settings.agent.personality.traits.at("humor") == "dry");
    CHECK(!settings.audio_enabled);
    CHECK(settings.agent.provider == "langraph");
}
