#include "doctest.h"
#include "../../../chat_cli/chat_cli_service.hpp"
#include <cstdio>
#include <fstream>

namespace {

// Offline configuration: nothing listens on port 1
std::string write_chat_cli_test_config() {
    const std::string path = "test_chat_cli.ini";
    std::ofstream out(path);
    out << "[logging]\n"
        << "level = ERROR\n"
        << "[server]\n"
        << "uri = ws://127.0.0.1:1/ws\n"
        << "user_id = tester\n"
        << "[websocket]\n"
        << "profile = stable\n"
        << "max_reconnect_attempts = 0\n"
        << "[audio]\n"
        << "enabled = false\n";
    return path;
}

} // namespace

TEST_CASE("ChatCliService - Rejects Unknown Arguments") {
    std::string config = write_chat_cli_test_config();
    chat_cli::ChatCliService service;

    std::string program = "chat_cli";
    std::string bogus = "--bogus";
    char* argv[] = {&program[0], &bogus[0]};
    CHECK(!service.initialize(2, argv));
    std::remove(config.c_str());
}

TEST_CASE("ChatCliService - Input Before Configuration Is Ignored") {
    chat_cli::ChatCliService service;
    CHECK(service.handle_input_line("hello"));
    CHECK(service.get_statistics().messages_sent.load() == 0);
}

TEST_CASE("ChatCliService - Handles Commands Offline") {
    std::string config = write_chat_cli_test_config();
    chat_cli::ChatCliService service;

    std::string program = "chat_cli";
    std::string config_flag = "--config";
    std::string token_flag = "--token";
    char* argv[] = {&program[0], &config_flag[0], &config[0], &token_flag[0]};
    REQUIRE(service.initialize(4, argv));

    // Not connected: the send fails and is not counted
    CHECK(service.handle_input_line("hello"));
    CHECK(service.get_statistics().messages_sent.load() == 0);

    CHECK(service.handle_input_line("/disconnect"));
    CHECK(!service.handle_input_line("/quit"));
    std::remove(config.c_str());
}
