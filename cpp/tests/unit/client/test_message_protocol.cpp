#include "doctest.h"
#include "../../../client/chat_settings.hpp"
#include "../../../client/message_builder.hpp"
#include "../../../client/message_parser.hpp"
#include <json/json.h>

using chat_client::ChatEventType;
using chat_client::MessageBuilder;
using chat_client::MessageParser;

TEST_CASE("MessageParser - Text Chunk") {
    auto event = MessageParser::parse("{\"type\":\"text_chunk\",\"chunk\":\"hi\"}");
    REQUIRE(event.has_value());
    CHECK(event->type == ChatEventType::TEXT_CHUNK_RECEIVED);
    CHECK(event->text == "hi");
}

TEST_CASE("MessageParser - Audio Chunk Is Base64 Decoded") {
    auto event = MessageParser::parse("{\"type\":\"audio_chunk\",\"data\":\"aGVsbG8=\"}");
    REQUIRE(event.has_value());
    CHECK(event->type == ChatEventType::AUDIO_CHUNK_RECEIVED);
    CHECK(event->audio == std::vector<uint8_t>{104, 101, 108, 108, 111});
}

TEST_CASE("MessageParser - Audio Chunk Without Payload Is Dropped") {
    CHECK(!MessageParser::parse("{\"type\":\"audio_chunk\"}").has_value());
    CHECK(!MessageParser::parse("{\"type\":\"audio_chunk\",\"data\":\"\"}").has_value());
    CHECK(!MessageParser::parse("{\"type\":\"audio_chunk\",\"data\":\"@@@\"}").has_value());
    CHECK(!MessageParser::parse("{\"type\":\"audio_chunk\",\"data\":42}").has_value());
}

TEST_CASE("MessageParser - Lifecycle And Status Messages") {
    auto complete = MessageParser::parse("{\"type\":\"complete\"}");
    REQUIRE(complete.has_value());
    CHECK(complete->type == ChatEventType::RESPONSE_COMPLETED);

    auto interrupted = MessageParser::parse("{\"type\":\"interrupted\"}");
    REQUIRE(interrupted.has_value());
    CHECK(interrupted->type == ChatEventType::RESPONSE_INTERRUPTED);

    auto error = MessageParser::parse("{\"type\":\"error\",\"message\":\"model overloaded\"}");
    REQUIRE(error.has_value());
    CHECK(error->type == ChatEventType::ERROR_OCCURRED);
    CHECK(error->message == "model overloaded");

    auto status = MessageParser::parse("{\"type\":\"connection_status\",\"message\":\"ready\"}");
    REQUIRE(status.has_value());
    CHECK(status->type == ChatEventType::STATUS_MESSAGE_RECEIVED);
    CHECK(status->message == "ready");
}

TEST_CASE("MessageParser - Unknown And Malformed Input Yields Nothing") {
    CHECK(!MessageParser::parse("{\"type\":\"bogus\"}").has_value());
    CHECK(!MessageParser::parse("{\"chunk\":\"no type\"}").has_value());
    CHECK(!MessageParser::parse("{\"type\":7}").has_value());
    CHECK(!MessageParser::parse("not json at all").has_value());
    CHECK(!MessageParser::parse("[1,2,3]").has_value());
    CHECK(!MessageParser::parse("").has_value());
}

TEST_CASE("MessageBuilder - Request Carries Full Agent Configuration") {
    auto settings = chat_client::ChatSettings::defaults();
    settings.user_id = "u1";
    settings.agent.model_name = "gpt-4o-mini";
    settings.agent.temperature = 0.7;
    settings.agent.personality.traits["humor"] = "dry";
    settings.context["locale"] = "en-US";

    std::string json = MessageBuilder::create_request(settings, "Hello there").to_json_string();

    CHECK(json.find("\"type\":\"chat_request\"") != std::string::npos);
    CHECK(json.find("\"user_id\":\"u1\"") != std::string::npos);

    Json::Value root;
    Json::Reader reader;
    REQUIRE(reader.parse(json, root));
    CHECK(root["message"].asString() == "Hello there");
    CHECK(root["stream_audio"].asBool() == settings.audio_enabled);
    CHECK(root["voice_id"].asString() == settings.agent.voice_id);
    CHECK(root["context"]["locale"].asString() == "en-US");

    const Json::Value& configuration = root["configuration"];
    CHECK(configuration["provider"].asString() == "langraph");
    CHECK(configuration["model_name"].asString() == "gpt-4o-mini");
    CHECK(configuration["temperature"].asDouble() == doctest::Approx(0.7));
    CHECK(configuration["max_tokens"].asInt() == 500);
    CHECK(configuration["system_prompt"].asString() == settings.agent.system_prompt);

    const Json::Value& personality = configuration["personality"];
    CHECK(personality["name"].asString() == "Homunculy");
    CHECK(personality["mood"].asString() == "cheerful");
    CHECK(personality["traits"]["humor"].asString() == "dry");
    CHECK(personality.isMember("description"));
}

TEST_CASE("MessageBuilder - Empty Voice Id Is Omitted") {
    auto settings = chat_client::ChatSettings::defaults();
    settings.agent.voice_id.clear();
    settings.audio_enabled = false;

    Json::Value root = MessageBuilder::create_request(settings, "quiet").to_json();
    CHECK(!root.isMember("voice_id"));
    CHECK(root["stream_audio"].asBool() == false);
    CHECK(root["context"].isObject());
}
