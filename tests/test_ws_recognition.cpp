#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/backend/ws_recognition_client.hpp"
#include "voice_gateway/errors.hpp"

#include <string>

using voice_gateway::RecognitionEvent;
using voice_gateway::RecognitionFailure;
using voice_gateway::WsRecognitionClient;
using voice_gateway::parse_recognition_message;

TEST_CASE("transcript messages become text events") {
    const auto event = parse_recognition_message(
        R"({"type":"transcript","text":"what is my","is_final":false,"confidence":0.82,"language":"en-US"})");
    REQUIRE(event);
    REQUIRE(event->kind == RecognitionEvent::Kind::Text);
    REQUIRE(event->increment.text == "what is my");
    REQUIRE_FALSE(event->increment.is_final);
    REQUIRE(event->increment.confidence == 0.82);
    REQUIRE(event->increment.language == std::optional<std::string>("en-US"));
}

TEST_CASE("missing transcript fields keep their defaults") {
    const auto event = parse_recognition_message(R"({"type":"transcript","is_final":true})");
    REQUIRE(event);
    REQUIRE(event->increment.text.empty());
    REQUIRE(event->increment.is_final);
    REQUIRE(event->increment.confidence == 1.0);
    REQUIRE_FALSE(event->increment.language);
}

TEST_CASE("speech markers and errors are recognised") {
    REQUIRE(parse_recognition_message(R"({"type":"speech_started"})")->kind ==
            RecognitionEvent::Kind::SpeechStarted);
    REQUIRE(parse_recognition_message(R"({"type":"speech_stopped"})")->kind ==
            RecognitionEvent::Kind::SpeechStopped);

    const auto error = parse_recognition_message(R"({"type":"error","message":"model overloaded"})");
    REQUIRE(error->kind == RecognitionEvent::Kind::Failure);
    REQUIRE(error->error == "model overloaded");
}

TEST_CASE("unknown or malformed messages are ignored") {
    REQUIRE_FALSE(parse_recognition_message(R"({"type":"heartbeat"})"));
    REQUIRE_FALSE(parse_recognition_message("not json"));
    REQUIRE_FALSE(parse_recognition_message("[1,2,3]"));
}

TEST_CASE("stream urls switch to the websocket scheme") {
    WsRecognitionClient http_client({"http://asr.local:9000/", std::chrono::milliseconds(100)});
    REQUIRE(http_client.make_stream_url("en-US", 16000) ==
            "ws://asr.local:9000/stream?language=en-US&sample_rate=16000");

    WsRecognitionClient ws_client({"ws://asr.local:9000/v1", std::chrono::milliseconds(100)});
    REQUIRE(ws_client.make_stream_url("auto", 8000) ==
            "ws://asr.local:9000/v1/stream?language=auto&sample_rate=8000");
}

TEST_CASE("tls recognition endpoints are refused") {
    WsRecognitionClient client({"https://asr.example.com", std::chrono::milliseconds(100)});
    REQUIRE(client.make_stream_url("en-US", 16000).rfind("wss://", 0) == 0);
    REQUIRE_THROWS_AS(client.start("en-US", 16000), RecognitionFailure);
}
