#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/pipeline/response_streamer.hpp"

#include <string>
#include <vector>

using voice_gateway::ResponseStreamer;

TEST_CASE("streamer keeps a number split across increments in one unit") {
    std::vector<std::string> units;
    ResponseStreamer streamer(40, 220, [&](const std::string& u) { units.push_back(u); });

    streamer.feed("Your balance is");
    streamer.feed(" $500.");
    streamer.feed("25");
    REQUIRE(units.empty());
    streamer.finish();

    REQUIRE(units.size() == 1);
    REQUIRE(units[0] == "Your balance is $500.25");
}

TEST_CASE("streamer cuts at sentence boundaries once the next text starts") {
    std::vector<std::string> units;
    ResponseStreamer streamer(40, 220, [&](const std::string& u) { units.push_back(u); });

    streamer.feed("Hello there. How can");
    REQUIRE(units.size() == 1);
    REQUIRE(units[0] == "Hello there.");
    streamer.feed(" I help?");
    streamer.finish();
    REQUIRE(units.size() == 2);
    REQUIRE(units[1] == "How can I help?");
}

TEST_CASE("streamer cuts long clauses at commas only") {
    std::vector<std::string> units;
    ResponseStreamer streamer(20, 220, [&](const std::string& u) { units.push_back(u); });

    streamer.feed("Yes, I can do that for you, right away");
    REQUIRE(units.size() == 1);
    REQUIRE(units[0] == "Yes, I can do that for you,");
    streamer.finish();
    REQUIRE(units.back() == "right away");
}

TEST_CASE("streamer splits oversized text at whitespace") {
    std::vector<std::string> units;
    ResponseStreamer streamer(40, 10, [&](const std::string& u) { units.push_back(u); });

    streamer.feed("alpha beta gamma delta");
    streamer.finish();
    REQUIRE(units.size() >= 2);
    for (const auto& unit : units) {
        REQUIRE(unit.size() <= 10);
    }
}

TEST_CASE("streamer forwards nothing after cancel") {
    std::vector<std::string> units;
    ResponseStreamer streamer(40, 220, [&](const std::string& u) { units.push_back(u); });

    streamer.feed("First part");
    streamer.cancel();
    streamer.feed(". Second part. ");
    streamer.finish();
    REQUIRE(units.empty());
    REQUIRE(streamer.cancelled());
    REQUIRE(streamer.units_forwarded() == 0);
}

TEST_CASE("streamer drops whitespace-only remainders") {
    std::vector<std::string> units;
    ResponseStreamer streamer(40, 220, [&](const std::string& u) { units.push_back(u); });
    streamer.feed("   ");
    streamer.finish();
    REQUIRE(units.empty());
}
