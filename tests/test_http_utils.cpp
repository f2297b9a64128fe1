#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/utils/http.hpp"

#include <string>

using namespace voice_gateway::utils;

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(url_encode(input) == expected);
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    parse_url("https://example.com:8443/path/file", scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(build_url("http", "localhost", 80, "/x") == "http://localhost/x");
    REQUIRE(build_url("http", "localhost", 2024, "threads") == "http://localhost:2024/threads");
}

TEST_CASE("join_path does not double slashes") {
    REQUIRE(join_path("/api/", "/threads") == "/api/threads");
    REQUIRE(join_path("", "threads") == "/threads");
    REQUIRE(join_path("/", "") == "/");
}

TEST_CASE("build_query encodes parameters in key order") {
    REQUIRE(build_query({{"sample_rate", "16000"}, {"language", "en US"}}) ==
            "?language=en%20US&sample_rate=16000");
    REQUIRE(build_query({}).empty());
}

TEST_CASE("find_header reads SIP headers case-insensitively") {
    const std::string invite =
        "INVITE sip:bot@example.com SIP/2.0\r\n"
        "Via: SIP/2.0/UDP 10.0.0.1:5060\r\n"
        "x-language:  de-DE \r\n"
        "X-Agent: billing\r\n"
        "\r\n"
        "v=0\r\n"
        "X-Ignored: body\r\n";
    REQUIRE(find_header(invite, "X-Language") == std::optional<std::string>("de-DE"));
    REQUIRE(find_header(invite, "x-agent") == std::optional<std::string>("billing"));
    REQUIRE_FALSE(find_header(invite, "X-Ignored"));
    REQUIRE_FALSE(find_header(invite, "X-Missing"));
}
