/**
 * test_lyrics_provider.cpp - Lyric line normalization, files and lyrics.ovh
 */

#include "llt/Errors.hpp"
#include "llt/lyrics/LyricsProvider.hpp"
#include "../support/LocalServer.hpp"
#include "../support/TestFakes.hpp"
#include <cassert>
#include <fstream>
#include <iostream>

using namespace llt;
using llt::lyrics::LyricsProvider;

template<typename Fn>
static bool throwsSetupError(Fn fn) {
    try {
        fn();
    } catch (const SetupError&) {
        return true;
    }
    return false;
}

void test_split_lines() {
    auto lines = LyricsProvider::splitLines("one\ntwo\r\nthree\rfour");
    assert(lines.size() == 4);
    assert(lines[0] == "one");
    assert(lines[2] == "three");
    assert(lines[3] == "four");

    // Blank lines are kept here and removed by normalize()
    lines = LyricsProvider::splitLines("a\n\nb\n");
    assert(lines.size() == 3);
    assert(lines[1].empty());

    std::cout << "[PASS] test_split_lines" << std::endl;
}

void test_normalize() {
    auto lines = LyricsProvider::normalize({"  Hello   there ", "", "   ", "\tsecond\tline"});
    assert(lines.size() == 2);
    assert(lines[0] == "Hello there");
    assert(lines[1] == "second line");

    assert(throwsSetupError([]() { LyricsProvider::normalize({"", "  ", "\t"}); }));

    std::cout << "[PASS] test_normalize" << std::endl;
}

void test_parse_response() {
    auto lines = LyricsProvider::parseResponse(R"({"lyrics": "Paroles\r\n\nLine one\n  Line   two  "})");
    assert(lines.size() == 3);
    assert(lines[0] == "Paroles");
    assert(lines[2] == "Line two");

    assert(throwsSetupError([]() { LyricsProvider::parseResponse(R"({"lyrics": ""})"); }));
    assert(throwsSetupError([]() { LyricsProvider::parseResponse(R"({"error": "No lyrics found"})"); }));
    assert(throwsSetupError([]() { LyricsProvider::parseResponse("<html>oops</html>"); }));
    assert(throwsSetupError([]() { LyricsProvider::parseResponse(R"({"lyrics": 42})"); }));

    std::cout << "[PASS] test_parse_response" << std::endl;
}

void test_load_from_file() {
    std::string path = llt::test::tempPath("lyrics.txt");
    {
        std::ofstream f(path, std::ios::binary);
        f << "\xEF\xBB\xBF" << "First line\r\n\r\n  Second   line\n";
    }

    LyricsProvider provider("http://127.0.0.1:1");
    auto lines = provider.loadFromFile(path);
    assert(lines.size() == 2);
    assert(lines[0] == "First line");
    assert(lines[1] == "Second line");

    assert(throwsSetupError([&]() { provider.loadFromFile("/nonexistent/lyrics.txt"); }));

    std::string blank = llt::test::tempPath("blank_lyrics.txt");
    {
        std::ofstream f(blank);
        f << "\n   \n";
    }
    assert(throwsSetupError([&]() { provider.loadFromFile(blank); }));

    std::remove(path.c_str());
    std::remove(blank.c_str());
    std::cout << "[PASS] test_load_from_file" << std::endl;
}

void test_fetch_from_local_server() {
    llt::test::LocalServer local;
    std::string requested_artist;
    std::string requested_title;

    local.server().Get(R"(/v1/([^/]+)/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
        requested_artist = req.matches[1];
        requested_title = req.matches[2];
        if (requested_artist == "Nobody") {
            res.status = 404;
            res.set_content(R"({"error": "No lyrics found"})", "application/json");
            return;
        }
        res.set_content(R"({"lyrics": "Hello, it's me\nI was wondering"})", "application/json");
    });

    if (!local.start()) {
        std::cout << "[SKIP] test_fetch_from_local_server (can't bind loopback)" << std::endl;
        return;
    }

    LyricsProvider provider(local.url() + "/v1/", 2000);
    auto lines = provider.fetch("Adele", "Hello");
    assert(lines.size() == 2);
    assert(lines[0] == "Hello, it's me");
    assert(requested_artist == "Adele");
    assert(requested_title == "Hello");

    assert(throwsSetupError([&]() { provider.fetch("Nobody", "Nothing"); }));

    local.stop();
    std::cout << "[PASS] test_fetch_from_local_server" << std::endl;
}

void test_unreachable_service() {
    // Nothing listens on port 1
    LyricsProvider provider("http://127.0.0.1:1/v1", 1000);
    assert(throwsSetupError([&]() { provider.fetch("Adele", "Hello"); }));
    std::cout << "[PASS] test_unreachable_service" << std::endl;
}

int main() {
    std::cout << "=== LyricsProvider Tests ===" << std::endl;

    test_split_lines();
    test_normalize();
    test_parse_response();
    test_load_from_file();
    test_fetch_from_local_server();
    test_unreachable_service();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
