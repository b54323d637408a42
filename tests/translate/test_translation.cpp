/**
 * test_translation.cpp - translate_a/single parsing and host failover
 */

#include "llt/Errors.hpp"
#include "llt/translate/TranslationClient.hpp"
#include "../support/LocalServer.hpp"
#include <atomic>
#include <cassert>
#include <iostream>

using namespace llt;
using llt::translate::TranslationClient;

template<typename Fn>
static bool throwsSetupError(Fn fn) {
    try {
        fn();
    } catch (const SetupError&) {
        return true;
    }
    return false;
}

void test_parse_response() {
    std::string body = R"([[["Hola ","Hello ",null,null,10],["mundo","world",null,null,10]],null,"en"])";
    assert(TranslationClient::parseResponse(body) == "Hola mundo");

    // Non-text fragments (transliterations etc.) are skipped
    body = R"([[["Bonjour","Hello"],[null,null,"bon-zhoor"]],null,"en"])";
    assert(TranslationClient::parseResponse(body) == "Bonjour");

    assert(throwsSetupError([]() { TranslationClient::parseResponse("not json"); }));
    assert(throwsSetupError([]() { TranslationClient::parseResponse(R"({"sentences": []})"); }));
    assert(throwsSetupError([]() { TranslationClient::parseResponse("[]"); }));

    std::cout << "[PASS] test_parse_response" << std::endl;
}

void test_requires_hosts() {
    assert(throwsSetupError([]() { TranslationClient client(std::vector<std::string>{}); }));
    std::cout << "[PASS] test_requires_hosts" << std::endl;
}

void test_failover_between_hosts() {
    llt::test::LocalServer broken;
    llt::test::LocalServer working;
    std::atomic<int> broken_hits{0};
    std::atomic<int> working_hits{0};

    broken.server().Get("/translate_a/single", [&](const httplib::Request&, httplib::Response& res) {
        broken_hits++;
        res.status = 503;
    });
    working.server().Get("/translate_a/single", [&](const httplib::Request& req, httplib::Response& res) {
        working_hits++;
        std::string q = req.get_param_value("q");
        std::string tl = req.get_param_value("tl");
        res.set_content("[[[\"" + q + " \",\"" + q + "\"],[\"(" + tl + ")\",\"\"]],null,\"en\"]",
                        "application/json");
    });

    if (!broken.start() || !working.start()) {
        std::cout << "[SKIP] test_failover_between_hosts (can't bind loopback)" << std::endl;
        return;
    }

    TranslationClient client({broken.url(), working.url()}, 2000);
    auto out = client.translateLines({"first line", "second line"}, "pt");

    assert(out.size() == 2);
    assert(out[0] == "first line (pt)");
    assert(out[1] == "second line (pt)");
    // After the failover the working host is tried first
    assert(broken_hits == 1);
    assert(working_hits == 2);

    broken.stop();
    working.stop();
    std::cout << "[PASS] test_failover_between_hosts" << std::endl;
}

void test_all_hosts_down() {
    TranslationClient client({"http://127.0.0.1:1"}, 1000);
    assert(throwsSetupError([&]() { client.translateLines({"hello"}, "de"); }));
    std::cout << "[PASS] test_all_hosts_down" << std::endl;
}

int main() {
    std::cout << "=== TranslationClient Tests ===" << std::endl;

    test_parse_response();
    test_requires_hosts();
    test_failover_between_hosts();
    test_all_hosts_down();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
