/**
 * TranslationClient.cpp - Google Translate web endpoint over cpp-httplib
 */

#include "llt/translate/TranslationClient.hpp"
#include "llt/Config.hpp"
#include "llt/Errors.hpp"
#include "llt/net/Url.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace llt::translate {

struct TranslationClient::Impl {
    std::vector<std::unique_ptr<httplib::Client>> clients;
    std::vector<std::string> origins;
    size_t preferred = 0;  // last host that answered

    Impl(const std::vector<std::string>& hosts, int timeout_ms) {
        for (const auto& host : hosts) {
            net::Endpoint endpoint = net::splitUrl(host);
            auto client = std::make_unique<httplib::Client>(endpoint.origin);
            client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
            client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
            client->set_follow_location(true);
            clients.push_back(std::move(client));
            origins.push_back(endpoint.origin);
        }
    }
};

TranslationClient::TranslationClient(std::vector<std::string> hosts, int timeout_ms)
    : hosts_(std::move(hosts)) {
    if (hosts_.empty()) {
        throw SetupError("no translation hosts configured");
    }
    impl_ = std::make_unique<Impl>(hosts_, timeout_ms);
}

TranslationClient::TranslationClient()
    : TranslationClient(net::splitList(translationHostsFromEnv(), ',')) {
}

TranslationClient::~TranslationClient() = default;

std::vector<std::string> TranslationClient::translateLines(const std::vector<std::string>& lines,
                                                           const std::string& target_language) {
    std::vector<std::string> translations;
    translations.reserve(lines.size());
    for (const auto& line : lines) {
        translations.push_back(translate(line, target_language));
    }
    std::cout << "[TranslationClient] Translated " << translations.size()
              << " lines to " << target_language << std::endl;
    return translations;
}

std::string TranslationClient::translate(const std::string& text, const std::string& target_language) {
    const std::string path = "/translate_a/single?client=gtx&sl=auto&tl="
                           + net::percentEncode(target_language)
                           + "&dt=t&q=" + net::percentEncode(text);

    std::string last_error = "no hosts";
    const size_t n = impl_->clients.size();

    for (size_t attempt = 0; attempt < n; ++attempt) {
        size_t idx = (impl_->preferred + attempt) % n;
        auto res = impl_->clients[idx]->Get(path);

        if (!res) {
            last_error = impl_->origins[idx] + ": " + httplib::to_string(res.error());
        } else if (res->status != 200) {
            last_error = impl_->origins[idx] + ": HTTP " + std::to_string(res->status);
        } else {
            try {
                std::string translated = parseResponse(res->body);
                impl_->preferred = idx;
                return translated;
            } catch (const SetupError& e) {
                last_error = impl_->origins[idx] + ": " + e.what();
            }
        }

        std::cerr << "[TranslationClient] Request failed (" << last_error << ")" << std::endl;
    }

    throw SetupError("translation failed for \"" + text + "\": " + last_error);
}

std::string TranslationClient::parseResponse(const std::string& body) {
    // [[["translated", "source", ...], ["more", "text", ...]], null, "detected-lang", ...]
    try {
        json res_json = json::parse(body);
        if (!res_json.is_array() || res_json.empty() || !res_json[0].is_array()) {
            throw SetupError("unexpected translation response layout");
        }

        std::string translated;
        for (const auto& fragment : res_json[0]) {
            if (fragment.is_array() && !fragment.empty() && fragment[0].is_string()) {
                translated += fragment[0].get<std::string>();
            }
        }
        return translated;
    } catch (const json::exception& e) {
        throw SetupError(std::string("malformed translation response: ") + e.what());
    }
}

} // namespace llt::translate
