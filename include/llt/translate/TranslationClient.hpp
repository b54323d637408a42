/**
 * TranslationClient.hpp - Line-by-line translation of the lyrics
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace llt::translate {

class TranslationEngine {
public:
    virtual ~TranslationEngine() = default;

    /**
     * Translate every line into target_language (ISO-639-1).
     * The result has the same length and order as lines.
     * @throws SetupError if any line can't be translated
     */
    virtual std::vector<std::string> translateLines(const std::vector<std::string>& lines,
                                                    const std::string& target_language) = 0;
};

/**
 * Google Translate web endpoint client (translate_a/single, client=gtx).
 * Hosts are tried in order; the next one is used when a request fails.
 */
class TranslationClient : public TranslationEngine {
public:
    explicit TranslationClient(std::vector<std::string> hosts, int timeout_ms = 10000);
    TranslationClient();  // hosts from GOOGLETRANS_SERVICE_URLS
    ~TranslationClient() override;

    std::vector<std::string> translateLines(const std::vector<std::string>& lines,
                                            const std::string& target_language) override;

    std::string translate(const std::string& text, const std::string& target_language);

    const std::vector<std::string>& hosts() const { return hosts_; }

    /// Concatenate the translated fragments of a translate_a/single response.
    static std::string parseResponse(const std::string& body);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::vector<std::string> hosts_;
};

} // namespace llt::translate
