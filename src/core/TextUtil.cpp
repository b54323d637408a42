/**
 * TextUtil.cpp - Whitespace handling, UTF-8 and lowercase folding
 *
 * Case mapping and the whitespace property come from ICU.
 */

#include "llt/core/TextUtil.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace llt::core {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

bool isSpace(char32_t c) {
    // White_Space plus the ASCII separators U+001C..U+001F, which Python's
    // str.isspace() also counts
    return u_isUWhiteSpace(static_cast<UChar32>(c)) || (c >= 0x1C && c <= 0x1F);
}

std::u32string trimSpaces(const std::u32string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

} // namespace

std::string trim(const std::string& text) {
    return encodeUtf8(trimSpaces(decodeUtf8(text)));
}

std::string collapseWhitespace(const std::string& text) {
    std::u32string result;
    bool pending_space = false;
    for (char32_t c : trimSpaces(decodeUtf8(text))) {
        if (isSpace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            result += U' ';
            pending_space = false;
        }
        result += c;
    }
    return encodeUtf8(result);
}

std::u32string decodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        char32_t cp = 0;

        if (lead < 0x80) {
            out += static_cast<char32_t>(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        // Continuation bytes actually present
        size_t valid = 0;
        while (valid < extra && i + 1 + valid < text.size()) {
            unsigned char cont = static_cast<unsigned char>(text[i + 1 + valid]);
            if ((cont & 0xC0) != 0x80) {
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
            ++valid;
        }

        if (valid < extra) {
            // Truncated or interrupted sequence: one replacement, resume after it
            out += REPLACEMENT;
            i += 1 + valid;
            continue;
        }

        out += cp;
        i += extra + 1;
    }
    return out;
}

std::string encodeUtf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

std::u32string toLower(const std::u32string& text) {
    if (text.empty()) {
        return text;
    }

    // Full, locale-independent mapping: İ becomes i + U+0307, final Σ becomes ς
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(text.data()), static_cast<int32_t>(text.size()));
    ustr.toLower(icu::Locale::getRoot());

    std::u32string out(static_cast<size_t>(ustr.countChar32()), U'\0');
    UErrorCode status = U_ZERO_ERROR;
    int32_t written = ustr.toUTF32(reinterpret_cast<UChar32*>(out.data()),
                                   static_cast<int32_t>(out.size()), status);
    if (U_FAILURE(status)) {
        return text;
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

std::u32string normalizeForMatch(const std::string& text) {
    return trimSpaces(toLower(decodeUtf8(text)));
}

} // namespace llt::core
