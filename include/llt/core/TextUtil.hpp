/**
 * TextUtil.hpp - Small string helpers shared by the lyrics and matching code
 */

#pragma once

#include <string>

namespace llt::core {

/// Strip leading/trailing Unicode whitespace (U+00A0, U+3000 and friends included).
std::string trim(const std::string& text);

/// Trim and replace every internal whitespace run with a single space.
std::string collapseWhitespace(const std::string& text);

/**
 * Decode UTF-8 to code points. An invalid byte, or a sequence cut short,
 * decodes to one U+FFFD and decoding resumes right after it.
 */
std::u32string decodeUtf8(const std::string& text);

std::string encodeUtf8(const std::u32string& text);

/// Unicode full lowercase mapping (root locale). May change the length.
std::u32string toLower(const std::u32string& text);

/// Lowercased, trimmed code points, the form used for line matching.
std::u32string normalizeForMatch(const std::string& text);

} // namespace llt::core
