/**
 * SequenceMatcher.hpp - Ratcliff/Obershelp similarity on code point strings
 *
 * Finds the longest matching block, then recurses on the pieces to its left
 * and right. ratio() = 2*M / T where M is the total size of all matching
 * blocks and T the combined length of both strings.
 */

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace llt::align {

struct MatchingBlock {
    size_t a = 0;     // start in the first string
    size_t b = 0;     // start in the second string
    size_t size = 0;

    bool operator==(const MatchingBlock& other) const {
        return a == other.a && b == other.b && size == other.size;
    }
};

class SequenceMatcher {
public:
    /**
     * @param autojunk when b has 200+ elements, ignore elements occurring more
     *                 than 1 + len(b)/100 times as match seeds
     */
    SequenceMatcher(std::u32string a, std::u32string b, bool autojunk = true);

    /// Longest block with a[i..i+k) == b[j..j+k) inside the given ranges.
    MatchingBlock findLongestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi) const;

    /// Non-adjacent matching blocks in order, terminated by {len(a), len(b), 0}.
    std::vector<MatchingBlock> getMatchingBlocks() const;

    /// Similarity in [0, 1]. Two empty strings compare as 1.0.
    double ratio() const;

private:
    std::u32string a_;
    std::u32string b_;
    std::unordered_map<char32_t, std::vector<size_t>> b2j_;
};

/// ratio() for two UTF-8 strings, compared as code points.
double similarityRatio(const std::string& a, const std::string& b);

} // namespace llt::align
