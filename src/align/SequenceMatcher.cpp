/**
 * SequenceMatcher.cpp - Ratcliff/Obershelp matching blocks and ratio
 */

#include "llt/align/SequenceMatcher.hpp"
#include "llt/core/TextUtil.hpp"

#include <algorithm>
#include <tuple>

namespace llt::align {

// Popular-element filtering only kicks in for sequences this long
constexpr size_t AUTOJUNK_MIN_LENGTH = 200;

SequenceMatcher::SequenceMatcher(std::u32string a, std::u32string b, bool autojunk)
    : a_(std::move(a))
    , b_(std::move(b))
{
    for (size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }

    if (autojunk && b_.size() >= AUTOJUNK_MIN_LENGTH) {
        const size_t ntest = b_.size() / 100 + 1;
        for (auto it = b2j_.begin(); it != b2j_.end();) {
            if (it->second.size() > ntest) {
                it = b2j_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

MatchingBlock SequenceMatcher::findLongestMatch(size_t alo, size_t ahi, size_t blo, size_t bhi) const {
    size_t besti = alo;
    size_t bestj = blo;
    size_t bestsize = 0;

    // j2len[j] = length of the match ending at a[i-1], b[j]
    std::unordered_map<size_t, size_t> j2len;
    std::unordered_map<size_t, size_t> newj2len;

    for (size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto found = b2j_.find(a_[i]);
        if (found != b2j_.end()) {
            for (size_t j : found->second) {
                if (j < blo) {
                    continue;
                }
                if (j >= bhi) {
                    break;
                }
                size_t k = 1;
                if (j > 0) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end()) {
                        k = prev->second + 1;
                    }
                }
                newj2len[j] = k;
                if (k > bestsize) {
                    besti = i - k + 1;
                    bestj = j - k + 1;
                    bestsize = k;
                }
            }
        }
        std::swap(j2len, newj2len);
    }

    // Popular elements never seed a match, but a match may still grow over them
    while (besti > alo && bestj > blo && a_[besti - 1] == b_[bestj - 1]) {
        --besti;
        --bestj;
        ++bestsize;
    }
    while (besti + bestsize < ahi && bestj + bestsize < bhi
           && a_[besti + bestsize] == b_[bestj + bestsize]) {
        ++bestsize;
    }

    return MatchingBlock{besti, bestj, bestsize};
}

std::vector<MatchingBlock> SequenceMatcher::getMatchingBlocks() const {
    const size_t la = a_.size();
    const size_t lb = b_.size();

    std::vector<std::tuple<size_t, size_t, size_t, size_t>> pending;
    pending.emplace_back(0, la, 0, lb);

    std::vector<MatchingBlock> blocks;
    while (!pending.empty()) {
        auto [alo, ahi, blo, bhi] = pending.back();
        pending.pop_back();

        MatchingBlock match = findLongestMatch(alo, ahi, blo, bhi);
        if (match.size == 0) {
            continue;
        }
        blocks.push_back(match);
        if (alo < match.a && blo < match.b) {
            pending.emplace_back(alo, match.a, blo, match.b);
        }
        if (match.a + match.size < ahi && match.b + match.size < bhi) {
            pending.emplace_back(match.a + match.size, ahi, match.b + match.size, bhi);
        }
    }

    std::sort(blocks.begin(), blocks.end(), [](const MatchingBlock& x, const MatchingBlock& y) {
        return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
    });

    // Merge blocks that touch end to start
    std::vector<MatchingBlock> merged;
    MatchingBlock current;
    for (const auto& block : blocks) {
        if (current.a + current.size == block.a && current.b + current.size == block.b) {
            current.size += block.size;
        } else {
            if (current.size > 0) {
                merged.push_back(current);
            }
            current = block;
        }
    }
    if (current.size > 0) {
        merged.push_back(current);
    }

    merged.push_back(MatchingBlock{la, lb, 0});
    return merged;
}

double SequenceMatcher::ratio() const {
    const size_t total = a_.size() + b_.size();
    if (total == 0) {
        return 1.0;
    }
    size_t matches = 0;
    for (const auto& block : getMatchingBlocks()) {
        matches += block.size;
    }
    return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
}

double similarityRatio(const std::string& a, const std::string& b) {
    return SequenceMatcher(core::decodeUtf8(a), core::decodeUtf8(b)).ratio();
}

} // namespace llt::align
