/**
 * LyricsAligner.cpp - Forward-only fuzzy matching against lyric lines
 */

#include "llt/align/LyricsAligner.hpp"
#include "llt/align/SequenceMatcher.hpp"
#include "llt/core/TextUtil.hpp"
#include "llt/Errors.hpp"

#include <algorithm>
#include <iostream>

namespace llt::align {

LyricsAligner::LyricsAligner(std::vector<ReferenceLine> lines)
    : lines_(std::move(lines))
{
    normalized_.reserve(lines_.size());
    for (const auto& line : lines_) {
        normalized_.push_back(core::toLower(core::decodeUtf8(line.original)));
    }
}

std::optional<LyricsAligner::Candidate> LyricsAligner::scoreFrom(
    size_t start, const std::u32string& transcript) const
{
    std::optional<Candidate> best;
    for (size_t i = start; i < normalized_.size(); ++i) {
        double ratio = SequenceMatcher(normalized_[i], transcript).ratio();
        // Strictly greater: on ties the earliest line wins
        if (!best || ratio > best->ratio) {
            best = Candidate{i, ratio};
        }
    }
    return best;
}

std::optional<LyricsAligner::Candidate> LyricsAligner::bestCandidate(const std::string& transcript) const {
    std::u32string normalized = core::normalizeForMatch(transcript);
    if (normalized.empty()) {
        return std::nullopt;
    }
    return scoreFrom(static_cast<size_t>(std::max(cursor_, 0L)), normalized);
}

std::optional<MatchResult> LyricsAligner::align(const std::string& transcript, double min_ratio) {
    std::u32string normalized = core::normalizeForMatch(transcript);
    if (normalized.empty()) {
        return std::nullopt;
    }

    auto best = scoreFrom(static_cast<size_t>(std::max(cursor_, 0L)), normalized);

    if (verbose_) {
        if (best) {
            std::cout << "[LyricsAligner] \"" << transcript << "\" -> line " << best->index
                      << " (ratio " << best->ratio << ", cursor " << cursor_ << ")" << std::endl;
        } else {
            std::cout << "[LyricsAligner] \"" << transcript << "\" -> no lines left" << std::endl;
        }
    }

    if (!best || best->ratio < min_ratio) {
        return std::nullopt;
    }

    // Re-hearing the current line (or anything before it) is not progress
    if (static_cast<long>(best->index) <= cursor_) {
        return std::nullopt;
    }

    cursor_ = static_cast<long>(best->index);

    const ReferenceLine& line = lines_[best->index];
    return MatchResult{line.index, line.original, line.translation};
}

std::vector<ReferenceLine> buildReferenceLines(const std::vector<std::string>& lyrics,
                                               const std::vector<std::string>& translations)
{
    if (lyrics.size() != translations.size()) {
        std::cerr << "[LyricsAligner] Warning: " << lyrics.size() << " lyric lines but "
                  << translations.size() << " translations, keeping the first "
                  << std::min(lyrics.size(), translations.size()) << std::endl;
    }

    const size_t count = std::min(lyrics.size(), translations.size());
    if (count == 0) {
        throw SetupError("no lyric lines to follow");
    }

    std::vector<ReferenceLine> lines;
    lines.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        lines.push_back(ReferenceLine{i, lyrics[i], translations[i]});
    }
    return lines;
}

} // namespace llt::align
