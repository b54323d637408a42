/**
 * LyricsAligner.hpp - Greedy, forward-only matching of transcripts to lyric lines
 */

#pragma once

#include "llt/Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llt::align {

/**
 * Holds the session's reference lines and a cursor at the last matched line.
 *
 * Every align() call scores the transcript against all lines from the cursor
 * onwards and accepts the best one only if it clears min_ratio and lies
 * strictly after the cursor. Lines at or before the cursor are never matched
 * again.
 *
 * Single writer: only one thread may call align().
 */
class LyricsAligner {
public:
    static constexpr double DEFAULT_MIN_RATIO = 0.45;
    static constexpr long NO_MATCH = -1;

    struct Candidate {
        size_t index = 0;
        double ratio = 0.0;
    };

    explicit LyricsAligner(std::vector<ReferenceLine> lines);

    std::optional<MatchResult> align(const std::string& transcript,
                                     double min_ratio = DEFAULT_MIN_RATIO);

    /// Best scoring line at or after the cursor. Does not move the cursor.
    std::optional<Candidate> bestCandidate(const std::string& transcript) const;

    /// Index of the last accepted line, NO_MATCH before the first match.
    long cursor() const { return cursor_; }

    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }
    const std::vector<ReferenceLine>& lines() const { return lines_; }

    /// Log every transcript with its best candidate.
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    std::optional<Candidate> scoreFrom(size_t start, const std::u32string& transcript) const;

    std::vector<ReferenceLine> lines_;
    std::vector<std::u32string> normalized_;
    long cursor_ = NO_MATCH;
    bool verbose_ = false;
};

/**
 * Pair lyric lines with translations by position.
 * Lists of different length are truncated to the shorter one (with a warning).
 * @throws SetupError if no pair can be formed
 */
std::vector<ReferenceLine> buildReferenceLines(const std::vector<std::string>& lyrics,
                                               const std::vector<std::string>& translations);

} // namespace llt::align
