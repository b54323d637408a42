/**
 * Transcriber.cpp - Segment joining shared by all engines
 */

#include "llt/stt/Transcriber.hpp"
#include "llt/core/TextUtil.hpp"

namespace llt::stt {

std::string joinSegments(const std::vector<TranscriptSegment>& segments) {
    std::string text;
    for (const auto& segment : segments) {
        std::string piece = core::trim(segment.text);
        if (piece.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += piece;
    }
    return text;
}

} // namespace llt::stt
