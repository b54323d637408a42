/**
 * BlockingQueue.cpp - Hand-off queue instantiations
 * Note: Most logic is in header (template class)
 */

#include "llt/core/BlockingQueue.hpp"
#include "llt/Types.hpp"

namespace llt::core {

// Explicit instantiation for the two pipeline channels
template class BlockingQueue<AudioChunk>;
template class BlockingQueue<MatchResult>;

} // namespace llt::core
