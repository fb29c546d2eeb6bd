#pragma once

#include <cstddef>
#include <cstdint>

namespace beamdec {

using TokenId = int32_t;

// ─── Vocabulary Config ─────────────────────────────────────────
// Start and stop ids are fixed per target vocabulary and supplied by
// the caller; the decoder never derives them from text.

struct VocabularyConfig {
    TokenId start_token_id = 0;
    TokenId stop_token_id = 1;
    size_t size = 0;                // 0 = unknown, distribution length unchecked

    /// Throws InvalidArgument on negative ids, ids outside `size`,
    /// or start == stop.
    void validate() const;

    bool isStop(TokenId token) const { return token == stop_token_id; }
};

} // namespace beamdec
