#include "search/search_state.hpp"
#include "decoding/errors.hpp"

#include <string>

namespace beamdec {

void DecodeConfig::validate() const {
    if (beam_width < 1) {
        throw InvalidArgument("beam_width must be >= 1, got " + std::to_string(beam_width));
    }
    if (max_steps < 1) {
        throw InvalidArgument("max_steps must be >= 1, got " + std::to_string(max_steps));
    }
    if (expansion_threads < 1) {
        throw InvalidArgument("expansion_threads must be >= 1, got " +
                              std::to_string(expansion_threads));
    }
    vocabulary.validate();
}

} // namespace beamdec
