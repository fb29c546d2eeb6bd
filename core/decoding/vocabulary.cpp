#include "decoding/vocabulary.hpp"
#include "decoding/errors.hpp"

#include <string>

namespace beamdec {

void VocabularyConfig::validate() const {
    if (start_token_id < 0) {
        throw InvalidArgument("start_token_id must be non-negative, got " +
                              std::to_string(start_token_id));
    }
    if (stop_token_id < 0) {
        throw InvalidArgument("stop_token_id must be non-negative, got " +
                              std::to_string(stop_token_id));
    }
    if (start_token_id == stop_token_id) {
        throw InvalidArgument("start and stop tokens must differ");
    }
    if (size > 0) {
        if (static_cast<size_t>(start_token_id) >= size) {
            throw InvalidArgument("start_token_id " + std::to_string(start_token_id) +
                                  " outside vocabulary of size " + std::to_string(size));
        }
        if (static_cast<size_t>(stop_token_id) >= size) {
            throw InvalidArgument("stop_token_id " + std::to_string(stop_token_id) +
                                  " outside vocabulary of size " + std::to_string(size));
        }
    }
}

} // namespace beamdec
