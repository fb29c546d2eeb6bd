#pragma once

#include <stdexcept>
#include <string>

namespace beamdec {

// ─── Decode Errors ─────────────────────────────────────────────
// Every failure surfaced by the decoding core derives from DecodeError,
// so callers that translate many inputs can catch one type per item.

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Rejected configuration or input. Raised before any oracle call.
class InvalidArgument : public DecodeError {
public:
    explicit InvalidArgument(const std::string& message)
        : DecodeError("invalid argument: " + message) {}
};

/// The encoder or decoder oracle failed or returned a malformed result.
class OracleFailure : public DecodeError {
public:
    explicit OracleFailure(const std::string& message)
        : DecodeError("oracle failure: " + message) {}
};

/// The decoder returned a distribution without positive, finite mass.
class EmptyVocabularyDistribution : public DecodeError {
public:
    explicit EmptyVocabularyDistribution(const std::string& message)
        : DecodeError("empty vocabulary distribution: " + message) {}
};

/// A CancellationToken fired between rounds.
class DecodeCancelled : public DecodeError {
public:
    explicit DecodeCancelled(const std::string& message)
        : DecodeError("decode cancelled: " + message) {}
};

} // namespace beamdec
