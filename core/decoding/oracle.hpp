#pragma once

#include "decoding/errors.hpp"
#include "decoding/vocabulary.hpp"

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace beamdec {

// ─── Decoder State ─────────────────────────────────────────────
// Opaque model state. The decoding core never looks inside; it only
// hands a hypothesis's state back to the oracle that produced it.
// States are immutable once produced, so children of one expansion
// may hold the same pointer.

class DecoderState {
public:
    virtual ~DecoderState() = default;
};

using StatePtr = std::shared_ptr<const DecoderState>;

/// Convenience state that wraps a single value.
template <typename T>
class ValueState : public DecoderState {
public:
    explicit ValueState(T value) : value_(std::move(value)) {}
    const T& value() const { return value_; }

private:
    T value_;
};

template <typename T>
StatePtr makeValueState(T value) {
    return std::make_shared<ValueState<T>>(std::move(value));
}

/// Unwrap a ValueState<T>. Throws OracleFailure if the state is null
/// or was produced by a different oracle.
template <typename T>
const T& stateValue(const StatePtr& state) {
    if (!state) {
        throw OracleFailure("null decoder state");
    }
    auto* typed = dynamic_cast<const ValueState<T>*>(state.get());
    if (!typed) {
        throw OracleFailure("decoder state has unexpected type");
    }
    return typed->value();
}

// ─── Decoder Oracle ────────────────────────────────────────────
// One decoder step: previous token + state -> next-token distribution
// + new state. `probs[i]` is the probability of token id i.

struct StepOutput {
    std::vector<double> probs;
    StatePtr state;
};

class DecoderOracle {
public:
    virtual ~DecoderOracle() = default;

    virtual StepOutput step(TokenId previous_token, const StatePtr& state) const = 0;

    /// Target vocabulary size, or 0 if the oracle does not declare one.
    virtual size_t vocabularySize() const { return 0; }
};

/// Call `decoder.step` and check its output. Exceptions escaping the
/// oracle become OracleFailure; a null state is an OracleFailure; the
/// distribution is checked with validateDistribution().
StepOutput checkedStep(const DecoderOracle& decoder,
                       TokenId previous_token,
                       const StatePtr& state,
                       size_t expected_size);

// ─── Encoder Oracle ────────────────────────────────────────────

class EncoderOracle {
public:
    virtual ~EncoderOracle() = default;

    virtual StatePtr encode(const std::vector<TokenId>& input_tokens) const = 0;
};

// ─── Function adapters ─────────────────────────────────────────

using StepFn = std::function<StepOutput(TokenId, const StatePtr&)>;
using EncodeFn = std::function<StatePtr(const std::vector<TokenId>&)>;

class FunctionDecoderOracle : public DecoderOracle {
public:
    explicit FunctionDecoderOracle(StepFn fn, size_t vocab_size = 0);

    StepOutput step(TokenId previous_token, const StatePtr& state) const override;
    size_t vocabularySize() const override { return vocab_size_; }

private:
    StepFn fn_;
    size_t vocab_size_;
};

class FunctionEncoderOracle : public EncoderOracle {
public:
    explicit FunctionEncoderOracle(EncodeFn fn);

    StatePtr encode(const std::vector<TokenId>& input_tokens) const override;

private:
    EncodeFn fn_;
};

} // namespace beamdec
