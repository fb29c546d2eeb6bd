#include "decoding/oracle.hpp"
#include "decoding/distribution.hpp"
#include "decoding/errors.hpp"
#include "util/log.hpp"

#include <exception>
#include <utility>

namespace beamdec {

StepOutput checkedStep(const DecoderOracle& decoder,
                       TokenId previous_token,
                       const StatePtr& state,
                       size_t expected_size) {
    StepOutput out;
    try {
        out = decoder.step(previous_token, state);
    } catch (const OracleFailure&) {
        throw;
    } catch (const std::exception& e) {
        BEAMDEC_LOG_ERROR("decoder step failed after token %d: %s", previous_token, e.what());
        throw OracleFailure(e.what());
    } catch (...) {
        BEAMDEC_LOG_ERROR("decoder step failed after token %d: unknown error", previous_token);
        throw OracleFailure("unknown oracle error");
    }

    if (!out.state) {
        throw OracleFailure("decoder returned a null state");
    }
    validateDistribution(out.probs, expected_size);
    return out;
}

FunctionDecoderOracle::FunctionDecoderOracle(StepFn fn, size_t vocab_size)
    : fn_(std::move(fn)), vocab_size_(vocab_size) {
    if (!fn_) {
        throw InvalidArgument("decoder step function is empty");
    }
}

StepOutput FunctionDecoderOracle::step(TokenId previous_token, const StatePtr& state) const {
    return fn_(previous_token, state);
}

FunctionEncoderOracle::FunctionEncoderOracle(EncodeFn fn)
    : fn_(std::move(fn)) {
    if (!fn_) {
        throw InvalidArgument("encoder function is empty");
    }
}

StatePtr FunctionEncoderOracle::encode(const std::vector<TokenId>& input_tokens) const {
    return fn_(input_tokens);
}

} // namespace beamdec
