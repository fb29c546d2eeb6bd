#include "translate/translator.hpp"
#include "decoding/errors.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <string>
#include <utility>

namespace beamdec {

Translator::Translator(const EncoderOracle& encoder,
                       const DecoderOracle& decoder,
                       DecodeConfig config)
    : encoder_(encoder),
      config_(std::move(config)),
      search_(decoder, config_.vocabulary) {
    config_.validate();
    search_.setExpansionThreads(config_.expansion_threads);
}

StatePtr Translator::encode(const std::vector<TokenId>& input_tokens) const {
    if (input_tokens.empty()) {
        throw InvalidArgument("input sequence is empty");
    }
    if (config_.max_input_length > 0 && input_tokens.size() > config_.max_input_length) {
        throw InvalidArgument("input has " + std::to_string(input_tokens.size()) +
                              " tokens, limit is " + std::to_string(config_.max_input_length));
    }

    StatePtr state;
    try {
        state = encoder_.encode(input_tokens);
    } catch (const OracleFailure&) {
        throw;
    } catch (const std::exception& e) {
        BEAMDEC_LOG_ERROR("encoder failed on %zu tokens: %s", input_tokens.size(), e.what());
        throw OracleFailure(e.what());
    } catch (...) {
        BEAMDEC_LOG_ERROR("encoder failed on %zu tokens: unknown error", input_tokens.size());
        throw OracleFailure("unknown oracle error");
    }
    if (!state) {
        throw OracleFailure("encoder returned a null state");
    }
    return state;
}

std::vector<TokenId> Translator::translate(const std::vector<TokenId>& input_tokens,
                                           const CancellationToken* cancel) const {
    return translateDetailed(input_tokens, cancel).best.token_sequence;
}

DecodeResult Translator::translateDetailed(const std::vector<TokenId>& input_tokens,
                                           const CancellationToken* cancel) const {
    StatePtr initial = encode(input_tokens);
    return search_.decodeDetailed(initial, config_.beam_width, config_.max_steps, cancel);
}

std::vector<BatchItemResult> Translator::translateBatch(
    const std::vector<std::vector<TokenId>>& inputs,
    int num_workers,
    const CancellationToken* cancel) const {
    if (num_workers < 1) {
        throw InvalidArgument("num_workers must be >= 1, got " + std::to_string(num_workers));
    }

    std::vector<BatchItemResult> results(inputs.size());

    auto run_one = [&](size_t i) {
        BatchItemResult& item = results[i];
        try {
            DecodeResult r = translateDetailed(inputs[i], cancel);
            item.tokens = std::move(r.best.token_sequence);
            item.score = r.best.score;
            item.ok = true;
        } catch (const DecodeError& e) {
            BEAMDEC_LOG_WARN("batch item %zu failed: %s", i, e.what());
            item.ok = false;
            item.error = e.what();
        }
    };

    size_t workers = std::min(static_cast<size_t>(num_workers), inputs.size());
    if (workers <= 1) {
        for (size_t i = 0; i < inputs.size(); i++) run_one(i);
    } else {
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (size_t w = 0; w < workers; w++) {
            futures.push_back(std::async(std::launch::async, [&, w]() {
                for (size_t i = w; i < inputs.size(); i += workers) run_one(i);
            }));
        }
        for (auto& f : futures) f.wait();
        for (auto& f : futures) f.get();
    }

    size_t failed = static_cast<size_t>(std::count_if(
        results.begin(), results.end(), [](const BatchItemResult& r) { return !r.ok; }));
    BEAMDEC_LOG_INFO("batch translated %zu inputs, %zu failed", inputs.size(), failed);
    return results;
}

} // namespace beamdec
