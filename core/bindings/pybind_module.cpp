// PyBind11 bindings for the beamdec C++ core.
// Exposes configuration, hypotheses, the reference Markov oracle and
// beam/greedy decoding over Python callables.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBEAMDEC_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "decoding/errors.hpp"
#include "decoding/hypothesis.hpp"
#include "decoding/oracle.hpp"
#include "decoding/vocabulary.hpp"
#include "oracles/markov_oracle.hpp"
#include "search/beam_search.hpp"
#include "search/greedy_search.hpp"
#include "search/search_state.hpp"
#include "util/log.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

// Python objects travel through the engine as the opaque decoder state.
using PyState = beamdec::ValueState<py::object>;

// Decoder backed by a Python callable:
//   step(previous_token: int, state: object) -> (probs: list[float], new_state: object)
// Decoding from Python runs on the calling thread only, so the GIL is
// held for every step.
class PyDecoderOracle : public beamdec::DecoderOracle {
public:
    PyDecoderOracle(py::function fn, size_t vocab_size)
        : fn_(std::move(fn)), vocab_size_(vocab_size) {}

    beamdec::StepOutput step(beamdec::TokenId previous_token,
                             const beamdec::StatePtr& state) const override {
        const py::object& py_state = beamdec::stateValue<py::object>(state);
        py::tuple out = fn_(previous_token, py_state).cast<py::tuple>();
        if (out.size() != 2) {
            throw beamdec::OracleFailure("step() must return (probs, new_state)");
        }
        beamdec::StepOutput result;
        result.probs = out[0].cast<std::vector<double>>();
        result.state = beamdec::makeValueState<py::object>(out[1]);
        return result;
    }

    size_t vocabularySize() const override { return vocab_size_; }

private:
    py::function fn_;
    size_t vocab_size_;
};

beamdec::VocabularyConfig makeVocabulary(beamdec::TokenId start, beamdec::TokenId stop, size_t size) {
    beamdec::VocabularyConfig vocab;
    vocab.start_token_id = start;
    vocab.stop_token_id = stop;
    vocab.size = size;
    return vocab;
}

} // namespace

PYBIND11_MODULE(beamdec_bindings, m) {
    m.doc() = "beamdec C++ Core Bindings";

    // ── Errors ──
    auto decode_error = py::register_exception<beamdec::DecodeError>(m, "DecodeError");
    py::register_exception<beamdec::InvalidArgument>(m, "InvalidArgument", decode_error.ptr());
    py::register_exception<beamdec::OracleFailure>(m, "OracleFailure", decode_error.ptr());
    py::register_exception<beamdec::EmptyVocabularyDistribution>(
        m, "EmptyVocabularyDistribution", decode_error.ptr());
    py::register_exception<beamdec::DecodeCancelled>(m, "DecodeCancelled", decode_error.ptr());

    // ── VocabularyConfig ──
    py::class_<beamdec::VocabularyConfig>(m, "VocabularyConfig")
        .def(py::init<>())
        .def(py::init(&makeVocabulary),
             py::arg("start_token_id"), py::arg("stop_token_id"), py::arg("size") = 0)
        .def_readwrite("start_token_id", &beamdec::VocabularyConfig::start_token_id)
        .def_readwrite("stop_token_id", &beamdec::VocabularyConfig::stop_token_id)
        .def_readwrite("size", &beamdec::VocabularyConfig::size)
        .def("validate", &beamdec::VocabularyConfig::validate);

    // ── DecodeConfig ──
    py::class_<beamdec::DecodeConfig>(m, "DecodeConfig")
        .def(py::init<>())
        .def_readwrite("beam_width", &beamdec::DecodeConfig::beam_width)
        .def_readwrite("max_steps", &beamdec::DecodeConfig::max_steps)
        .def_readwrite("expansion_threads", &beamdec::DecodeConfig::expansion_threads)
        .def_readwrite("max_input_length", &beamdec::DecodeConfig::max_input_length)
        .def_readwrite("vocabulary", &beamdec::DecodeConfig::vocabulary)
        .def("validate", &beamdec::DecodeConfig::validate);

    // ── Hypothesis ──
    py::class_<beamdec::Hypothesis>(m, "Hypothesis")
        .def(py::init<>())
        .def_readonly("id", &beamdec::Hypothesis::id)
        .def_readonly("token_sequence", &beamdec::Hypothesis::token_sequence)
        .def_readonly("score", &beamdec::Hypothesis::score)
        .def_readonly("is_live", &beamdec::Hypothesis::is_live)
        .def("length", &beamdec::Hypothesis::length);

    // ── DecodeResult ──
    py::class_<beamdec::DecodeResult>(m, "DecodeResult")
        .def(py::init<>())
        .def_readonly("best", &beamdec::DecodeResult::best)
        .def_readonly("final_beam", &beamdec::DecodeResult::final_beam)
        .def_readonly("rounds", &beamdec::DecodeResult::rounds)
        .def_readonly("oracle_calls", &beamdec::DecodeResult::oracle_calls)
        .def_readonly("elapsed_seconds", &beamdec::DecodeResult::elapsed_seconds)
        .def_readonly("all_finished", &beamdec::DecodeResult::all_finished);

    // ── MarkovDecoderOracle ──
    py::class_<beamdec::MarkovDecoderOracle>(m, "MarkovDecoderOracle")
        .def(py::init<size_t, double>(), py::arg("vocab_size"), py::arg("context_weight") = 0.0)
        .def("set_transition", &beamdec::MarkovDecoderOracle::setTransition)
        .def("set_step_transition", &beamdec::MarkovDecoderOracle::setStepTransition)
        .def("set_fallback", &beamdec::MarkovDecoderOracle::setFallback)
        .def("vocabulary_size", &beamdec::MarkovDecoderOracle::vocabularySize)
        .def("beam_decode", [](const beamdec::MarkovDecoderOracle& self,
                               const beamdec::VocabularyConfig& vocab,
                               int beam_width, int max_steps) {
            beamdec::BeamSearch search(self, vocab);
            return search.decodeDetailed(beamdec::MarkovDecoderOracle::initialState(),
                                         beam_width, max_steps);
        }, py::arg("vocabulary"), py::arg("beam_width"), py::arg("max_steps"));

    m.def("default_decode_config", []() {
        return beamdec::DecodeConfig{};
    });

    m.def("beam_decode", [](py::function step, py::object initial_state,
                            const beamdec::DecodeConfig& config) {
        config.validate();
        PyDecoderOracle oracle(std::move(step), config.vocabulary.size);
        beamdec::BeamSearch search(oracle, config.vocabulary);
        return search.decodeDetailed(beamdec::makeValueState<py::object>(initial_state),
                                     config.beam_width, config.max_steps);
    }, py::arg("step"), py::arg("initial_state"), py::arg("config"));

    m.def("greedy_decode", [](py::function step, py::object initial_state,
                              const beamdec::DecodeConfig& config) {
        config.validate();
        PyDecoderOracle oracle(std::move(step), config.vocabulary.size);
        beamdec::GreedySearch search(oracle, config.vocabulary);
        return search.decodeDetailed(beamdec::makeValueState<py::object>(initial_state),
                                     config.max_steps);
    }, py::arg("step"), py::arg("initial_state"), py::arg("config"));

    // ── Logging ──
    py::enum_<beamdec::LogLevel>(m, "LogLevel")
        .value("DEBUG", beamdec::LogLevel::Debug)
        .value("INFO", beamdec::LogLevel::Info)
        .value("WARN", beamdec::LogLevel::Warn)
        .value("ERROR", beamdec::LogLevel::Error)
        .value("NONE", beamdec::LogLevel::None);

    m.def("set_log_level", &beamdec::setLogLevel, py::arg("level"));

    // callback(level: LogLevel, message: str); None restores the stderr sink.
    m.def("set_log_callback", [](py::object callback) {
        if (callback.is_none()) {
            beamdec::setLogCallback(nullptr);
            return;
        }
        // The sink is copied outside the GIL, so only the shared_ptr is
        // copied; the Python reference is released with the GIL held.
        std::shared_ptr<py::function> fn(
            new py::function(callback.cast<py::function>()),
            [](py::function* f) {
                py::gil_scoped_acquire gil;
                delete f;
            });
        beamdec::setLogCallback([fn](beamdec::LogLevel level, const std::string& text) {
            py::gil_scoped_acquire gil;
            try {
                (*fn)(level, text);
            } catch (py::error_already_set& e) {
                e.discard_as_unraisable("beamdec log callback");
            }
        });
    }, py::arg("callback"));

    // Drop a Python sink before the interpreter shuts down.
    m.add_object("_cleanup_log_callback", py::capsule([]() {
        beamdec::setLogCallback(nullptr);
    }));
}
