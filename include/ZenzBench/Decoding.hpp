#pragma once

#include "ZenzBench/Engine.hpp"
#include "ZenzBench/LogSink.hpp"
#include "ZenzBench/ScoreReader.hpp"
#include "ZenzBench/Tokenizer.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zenzbench {

struct DecodeOptions {
    int eos_token_id = 3;
    std::size_t max_sequence_length = 128;
    /// Width of the float input window used by stateless single-shot predict.
    std::size_t predict_window = 16;
    /// Removed from every decoded output.
    std::string pad_marker = "[PAD]";
    /// Per-step traces.
    bool verbose = false;
    /// Debug name of the engine being driven, used in failure messages.
    std::string variant_name;
};

[[nodiscard]] std::string strip_pad_marker(std::string text, const std::string& marker);

// ---- stateless engines ----
//
// Greedy generation re-encodes the whole sequence each step and stops on the
// end-of-sequence id (not appended) or at max_sequence_length. Any engine or
// allocation failure is logged and ends the generation with std::nullopt.
//
// Single-shot predict sends one fixed-width window and returns the decoded
// per-position argmax for each batch row; failures return an empty list.
//
// The async forms run on a worker thread and await the engine's async call
// at each step. Every reference argument must outlive the returned future.

std::vector<std::string> predict(const std::string& text,
                                 StatelessPredictor& model,
                                 const Tokenizer& tokenizer,
                                 const DecodeOptions& options,
                                 LogSink& log);

std::future<std::vector<std::string>> predict_async(const std::string& text,
                                                    StatelessPredictor& model,
                                                    const Tokenizer& tokenizer,
                                                    DecodeOptions options,
                                                    LogSink& log);

std::optional<std::string> greedy_predict(const std::string& text,
                                          StatelessPredictor& model,
                                          const Tokenizer& tokenizer,
                                          const DecodeOptions& options,
                                          LogSink& log);

std::future<std::optional<std::string>> greedy_predict_async(const std::string& text,
                                                             StatelessPredictor& model,
                                                             const Tokenizer& tokenizer,
                                                             DecodeOptions options,
                                                             LogSink& log);

namespace detail {

/// Returns the next token for the current sequence; `step` counts from 0.
using NextToken = std::function<int(const std::vector<int>& sequence, std::size_t step)>;

std::optional<std::string> run_greedy(const std::string& text,
                                      const Tokenizer& tokenizer,
                                      const DecodeOptions& options,
                                      LogSink& log,
                                      const char* tag,
                                      const NextToken& next_token);

/// Encodes, runs `infer` once and decodes every row of its scores.
std::vector<std::string> run_single_shot(const std::string& text,
                                         const Tokenizer& tokenizer,
                                         const DecodeOptions& options,
                                         LogSink& log,
                                         const char* tag,
                                         const std::function<ScoreTensor(const std::vector<int>&)>& infer);

/// [1, n] int32 tensor of `ids`. Throws InferenceError when it cannot be built.
TokenTensor token_row(const std::vector<int>& ids, ScalarType type = ScalarType::Int32);
/// [1, n] attention mask of ones.
TokenTensor ones_row(std::size_t length);

/// Input for stateful step `step`: the whole sequence first, then only the newest token.
std::vector<int> stateful_step_input(const std::vector<int>& sequence, std::size_t step);

int last_position_argmax(const ScoreTensor& scores, LogSink& log);

} // namespace detail

// ---- stateful engines ----
//
// `Model` is one of the concrete stateful engine types. Each generation owns
// a fresh DecodingSession that is discarded when the call returns.

template<typename Model>
std::vector<std::string> predict_stateful(const std::string& text,
                                          const Model& model,
                                          const Tokenizer& tokenizer,
                                          const DecodeOptions& options,
                                          LogSink& log) {
    return detail::run_single_shot(text, tokenizer, options, log, "[Stateful Predict]",
        [&](const std::vector<int>& ids) {
            auto session = model.make_session();
            return model.predict(detail::token_row(ids), detail::ones_row(ids.size()), session);
        });
}

template<typename Model>
std::optional<std::string> greedy_predict_stateful(const std::string& text,
                                                   const Model& model,
                                                   const Tokenizer& tokenizer,
                                                   const DecodeOptions& options,
                                                   LogSink& log) {
    auto session = model.make_session();
    return detail::run_greedy(text, tokenizer, options, log, "[Stateful Greedy][Sync]",
        [&](const std::vector<int>& sequence, std::size_t step) {
            const auto ids = detail::stateful_step_input(sequence, step);
            const auto scores = model.predict(detail::token_row(ids), detail::ones_row(ids.size()), session);
            return detail::last_position_argmax(scores, log);
        });
}

template<typename Model>
std::future<std::optional<std::string>> greedy_predict_stateful_async(const std::string& text,
                                                                      const Model& model,
                                                                      const Tokenizer& tokenizer,
                                                                      DecodeOptions options,
                                                                      LogSink& log) {
    return std::async(std::launch::async, [text, &model, &tokenizer, options = std::move(options), &log]() {
        auto session = model.make_session();
        return detail::run_greedy(text, tokenizer, options, log, "[Stateful Greedy][Async]",
            [&](const std::vector<int>& sequence, std::size_t step) {
                const auto ids = detail::stateful_step_input(sequence, step);
                const auto scores = model.predict_async(detail::token_row(ids),
                                                        detail::ones_row(ids.size()),
                                                        session).get();
                return detail::last_position_argmax(scores, log);
            });
    });
}

/// One throwaway single-token step on a fresh session. Failures are logged only.
template<typename Model>
void warm_up_stateful(const Model& model, const DecodeOptions& options, LogSink& log) {
    try {
        auto session = model.make_session();
        model.predict(detail::token_row({0}), detail::ones_row(1), session);
    } catch (const std::exception& e) {
        log.write("[Warmup] " + options.variant_name + " skipped: " + e.what());
    }
}

// Dispatch on whichever engine the handle holds.

inline std::vector<std::string> predict_stateful(const std::string& text,
                                                 const StatefulHandle& handle,
                                                 const Tokenizer& tokenizer,
                                                 const DecodeOptions& options,
                                                 LogSink& log) {
    return handle.with_model([&](const auto& model) {
        return predict_stateful(text, model, tokenizer, options, log);
    });
}

inline std::optional<std::string> greedy_predict_stateful(const std::string& text,
                                                          const StatefulHandle& handle,
                                                          const Tokenizer& tokenizer,
                                                          const DecodeOptions& options,
                                                          LogSink& log) {
    return handle.with_model([&](const auto& model) {
        return greedy_predict_stateful(text, model, tokenizer, options, log);
    });
}

inline std::future<std::optional<std::string>> greedy_predict_stateful_async(const std::string& text,
                                                                             const StatefulHandle& handle,
                                                                             const Tokenizer& tokenizer,
                                                                             DecodeOptions options,
                                                                             LogSink& log) {
    return handle.with_model([&](const auto& model) {
        return greedy_predict_stateful_async(text, model, tokenizer, options, log);
    });
}

inline void warm_up_stateful(const StatefulHandle& handle, const DecodeOptions& options, LogSink& log) {
    handle.with_model([&](const auto& model) { warm_up_stateful(model, options, log); });
}

} // namespace zenzbench
