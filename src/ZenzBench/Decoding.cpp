#include "ZenzBench/Decoding.hpp"

#include <algorithm>
#include <sstream>

namespace zenzbench {

namespace {

std::string format_ids(const std::vector<int>& ids) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ids[i];
    }
    oss << ']';
    return oss.str();
}

std::string failure_prefix(const char* tag, const DecodeOptions& options) {
    std::string prefix(tag);
    if (!options.variant_name.empty()) {
        prefix += " " + options.variant_name;
    }
    return prefix;
}

// Fixed-width float window for the stateless single-shot mode; ids past the
// window are dropped and the rest is zero padded.
TokenTensor window_input(const std::vector<int>& ids, const DecodeOptions& options, LogSink& log) {
    auto window = TokenTensor::create(1, options.predict_window, ScalarType::Float32);
    if (!window) {
        throw InferenceError("could not allocate [1, " + std::to_string(options.predict_window) + "] input");
    }
    if (ids.size() > options.predict_window && options.verbose) {
        log.write("[Stateless Predict] prompt of " + std::to_string(ids.size()) +
                  " tokens truncated to " + std::to_string(options.predict_window));
    }
    const std::size_t count = std::min(ids.size(), options.predict_window);
    for (std::size_t i = 0; i < count; ++i) {
        (*window)[i] = ids[i];
    }
    return *window;
}

} // namespace

std::string strip_pad_marker(std::string text, const std::string& marker) {
    if (marker.empty()) {
        return text;
    }
    // Rescan from the start: erasing one marker can join the halves of another.
    for (auto pos = text.find(marker); pos != std::string::npos; pos = text.find(marker)) {
        text.erase(pos, marker.size());
    }
    return text;
}

namespace detail {

TokenTensor token_row(const std::vector<int>& ids, ScalarType type) {
    auto tensor = TokenTensor::create(1, ids.size(), type);
    if (!tensor) {
        throw InferenceError("could not allocate [1, " + std::to_string(ids.size()) + "] input");
    }
    for (std::size_t i = 0; i < ids.size(); ++i) {
        (*tensor)[i] = ids[i];
    }
    return *tensor;
}

TokenTensor ones_row(std::size_t length) {
    auto mask = TokenTensor::create(1, length);
    if (!mask) {
        throw InferenceError("could not allocate [1, " + std::to_string(length) + "] attention mask");
    }
    for (std::size_t i = 0; i < length; ++i) {
        (*mask)[i] = 1;
    }
    return *mask;
}

std::vector<int> stateful_step_input(const std::vector<int>& sequence, std::size_t step) {
    if (step == 0 || sequence.empty()) {
        return sequence;
    }
    return {sequence.back()};
}

int last_position_argmax(const ScoreTensor& scores, LogSink& log) {
    const auto last = static_cast<std::ptrdiff_t>(scores.time_size()) - 1;
    return argmax_row(scores, 0, last, &log);
}

std::optional<std::string> run_greedy(const std::string& text,
                                      const Tokenizer& tokenizer,
                                      const DecodeOptions& options,
                                      LogSink& log,
                                      const char* tag,
                                      const NextToken& next_token) {
    std::vector<int> sequence = tokenizer.encode(text);
    if (options.verbose) {
        log.write(std::string(tag) + " inputIDs: " + text + " " + format_ids(sequence));
    }

    for (std::size_t step = 0; sequence.size() < options.max_sequence_length; ++step) {
        int next = 0;
        try {
            next = next_token(sequence, step);
        } catch (const std::exception& e) {
            log.write(failure_prefix(tag, options) + " step " + std::to_string(step) + " failed: " + e.what());
            return std::nullopt;
        }

        if (options.verbose) {
            log.write(std::string(tag) + " step seqLen=" + std::to_string(sequence.size()) +
                      ", nextTokenID=" + std::to_string(next) +
                      ", tokenText=" + tokenizer.decode({next}));
        }
        if (next == options.eos_token_id) {
            break;
        }
        sequence.push_back(next);
    }

    return strip_pad_marker(tokenizer.decode(sequence), options.pad_marker);
}

std::vector<std::string> run_single_shot(const std::string& text,
                                         const Tokenizer& tokenizer,
                                         const DecodeOptions& options,
                                         LogSink& log,
                                         const char* tag,
                                         const std::function<ScoreTensor(const std::vector<int>&)>& infer) {
    const std::vector<int> ids = tokenizer.encode(text);
    if (options.verbose) {
        log.write(std::string(tag) + " inputIDs: " + text + " " + format_ids(ids));
    }

    ScoreTensor scores;
    try {
        scores = infer(ids);
    } catch (const std::exception& e) {
        log.write(failure_prefix(tag, options) + " failed: " + e.what());
        return {};
    }

    std::vector<std::string> texts;
    for (const auto& row : argmax_all_rows(scores, &log)) {
        if (options.verbose) {
            log.write(std::string(tag) + " predictedTokenIDs: " + format_ids(row));
        }
        texts.push_back(strip_pad_marker(tokenizer.decode(row), options.pad_marker));
    }
    return texts;
}

} // namespace detail

std::vector<std::string> predict(const std::string& text,
                                 StatelessPredictor& model,
                                 const Tokenizer& tokenizer,
                                 const DecodeOptions& options,
                                 LogSink& log) {
    return detail::run_single_shot(text, tokenizer, options, log, "[Stateless Predict][Sync]",
        [&](const std::vector<int>& ids) { return model.logits(window_input(ids, options, log)); });
}

std::future<std::vector<std::string>> predict_async(const std::string& text,
                                                    StatelessPredictor& model,
                                                    const Tokenizer& tokenizer,
                                                    DecodeOptions options,
                                                    LogSink& log) {
    return std::async(std::launch::async, [text, &model, &tokenizer, options = std::move(options), &log]() {
        return detail::run_single_shot(text, tokenizer, options, log, "[Stateless Predict][Async]",
            [&](const std::vector<int>& ids) {
                return model.logits_async(window_input(ids, options, log)).get();
            });
    });
}

std::optional<std::string> greedy_predict(const std::string& text,
                                          StatelessPredictor& model,
                                          const Tokenizer& tokenizer,
                                          const DecodeOptions& options,
                                          LogSink& log) {
    return detail::run_greedy(text, tokenizer, options, log, "[Stateless Greedy][Sync]",
        [&](const std::vector<int>& sequence, std::size_t) {
            const auto scores = model.logits(detail::token_row(sequence));
            return argmax_row(scores, 0, static_cast<std::ptrdiff_t>(sequence.size()) - 1, &log);
        });
}

std::future<std::optional<std::string>> greedy_predict_async(const std::string& text,
                                                             StatelessPredictor& model,
                                                             const Tokenizer& tokenizer,
                                                             DecodeOptions options,
                                                             LogSink& log) {
    return std::async(std::launch::async, [text, &model, &tokenizer, options = std::move(options), &log]() {
        return detail::run_greedy(text, tokenizer, options, log, "[Stateless Greedy][Async]",
            [&](const std::vector<int>& sequence, std::size_t) {
                const auto scores = model.logits_async(detail::token_row(sequence)).get();
                return argmax_row(scores, 0, static_cast<std::ptrdiff_t>(sequence.size()) - 1, &log);
            });
    });
}

} // namespace zenzbench
