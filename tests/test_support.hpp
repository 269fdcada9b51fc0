/**
 * @file test_support.hpp
 * @brief Shared fixtures for the ZenzBench unit tests.
 *
 * A small fixed-vocabulary tokenizer, scripted stateless and stateful
 * engines and a deterministic parameter set for the reference recurrent
 * model.
 */

#pragma once

#include "ZenzBench/Engine.hpp"
#include "ZenzBench/Tokenizer.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

namespace zenzbench::testing {

/// Ids: 0 <unk>, 1 <s>, 2 [PAD], 3 </s>, 4.. single letters a-h.
class LetterTokenizer : public Tokenizer {
public:
    LetterTokenizer() {
        tokens_ = {"<unk>", "<s>", "[PAD]", "</s>", "a", "b", "c", "d", "e", "f", "g", "h"};
        eos_id_ = 3;
        pad_id_ = 2;
    }

    std::vector<int> encode(const std::string& text) const override {
        std::vector<int> ids;
        std::size_t pos = 0;
        while (pos < text.size()) {
            int best = 0;
            std::size_t best_len = 1;
            for (std::size_t id = 1; id < tokens_.size(); ++id) {
                const auto& token = tokens_[id];
                if (token.size() >= best_len && text.compare(pos, token.size(), token) == 0) {
                    best = static_cast<int>(id);
                    best_len = token.size();
                }
            }
            ids.push_back(best);
            pos += best_len;
        }
        return ids;
    }

    std::string decode(const std::vector<int>& ids) const override {
        std::string out;
        for (const int id : ids) {
            if (id > 0 && static_cast<std::size_t>(id) < tokens_.size()) {
                out += tokens_[static_cast<std::size_t>(id)];
            }
        }
        return out;
    }

    int token_to_id(const std::string& token) const override {
        for (std::size_t id = 0; id < tokens_.size(); ++id) {
            if (tokens_[id] == token) return static_cast<int>(id);
        }
        return -1;
    }

    int vocab_size() const { return static_cast<int>(tokens_.size()); }

private:
    std::vector<std::string> tokens_;
};

/**
 * Stateless engine whose call k puts the top score of every position on
 * script[k] (the last entry repeats). Throws InferenceError on call
 * `fail_on_call`.
 */
class ScriptedPredictor : public StatelessPredictor {
public:
    ScriptedPredictor(int vocab, std::vector<int> script, int fail_on_call = -1)
        : vocab_(vocab), script_(std::move(script)), fail_on_call_(fail_on_call) {}

    ScoreTensor logits(const TokenTensor& input_ids) override {
        const int call = calls_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lengths_.push_back(input_ids.length());
        }
        if (call == fail_on_call_) {
            throw InferenceError("scripted failure");
        }
        const std::size_t index = std::min(static_cast<std::size_t>(call), script_.size() - 1);
        const int winner = script_[index];

        const std::size_t batch = input_ids.batch_size();
        const std::size_t length = input_ids.length();
        const auto vocab = static_cast<std::size_t>(vocab_);
        std::vector<float> values(batch * length * vocab, 0.0f);
        for (std::size_t row = 0; row < batch * length; ++row) {
            values[row * vocab + static_cast<std::size_t>(winner)] = 1.0f;
        }
        return ScoreTensor::from_floats({batch, length, vocab}, values, ScalarType::Float32);
    }

    int calls() const { return calls_.load(); }

    std::vector<std::size_t> lengths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lengths_;
    }

private:
    int vocab_;
    std::vector<int> script_;
    int fail_on_call_;
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::size_t> lengths_;
};

/**
 * Stateful engine for the decoding templates: call k scores script[k] highest
 * at the single returned position. Each session counts the tokens fed to it.
 * Throws InferenceError on call `fail_on_call`; `make_session` throws when
 * `fail_sessions` is set.
 */
class ScriptedStatefulModel {
public:
    struct Session {
        std::size_t position = 0;
    };

    ScriptedStatefulModel(int vocab, std::vector<int> script, int fail_on_call = -1)
        : vocab_(vocab), script_(std::move(script)), fail_on_call_(fail_on_call) {}

    Session make_session() const {
        if (fail_sessions) {
            throw InferenceError("scripted session failure");
        }
        return Session{};
    }

    ScoreTensor predict(const TokenTensor& input_ids, const TokenTensor&, Session& session) const {
        const int call = calls_++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lengths_.push_back(input_ids.length());
        }
        if (call == fail_on_call_) {
            throw InferenceError("scripted failure");
        }
        session.position += input_ids.length();
        const std::size_t index = std::min(static_cast<std::size_t>(call), script_.size() - 1);
        const auto vocab = static_cast<std::size_t>(vocab_);
        std::vector<float> values(vocab, 0.0f);
        values[static_cast<std::size_t>(script_[index])] = 1.0f;
        return ScoreTensor::from_floats({1, 1, vocab}, values, ScalarType::Float32);
    }

    std::future<ScoreTensor> predict_async(const TokenTensor& input_ids, const TokenTensor& mask,
                                           Session& session) const {
        return std::async(std::launch::async, [this, input_ids, mask, &session]() {
            return predict(input_ids, mask, session);
        });
    }

    int calls() const { return calls_.load(); }

    std::vector<std::size_t> lengths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lengths_;
    }

    bool fail_sessions = false;

private:
    int vocab_;
    std::vector<int> script_;
    int fail_on_call_;
    mutable std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    mutable std::vector<std::size_t> lengths_;
};

/// Deterministic, well-spread parameters for the reference recurrent model.
inline RecurrentParameters make_parameters(int vocab, int hidden) {
    RecurrentParameters params;
    params.embedding.resize(vocab, hidden);
    params.recurrence.resize(hidden, hidden);
    params.bias.resize(hidden);
    for (int v = 0; v < vocab; ++v) {
        for (int h = 0; h < hidden; ++h) {
            params.embedding(v, h) = std::sin(0.9f * static_cast<float>(v + 1) + 1.7f * static_cast<float>(h));
        }
    }
    for (int r = 0; r < hidden; ++r) {
        for (int c = 0; c < hidden; ++c) {
            params.recurrence(r, c) = 0.5f * std::cos(1.3f * static_cast<float>(r) - 0.4f * static_cast<float>(c));
        }
        params.bias(r) = 0.05f * static_cast<float>(r % 3) - 0.05f;
    }
    return params;
}

/// Fresh empty directory under the system temp directory.
inline std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("zenzbench_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace zenzbench::testing
