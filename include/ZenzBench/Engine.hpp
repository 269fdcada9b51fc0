#pragma once

#include "ZenzBench/ScoreTensor.hpp"
#include "ZenzBench/Variants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace zenzbench {

/// Raised by an engine when one inference call cannot complete.
class InferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Engine that receives the full token window on every call and keeps no
 * memory between calls.
 */
class StatelessPredictor {
public:
    virtual ~StatelessPredictor() = default;

    /// [batch, time] ids in, [batch, time, vocab] scores out.
    virtual ScoreTensor logits(const TokenTensor& input_ids) = 0;

    /// Same call on a worker thread. The default forwards to logits().
    virtual std::future<ScoreTensor> logits_async(const TokenTensor& input_ids);
};

/// Float master copy of the reference recurrent model's parameters.
struct RecurrentParameters {
    Eigen::MatrixXf embedding;  ///< [vocab, hidden], tied with the output head
    Eigen::MatrixXf recurrence; ///< [hidden, hidden]
    Eigen::VectorXf bias;       ///< [hidden]

    /// Throws std::invalid_argument when the shapes disagree.
    void validate() const;
};

/// Per-row symmetric int8 matrix: row r is values.row(r) * scales(r).
struct QuantizedMatrix {
    using Values = Eigen::Matrix<std::int8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    Values values;
    Eigen::VectorXf scales;

    static QuantizedMatrix quantize(const Eigen::MatrixXf& source);

    [[nodiscard]] Eigen::VectorXf multiply(const Eigen::VectorXf& x) const;
    [[nodiscard]] Eigen::VectorXf row(Eigen::Index r) const;
};

/**
 * FP16 tier: weights held as IEEE half, arithmetic in float, scores
 * emitted as a 16-bit buffer.
 */
class Fp16Weights {
public:
    static constexpr ScalarType kScoreType = ScalarType::Float16;

    explicit Fp16Weights(const RecurrentParameters& params);

    [[nodiscard]] int vocab_size() const { return static_cast<int>(embedding_.rows()); }
    [[nodiscard]] int hidden_size() const { return static_cast<int>(embedding_.cols()); }

    /// tanh(W h + E[token] + b)
    [[nodiscard]] Eigen::VectorXf step(const Eigen::VectorXf& hidden, int token) const;
    /// E h
    [[nodiscard]] Eigen::VectorXf scores(const Eigen::VectorXf& hidden) const;

private:
    using HalfMatrix = Eigen::Matrix<Eigen::half, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    HalfMatrix embedding_;
    HalfMatrix recurrence_;
    Eigen::VectorXf bias_;
};

/// 8-bit tier: int8 weights with float row scales, scores emitted as F32.
class Int8Weights {
public:
    static constexpr ScalarType kScoreType = ScalarType::Float32;

    explicit Int8Weights(const RecurrentParameters& params);
    Int8Weights(QuantizedMatrix embedding, QuantizedMatrix recurrence, Eigen::VectorXf bias);

    [[nodiscard]] int vocab_size() const { return static_cast<int>(embedding_.values.rows()); }
    [[nodiscard]] int hidden_size() const { return static_cast<int>(embedding_.values.cols()); }

    [[nodiscard]] Eigen::VectorXf step(const Eigen::VectorXf& hidden, int token) const;
    [[nodiscard]] Eigen::VectorXf scores(const Eigen::VectorXf& hidden) const;

private:
    QuantizedMatrix embedding_;
    QuantizedMatrix recurrence_;
    Eigen::VectorXf bias_;
};

template<typename Weights>
class RecurrentStatelessModel : public StatelessPredictor {
public:
    explicit RecurrentStatelessModel(Weights weights) : weights_(std::move(weights)) {}

    ScoreTensor logits(const TokenTensor& input_ids) override {
        const std::size_t batch = input_ids.batch_size();
        const std::size_t length = input_ids.length();
        const auto vocab = static_cast<std::size_t>(weights_.vocab_size());

        std::vector<float> values(batch * length * vocab);
        for (std::size_t b = 0; b < batch; ++b) {
            Eigen::VectorXf hidden = Eigen::VectorXf::Zero(weights_.hidden_size());
            for (std::size_t t = 0; t < length; ++t) {
                const int token = input_ids.at(b, t);
                if (token < 0 || token >= weights_.vocab_size()) {
                    throw InferenceError("token id " + std::to_string(token) +
                                         " outside vocabulary of " + std::to_string(vocab));
                }
                hidden = weights_.step(hidden, token);
                const Eigen::VectorXf row = weights_.scores(hidden);
                std::copy(row.data(), row.data() + vocab, values.begin() + (b * length + t) * vocab);
            }
        }
        return ScoreTensor::from_floats({batch, length, vocab}, values, Weights::kScoreType);
    }

    [[nodiscard]] const Weights& weights() const { return weights_; }

private:
    Weights weights_;
};

template<typename Weights>
class RecurrentStatefulModel;

/**
 * Per-generation recurrent cache. Created by a stateful model, mutated by
 * every predict() call that receives it, never copied.
 */
class DecodingSession {
public:
    DecodingSession(const DecodingSession&) = delete;
    DecodingSession& operator=(const DecodingSession&) = delete;
    DecodingSession(DecodingSession&&) noexcept = default;
    DecodingSession& operator=(DecodingSession&&) noexcept = default;

    /// Number of tokens folded into the cache so far.
    [[nodiscard]] std::size_t position() const { return position_; }
    [[nodiscard]] const Eigen::VectorXf& hidden() const { return hidden_; }

private:
    template<typename Weights>
    friend class RecurrentStatefulModel;

    DecodingSession(const void* owner, int hidden_size)
        : owner_(owner), hidden_(Eigen::VectorXf::Zero(hidden_size)) {}

    const void* owner_;
    Eigen::VectorXf hidden_;
    std::size_t position_ = 0;
};

/**
 * Engine that keeps decoding context in a DecodingSession and only needs the
 * tokens the session has not seen yet. Scores come back for the newest
 * position only, shaped [1, 1, vocab].
 */
template<typename Weights>
class RecurrentStatefulModel {
public:
    explicit RecurrentStatefulModel(Weights weights) : weights_(std::move(weights)) {}

    [[nodiscard]] DecodingSession make_session() const {
        return DecodingSession(this, weights_.hidden_size());
    }

    ScoreTensor predict(const TokenTensor& input_ids,
                        const TokenTensor& attention_mask,
                        DecodingSession& session) const {
        if (session.owner_ != this) {
            throw InferenceError("decoding session belongs to a different model");
        }
        if (input_ids.batch_size() != 1) {
            throw InferenceError("stateful model decodes one sequence at a time");
        }
        if (attention_mask.batch_size() != input_ids.batch_size() ||
            attention_mask.length() != input_ids.length()) {
            throw InferenceError("attention mask shape does not match input ids");
        }

        // Work on a copy so a rejected token leaves the session untouched.
        Eigen::VectorXf hidden = session.hidden_;
        std::size_t consumed = 0;
        for (std::size_t t = 0; t < input_ids.length(); ++t) {
            if (attention_mask.at(0, t) == 0) {
                continue;
            }
            const int token = input_ids.at(0, t);
            if (token < 0 || token >= weights_.vocab_size()) {
                throw InferenceError("token id " + std::to_string(token) + " outside vocabulary");
            }
            hidden = weights_.step(hidden, token);
            ++consumed;
        }
        if (consumed == 0) {
            throw InferenceError("attention mask selects no tokens");
        }

        session.hidden_ = std::move(hidden);
        session.position_ += consumed;

        const Eigen::VectorXf row = weights_.scores(session.hidden_);
        const auto vocab = static_cast<std::size_t>(weights_.vocab_size());
        return ScoreTensor::from_floats({1, 1, vocab},
                                        std::vector<float>(row.data(), row.data() + vocab),
                                        Weights::kScoreType);
    }

    /// `session` must outlive the returned future.
    std::future<ScoreTensor> predict_async(const TokenTensor& input_ids,
                                           const TokenTensor& attention_mask,
                                           DecodingSession& session) const {
        return std::async(std::launch::async, [this, input_ids, attention_mask, &session]() {
            return predict(input_ids, attention_mask, session);
        });
    }

    [[nodiscard]] const Weights& weights() const { return weights_; }

private:
    Weights weights_;
};

using StatelessFp16Model = RecurrentStatelessModel<Fp16Weights>;
using Stateless8BitModel = RecurrentStatelessModel<Int8Weights>;
using StatefulFp16Model = RecurrentStatefulModel<Fp16Weights>;
using Stateful8BitModel = RecurrentStatefulModel<Int8Weights>;

/**
 * Whichever concrete stateful engine resolution produced. The two tiers are
 * unrelated types, so callers go through with_model() and receive the
 * concrete model.
 */
class StatefulHandle {
public:
    using Storage = std::variant<std::shared_ptr<StatefulFp16Model>,
                                 std::shared_ptr<Stateful8BitModel>>;

    explicit StatefulHandle(std::shared_ptr<StatefulFp16Model> model) : storage_(std::move(model)) {}
    explicit StatefulHandle(std::shared_ptr<Stateful8BitModel> model) : storage_(std::move(model)) {}

    /// Precision of the engine actually held, which may differ from the
    /// variant that was requested.
    [[nodiscard]] Precision precision() const {
        return storage_.index() == 0 ? Precision::StandardFP16 : Precision::Compressed8Bit;
    }

    template<typename Fn>
    decltype(auto) with_model(Fn&& fn) const {
        return std::visit([&fn](const auto& model) -> decltype(auto) { return fn(*model); }, storage_);
    }

private:
    Storage storage_;
};

} // namespace zenzbench
