#include "ZenzBench/Engine.hpp"

#include <algorithm>
#include <cmath>

namespace zenzbench {

namespace {
const RecurrentParameters& checked(const RecurrentParameters& params) {
    params.validate();
    return params;
}
} // namespace

std::future<ScoreTensor> StatelessPredictor::logits_async(const TokenTensor& input_ids) {
    return std::async(std::launch::async, [this, input_ids]() { return logits(input_ids); });
}

void RecurrentParameters::validate() const {
    if (embedding.rows() == 0 || embedding.cols() == 0) {
        throw std::invalid_argument("embedding matrix is empty");
    }
    const Eigen::Index hidden = embedding.cols();
    if (recurrence.rows() != hidden || recurrence.cols() != hidden) {
        throw std::invalid_argument("recurrence matrix must be [" + std::to_string(hidden) + ", " +
                                    std::to_string(hidden) + "]");
    }
    if (bias.size() != hidden) {
        throw std::invalid_argument("bias length " + std::to_string(bias.size()) +
                                    " does not match hidden size " + std::to_string(hidden));
    }
}

// ---- int8 quantization ----
QuantizedMatrix QuantizedMatrix::quantize(const Eigen::MatrixXf& source) {
    QuantizedMatrix out;
    out.values.resize(source.rows(), source.cols());
    out.scales.resize(source.rows());
    for (Eigen::Index r = 0; r < source.rows(); ++r) {
        const float max_abs = source.row(r).cwiseAbs().maxCoeff();
        const float scale = max_abs > 0.0f ? max_abs / 127.0f : 1.0f;
        out.scales(r) = scale;
        for (Eigen::Index c = 0; c < source.cols(); ++c) {
            const float q = std::round(source(r, c) / scale);
            out.values(r, c) = static_cast<std::int8_t>(std::clamp(q, -127.0f, 127.0f));
        }
    }
    return out;
}

Eigen::VectorXf QuantizedMatrix::multiply(const Eigen::VectorXf& x) const {
    return (values.cast<float>() * x).cwiseProduct(scales);
}

Eigen::VectorXf QuantizedMatrix::row(Eigen::Index r) const {
    return values.row(r).cast<float>().transpose() * scales(r);
}

// ---- FP16 tier ----
Fp16Weights::Fp16Weights(const RecurrentParameters& params)
    : embedding_(checked(params).embedding.cast<Eigen::half>()),
      recurrence_(params.recurrence.cast<Eigen::half>()),
      bias_(params.bias) {}

Eigen::VectorXf Fp16Weights::step(const Eigen::VectorXf& hidden, int token) const {
    const Eigen::VectorXf pre = recurrence_.cast<float>() * hidden
        + embedding_.row(token).cast<float>().transpose()
        + bias_;
    return pre.array().tanh().matrix();
}

Eigen::VectorXf Fp16Weights::scores(const Eigen::VectorXf& hidden) const {
    return embedding_.cast<float>() * hidden;
}

// ---- 8-bit tier ----
Int8Weights::Int8Weights(const RecurrentParameters& params)
    : Int8Weights(QuantizedMatrix::quantize(checked(params).embedding),
                  QuantizedMatrix::quantize(params.recurrence),
                  params.bias) {}

Int8Weights::Int8Weights(QuantizedMatrix embedding, QuantizedMatrix recurrence, Eigen::VectorXf bias)
    : embedding_(std::move(embedding)), recurrence_(std::move(recurrence)), bias_(std::move(bias)) {
    const Eigen::Index vocab = embedding_.values.rows();
    const Eigen::Index hidden = embedding_.values.cols();
    if (vocab == 0 || hidden == 0) {
        throw std::invalid_argument("embedding matrix is empty");
    }
    if (embedding_.scales.size() != vocab || recurrence_.scales.size() != recurrence_.values.rows()) {
        throw std::invalid_argument("quantization scales must have one entry per row");
    }
    if (recurrence_.values.rows() != hidden || recurrence_.values.cols() != hidden) {
        throw std::invalid_argument("recurrence matrix must be square in the hidden size");
    }
    if (bias_.size() != hidden) {
        throw std::invalid_argument("bias length does not match hidden size");
    }
}

Eigen::VectorXf Int8Weights::step(const Eigen::VectorXf& hidden, int token) const {
    const Eigen::VectorXf pre = recurrence_.multiply(hidden) + embedding_.row(token) + bias_;
    return pre.array().tanh().matrix();
}

Eigen::VectorXf Int8Weights::scores(const Eigen::VectorXf& hidden) const {
    return embedding_.multiply(hidden);
}

} // namespace zenzbench
