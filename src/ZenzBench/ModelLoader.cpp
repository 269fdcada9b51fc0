#include "ZenzBench/ModelLoader.hpp"

#include "ZenzBench/WeightLoader.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace zenzbench {

namespace {

using RowMajorMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

const char* const kEmbedding = "embed_tokens";
const char* const kRecurrence = "recurrent";

std::string weight_name(const char* prefix) { return std::string(prefix) + ".weight"; }
std::string scale_name(const char* prefix) { return std::string(prefix) + ".scale"; }

std::pair<Eigen::Index, Eigen::Index> matrix_shape(const WeightLoader& weights, const std::string& name) {
    if (!weights.has(name)) {
        throw std::runtime_error("missing tensor " + name);
    }
    const auto shape = weights.get_shape(name);
    if (shape.size() != 2) {
        throw std::runtime_error(name + " must be 2-D");
    }
    return {static_cast<Eigen::Index>(shape[0]), static_cast<Eigen::Index>(shape[1])};
}

Eigen::MatrixXf read_matrix(const WeightLoader& weights, const std::string& name) {
    const auto [rows, cols] = matrix_shape(weights, name);
    const std::vector<float> values = weights.get(name);
    if (values.size() != static_cast<std::size_t>(rows * cols)) {
        throw std::runtime_error("could not read " + name);
    }
    return Eigen::Map<const RowMajorMatrix>(values.data(), rows, cols);
}

Eigen::VectorXf read_bias(const WeightLoader& weights, const std::string& name, Eigen::Index size) {
    if (!weights.has(name)) {
        return Eigen::VectorXf::Zero(size);
    }
    const std::vector<float> values = weights.get(name);
    if (values.size() != static_cast<std::size_t>(size)) {
        throw std::runtime_error(name + " has " + std::to_string(values.size()) +
                                 " elements, expected " + std::to_string(size));
    }
    return Eigen::Map<const Eigen::VectorXf>(values.data(), size);
}

RecurrentParameters read_float_parameters(const WeightLoader& weights) {
    RecurrentParameters params;
    params.embedding = read_matrix(weights, weight_name(kEmbedding));
    params.recurrence = read_matrix(weights, weight_name(kRecurrence));
    params.bias = read_bias(weights, std::string(kRecurrence) + ".bias", params.embedding.cols());
    params.validate();
    return params;
}

QuantizedMatrix read_quantized(const WeightLoader& weights, const char* prefix) {
    const std::string name = weight_name(prefix);
    if (weights.get_dtype(name) != "I8") {
        return QuantizedMatrix::quantize(read_matrix(weights, name));
    }

    const auto [rows, cols] = matrix_shape(weights, name);
    const std::vector<std::int8_t> values = weights.get_int8(name);
    if (values.size() != static_cast<std::size_t>(rows * cols)) {
        throw std::runtime_error("could not read " + name);
    }
    const std::vector<float> scales = weights.get(scale_name(prefix));
    if (scales.size() != static_cast<std::size_t>(rows)) {
        throw std::runtime_error(scale_name(prefix) + " must hold one scale per row");
    }

    QuantizedMatrix out;
    out.values = Eigen::Map<const QuantizedMatrix::Values>(values.data(), rows, cols);
    out.scales = Eigen::Map<const Eigen::VectorXf>(scales.data(), rows);
    return out;
}

Int8Weights read_int8_weights(const WeightLoader& weights) {
    QuantizedMatrix embedding = read_quantized(weights, kEmbedding);
    QuantizedMatrix recurrence = read_quantized(weights, kRecurrence);
    Eigen::VectorXf bias = read_bias(weights, std::string(kRecurrence) + ".bias", embedding.values.cols());
    return Int8Weights(std::move(embedding), std::move(recurrence), std::move(bias));
}

void check_against_config(const std::optional<ModelConfig>& config, int vocab, int hidden) {
    if (!config) {
        return;
    }
    if (config->vocab_size > 0 && config->vocab_size != vocab) {
        throw std::runtime_error("vocab size " + std::to_string(vocab) +
                                 " does not match config.json (" + std::to_string(config->vocab_size) + ")");
    }
    if (config->hidden_size > 0 && config->hidden_size != hidden) {
        throw std::runtime_error("hidden size " + std::to_string(hidden) +
                                 " does not match config.json (" + std::to_string(config->hidden_size) + ")");
    }
}

WeightLoader open_artifact(const ModelAssets& assets, const char* debug_name) {
    const auto path = assets.artifact(debug_name);
    if (path.empty()) {
        throw std::runtime_error("no artifact path configured");
    }
    WeightLoader weights;
    if (!weights.load(path)) {
        throw std::runtime_error("unreadable artifact " + path.string());
    }
    return weights;
}

template<typename Model, typename Build>
std::shared_ptr<Model> build_engine(const char* debug_name, Build&& build) {
    try {
        return build();
    } catch (const std::exception& e) {
        std::cerr << "[ModelLoad] Failed to load " << debug_name << ": " << e.what() << std::endl;
        return nullptr;
    }
}

template<typename Weights>
Weights read_weights(const WeightLoader& weights);

template<>
Fp16Weights read_weights<Fp16Weights>(const WeightLoader& weights) {
    return Fp16Weights(read_float_parameters(weights));
}

template<>
Int8Weights read_weights<Int8Weights>(const WeightLoader& weights) {
    return read_int8_weights(weights);
}

template<typename Weights>
Weights load_checked(const ModelAssets& assets,
                     const std::optional<ModelConfig>& config,
                     const char* debug_name) {
    const WeightLoader artifact = open_artifact(assets, debug_name);
    Weights weights = read_weights<Weights>(artifact);
    check_against_config(config, weights.vocab_size(), weights.hidden_size());
    std::cout << "[ModelLoad] Loaded " << debug_name << " (vocab=" << weights.vocab_size()
              << ", hidden=" << weights.hidden_size() << ")" << std::endl;
    return weights;
}

} // namespace

ModelLoader::ModelLoader(ModelAssets assets, std::optional<ModelConfig> config)
    : assets_(std::move(assets)), config_(std::move(config)) {}

std::shared_ptr<StatelessPredictor> ModelLoader::load_stateless(StatelessVariant variant) const {
    const char* debug_name = variant_info(variant).debug_name;
    return build_engine<StatelessPredictor>(debug_name, [&]() -> std::shared_ptr<StatelessPredictor> {
        switch (variant) {
        case StatelessVariant::StandardFP16:
            return std::make_shared<StatelessFp16Model>(
                load_checked<Fp16Weights>(assets_, config_, debug_name));
        case StatelessVariant::Compressed8Bit:
            return std::make_shared<Stateless8BitModel>(
                load_checked<Int8Weights>(assets_, config_, debug_name));
        }
        throw std::logic_error("unknown stateless variant");
    });
}

std::shared_ptr<StatefulFp16Model> ModelLoader::load_stateful_fp16() const {
    const char* debug_name = variant_info(StatefulVariant::StandardFP16).debug_name;
    return build_engine<StatefulFp16Model>(debug_name, [&]() {
        return std::make_shared<StatefulFp16Model>(load_checked<Fp16Weights>(assets_, config_, debug_name));
    });
}

std::shared_ptr<Stateful8BitModel> ModelLoader::load_stateful_8bit() const {
    const char* debug_name = variant_info(StatefulVariant::Compressed8Bit).debug_name;
    return build_engine<Stateful8BitModel>(debug_name, [&]() {
        return std::make_shared<Stateful8BitModel>(load_checked<Int8Weights>(assets_, config_, debug_name));
    });
}

// The async forms copy the loader so the future does not depend on its lifetime.
std::future<std::shared_ptr<StatelessPredictor>> ModelLoader::load_stateless_async(StatelessVariant variant) const {
    return std::async(std::launch::async, [loader = *this, variant]() { return loader.load_stateless(variant); });
}

std::future<std::shared_ptr<StatefulFp16Model>> ModelLoader::load_stateful_fp16_async() const {
    return std::async(std::launch::async, [loader = *this]() { return loader.load_stateful_fp16(); });
}

std::future<std::shared_ptr<Stateful8BitModel>> ModelLoader::load_stateful_8bit_async() const {
    return std::async(std::launch::async, [loader = *this]() { return loader.load_stateful_8bit(); });
}

} // namespace zenzbench
