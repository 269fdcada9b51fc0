#pragma once

#include "ZenzBench/AssetLocator.hpp"
#include "ZenzBench/Engine.hpp"
#include "ZenzBench/ModelConfig.hpp"
#include "ZenzBench/Variants.hpp"

#include <future>
#include <memory>
#include <optional>

namespace zenzbench {

/**
 * Builds reference engines from their safetensors artifacts.
 *
 * Expected tensors:
 *   embed_tokens.weight   [vocab, hidden]
 *   recurrent.weight      [hidden, hidden]
 *   recurrent.bias        [hidden]          (optional, zero when absent)
 * 8-bit artifacts store each weight as I8 with a per-row F32 `<name>.scale`;
 * a float artifact given to an 8-bit variant is quantized on load.
 *
 * Every loader returns nullptr on failure after logging
 * `[ModelLoad] Failed to load <debug name>: <reason>`.
 */
class ModelLoader {
public:
    ModelLoader(ModelAssets assets, std::optional<ModelConfig> config);

    [[nodiscard]] std::shared_ptr<StatelessPredictor> load_stateless(StatelessVariant variant) const;
    [[nodiscard]] std::shared_ptr<StatefulFp16Model> load_stateful_fp16() const;
    [[nodiscard]] std::shared_ptr<Stateful8BitModel> load_stateful_8bit() const;

    std::future<std::shared_ptr<StatelessPredictor>> load_stateless_async(StatelessVariant variant) const;
    std::future<std::shared_ptr<StatefulFp16Model>> load_stateful_fp16_async() const;
    std::future<std::shared_ptr<Stateful8BitModel>> load_stateful_8bit_async() const;

private:
    ModelAssets assets_;
    std::optional<ModelConfig> config_;
};

} // namespace zenzbench
