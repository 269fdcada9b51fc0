#include "ZenzBench/Environment.hpp"

#include "ZenzBench/EngineResolver.hpp"

#include <array>
#include <stdexcept>
#include <utility>
#include <vector>

namespace zenzbench {

namespace {

template<typename Variant, std::size_t N>
std::string describe(const char* name, const std::array<Variant, N>& order, const std::set<Variant>& selected) {
    std::string text = std::string(name) + ": ";
    bool first = true;
    for (const auto variant : order) {
        if (selected.count(variant) == 0) {
            continue;
        }
        text += (first ? "" : ", ");
        text += variant_info(variant).title;
        first = false;
    }
    return first ? text + "none" : text;
}

} // namespace

std::string ModelLoadConfiguration::summary() const {
    return describe("stateless", kAllStatelessVariants, stateless) + " | " +
           describe("stateful", kAllStatefulVariants, stateful);
}

ModelLoadConfiguration ModelLoadConfiguration::all() {
    ModelLoadConfiguration config;
    config.stateless.insert(kAllStatelessVariants.begin(), kAllStatelessVariants.end());
    config.stateful.insert(kAllStatefulVariants.begin(), kAllStatefulVariants.end());
    return config;
}

StatelessPredictor* BenchmarkEnvironment::stateless(StatelessVariant variant) const {
    const auto it = stateless_models.find(variant);
    return it == stateless_models.end() ? nullptr : it->second.get();
}

const StatefulHandle* BenchmarkEnvironment::stateful(StatefulVariant variant) const {
    const auto it = stateful_models.find(variant);
    return it == stateful_models.end() ? nullptr : &it->second;
}

EngineLoaders EngineLoaders::from_artifacts(const ModelLoader& loader, const std::filesystem::path& tokenizer_path) {
    EngineLoaders loaders;
    loaders.load_tokenizer = [tokenizer_path]() { return zenzbench::load_tokenizer(tokenizer_path); };
    loaders.load_stateless = [loader](StatelessVariant variant) {
        return resolve_stateless_model_async(
            variant,
            [loader]() { return loader.load_stateless_async(StatelessVariant::StandardFP16); },
            [loader]() { return loader.load_stateless_async(StatelessVariant::Compressed8Bit); });
    };
    loaders.load_stateful = [loader](StatefulVariant variant) {
        return resolve_stateful_model_async(
            variant,
            [loader]() { return loader.load_stateful_fp16_async(); },
            [loader]() { return loader.load_stateful_8bit_async(); });
    };
    return loaders;
}

std::optional<BenchmarkEnvironment> make_benchmark_environment(const ModelLoadConfiguration& config,
                                                               const EngineLoaders& loaders,
                                                               LogSink& log) {
    if (config.empty()) {
        log.write("[BenchmarkEnvironment] Skipped loading: empty configuration.");
        return std::nullopt;
    }

    BenchmarkEnvironment env;
    if (loaders.load_tokenizer) {
        env.tokenizer = loaders.load_tokenizer();
    }
    if (!env.tokenizer) {
        throw std::runtime_error("tokenizer not found");
    }

    for (const auto variant : kAllStatelessVariants) {
        if (config.stateless.count(variant) == 0) {
            continue;
        }
        std::shared_ptr<StatelessPredictor> model;
        if (loaders.load_stateless) {
            auto pending = loaders.load_stateless(variant);
            model = pending.valid() ? pending.get() : nullptr;
        }
        if (!model) {
            log.write(std::string("[BenchmarkEnvironment] Missing stateless model ") +
                      variant_info(variant).debug_name + ".");
            continue;
        }
        env.stateless_models.emplace(variant, std::move(model));
    }

    for (const auto variant : kAllStatefulVariants) {
        if (config.stateful.count(variant) == 0) {
            continue;
        }
        std::optional<StatefulHandle> handle;
        if (loaders.load_stateful) {
            auto pending = loaders.load_stateful(variant);
            if (pending.valid()) {
                handle = pending.get();
            }
        }
        if (!handle) {
            log.write(std::string("[BenchmarkEnvironment] Missing stateful model ") +
                      variant_info(variant).debug_name + ".");
            continue;
        }
        env.stateful_models.emplace(variant, std::move(*handle));
    }

    if (env.stateless_models.empty() && env.stateful_models.empty()) {
        log.write("[BenchmarkEnvironment] Failed to load any selected models.");
        return std::nullopt;
    }
    return env;
}

} // namespace zenzbench
