#pragma once

#include "ZenzBench/Engine.hpp"
#include "ZenzBench/LogSink.hpp"
#include "ZenzBench/ModelLoader.hpp"
#include "ZenzBench/Tokenizer.hpp"
#include "ZenzBench/Variants.hpp"

#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace zenzbench {

/// Which variants a session should try to load.
struct ModelLoadConfiguration {
    std::set<StatelessVariant> stateless;
    std::set<StatefulVariant> stateful;

    [[nodiscard]] bool empty() const { return stateless.empty() && stateful.empty(); }

    /// "stateless: <titles> | stateful: none", titles in declaration order.
    [[nodiscard]] std::string summary() const;

    static ModelLoadConfiguration all();
};

/// Tokenizer plus every engine that loaded. Read-only once assembled.
struct BenchmarkEnvironment {
    std::shared_ptr<const Tokenizer> tokenizer;
    std::map<StatelessVariant, std::shared_ptr<StatelessPredictor>> stateless_models;
    std::map<StatefulVariant, StatefulHandle> stateful_models;

    [[nodiscard]] StatelessPredictor* stateless(StatelessVariant variant) const;
    [[nodiscard]] const StatefulHandle* stateful(StatefulVariant variant) const;
};

struct EngineLoaders {
    std::function<std::shared_ptr<const Tokenizer>()> load_tokenizer;
    std::function<std::future<std::shared_ptr<StatelessPredictor>>(StatelessVariant)> load_stateless;
    std::function<std::future<std::optional<StatefulHandle>>(StatefulVariant)> load_stateful;

    /// Artifact-backed loaders: each variant resolves with fallback to the
    /// other precision through the engine resolver.
    static EngineLoaders from_artifacts(const ModelLoader& loader, const std::filesystem::path& tokenizer_path);
};

/**
 * Loads the tokenizer and the selected variants.
 *
 * Returns nullopt (with a log line) for an empty configuration or when none
 * of the selected variants could be loaded. A variant that fails is logged
 * and left out. Throws std::runtime_error when the tokenizer cannot be
 * loaded, since nothing can run without it.
 */
std::optional<BenchmarkEnvironment> make_benchmark_environment(const ModelLoadConfiguration& config,
                                                               const EngineLoaders& loaders,
                                                               LogSink& log);

} // namespace zenzbench
