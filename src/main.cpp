#include "ZenzBench/AssetLocator.hpp"
#include "ZenzBench/BenchConfig.hpp"
#include "ZenzBench/Benchmark.hpp"
#include "ZenzBench/BenchmarkCase.hpp"
#include "ZenzBench/Environment.hpp"
#include "ZenzBench/LogSink.hpp"
#include "ZenzBench/ModelConfig.hpp"
#include "ZenzBench/ModelLoader.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace zenzbench;

namespace {

std::optional<CliArguments> read_cli(int argc, char** argv) {
    try {
        return parse_cli(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Main] " << e.what() << "\n" << cli_usage();
        return std::nullopt;
    }
}

std::optional<ModelConfig> read_model_config(const ModelAssets& assets) {
    if (assets.config.empty()) {
        return std::nullopt;
    }
    ModelConfig config;
    if (!config.load(assets.config)) {
        return std::nullopt;
    }
    return config;
}

void report_averages(const BenchmarkRunner& runner, LogSink& log) {
    const auto averages = runner.averages();
    if (averages.empty()) {
        return;
    }
    std::ostringstream oss;
    oss << "===== Variant Averages (fast → slow) =====";
    for (const auto& aggregate : averages) {
        oss << '\n' << aggregate.variant << ": " << aggregate.average() << " s ("
            << aggregate.samples << " samples)";
    }
    log.write(oss.str());

    std::size_t checked = 0;
    std::size_t matched = 0;
    for (const auto& result : runner.results()) {
        if (result.matches_expected) {
            ++checked;
            matched += *result.matches_expected ? 1 : 0;
        }
    }
    if (checked > 0) {
        log.write("[Main] Expected output matched: " + std::to_string(matched) + "/" + std::to_string(checked));
    }
}

int run(const CliArguments& cli, const fs::path& executable) {
    BenchConfig config;
    if (cli.config_path && !config.load(*cli.config_path)) {
        throw std::runtime_error("Unable to load config file: " + cli.config_path->string());
    }
    config.apply(cli);

    StreamLogSink log(std::cout);
    const ModelLoadConfiguration selection = config.load_configuration();
    log.write("[Main] Model selection: " + selection.summary());

    const ModelAssets assets = AssetLocator(config.asset_options(executable)).locate();
    for (const auto& path : assets.missing()) {
        log.write("[Main] Missing asset: " + path.string());
    }

    const std::optional<ModelConfig> model_config = read_model_config(assets);
    if (model_config) {
        config.fit_to_model(*model_config, log);
    }
    const ModelLoader loader(assets, model_config);
    auto env = make_benchmark_environment(selection, EngineLoaders::from_artifacts(loader, assets.tokenizer), log);
    if (!env) {
        std::cerr << "[Main] Benchmark environment unavailable.\n";
        return 1;
    }
    const int tokenizer_eos = env->tokenizer->eos_token_id();
    if (tokenizer_eos >= 0 && tokenizer_eos != config.end_of_sequence_id()) {
        log.write("[Main] Tokenizer end-of-sequence id " + std::to_string(tokenizer_eos) +
                  " differs from the configured " + std::to_string(config.end_of_sequence_id()));
    }

    const std::vector<BenchmarkCase> cases = config.cases_path
        ? load_cases(*config.cases_path)
        : default_benchmark_cases();

    BenchmarkRunner runner(*env, log, config.runner_options());
    runner.run_suite(cases, config.short_run ? SuiteScope::Short : SuiteScope::All);
    report_averages(runner, log);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const auto cli = read_cli(argc, argv);
    if (!cli) {
        return 2;
    }
    if (cli->help) {
        std::cout << cli_usage();
        return 0;
    }

    try {
        return run(*cli, argc > 0 ? fs::path(argv[0]) : fs::path{});
    } catch (const std::exception& e) {
        std::cerr << "[Main] Unhandled exception: " << e.what() << '\n';
    }
    return 1;
}
