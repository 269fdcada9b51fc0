#pragma once

#include "ZenzBench/AssetLocator.hpp"
#include "ZenzBench/Benchmark.hpp"
#include "ZenzBench/Environment.hpp"
#include "ZenzBench/LogSink.hpp"
#include "ZenzBench/ModelConfig.hpp"
#include "ZenzBench/Variants.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zenzbench {

/// Command-line flags. Every field is unset unless the flag was given.
struct CliArguments {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> model_dir;
    std::optional<std::filesystem::path> tokenizer_path;
    std::optional<std::filesystem::path> cases_path;
    std::optional<std::vector<Precision>> stateless;
    std::optional<std::vector<Precision>> stateful;
    bool include_sync = false;
    bool short_run = false;
    bool verbose = false;
    bool help = false;
};

/// Throws std::invalid_argument on an unknown flag or a missing value.
CliArguments parse_cli(const std::vector<std::string>& args);

const char* cli_usage();

/// "fp16,8bit" -> both tiers; "none" or "" -> empty. Throws std::invalid_argument.
std::vector<Precision> parse_precision_list(const std::string& text);

inline constexpr int kDefaultEosTokenId = 3;

/**
 * Harness settings. Defaults select every variant; a JSON file overrides
 * key by key and command-line flags override the file.
 */
struct BenchConfig {
    std::optional<std::filesystem::path> model_dir;
    std::optional<std::filesystem::path> tokenizer_path;
    std::optional<std::filesystem::path> cases_path;
    std::vector<Precision> stateless{Precision::StandardFP16, Precision::Compressed8Bit};
    std::vector<Precision> stateful{Precision::StandardFP16, Precision::Compressed8Bit};
    bool include_sync = false;
    bool short_run = false;
    bool verbose = false;
    /// Unset means the model's config.json decides (falling back to kDefaultEosTokenId).
    std::optional<int> eos_token_id;
    std::size_t max_sequence_length = 128;
    std::size_t predict_window = 16;
    std::string pad_marker = "[PAD]";
    bool wrap_kana_markers = true;
    /// Variant debug name -> artifact file name.
    std::map<std::string, std::string> artifacts;

    /// Relative paths in the file resolve against the file's directory.
    bool load(const std::filesystem::path& path);
    void apply(const CliArguments& cli);
    /// Takes the model's end-of-sequence id when none was configured and caps
    /// max_sequence_length at the model's position count.
    void fit_to_model(const ModelConfig& model, LogSink& log);

    [[nodiscard]] int end_of_sequence_id() const;

    [[nodiscard]] ModelLoadConfiguration load_configuration() const;
    [[nodiscard]] RunnerOptions runner_options() const;
    [[nodiscard]] AssetOptions asset_options(const std::optional<std::filesystem::path>& executable_path) const;
};

} // namespace zenzbench
