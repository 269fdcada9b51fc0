#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zenzbench {

struct AssetOptions {
    std::optional<std::filesystem::path> executable_path;
    std::optional<std::filesystem::path> model_dir;
    std::optional<std::filesystem::path> tokenizer_path;
    /// Variant debug name -> artifact file name inside the model directory.
    std::map<std::string, std::string> artifact_names;
};

struct ModelAssets {
    std::filesystem::path model_dir;
    std::filesystem::path tokenizer;
    std::filesystem::path config; ///< empty when the directory has no config.json
    std::map<std::string, std::filesystem::path> artifacts;

    [[nodiscard]] std::filesystem::path artifact(const std::string& debug_name) const;
    [[nodiscard]] std::vector<std::filesystem::path> missing() const;
};

/**
 * Finds the model directory and everything inside it.
 *
 * An explicit model directory wins; otherwise a `model/` directory is
 * searched for from the working directory and the executable's location
 * upwards. Throws std::runtime_error when no model directory or no
 * tokenizer can be found. Missing engine artifacts are not an error here;
 * they surface as load failures for the affected variants.
 */
class AssetLocator {
public:
    explicit AssetLocator(AssetOptions options) : options_(std::move(options)) {}

    [[nodiscard]] ModelAssets locate() const;

    static std::string default_artifact_name(const std::string& debug_name);

private:
    AssetOptions options_;
};

} // namespace zenzbench
