#include "ZenzBench/AssetLocator.hpp"

#include "ZenzBench/Variants.hpp"

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace zenzbench {

namespace {

fs::path absolute_path(const fs::path& candidate) {
    std::error_code ec;
    fs::path absolute = fs::absolute(candidate, ec);
    return ec ? candidate : absolute;
}

bool exists(const fs::path& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec) && !ec;
}

fs::path find_model_dir(const std::vector<fs::path>& hints) {
    std::error_code ec;
    for (const auto& hint : hints) {
        if (hint.empty()) {
            continue;
        }
        auto current = absolute_path(hint);
        while (!current.empty()) {
            if (fs::is_directory(current / "model", ec) && !ec) {
                return current / "model";
            }
            const auto parent = current.parent_path();
            if (parent == current) {
                break;
            }
            current = parent;
        }
    }
    return {};
}

fs::path find_existing(const std::vector<fs::path>& candidates, const char* label) {
    for (const auto& candidate : candidates) {
        const auto absolute = absolute_path(candidate);
        if (zenzbench::exists(absolute)) {
            return absolute;
        }
    }

    std::ostringstream oss;
    oss << "Failed to locate " << label << ". Checked:";
    for (const auto& candidate : candidates) {
        oss << "\n  - " << candidate.string();
    }
    throw std::runtime_error(oss.str());
}

} // namespace

fs::path ModelAssets::artifact(const std::string& debug_name) const {
    const auto it = artifacts.find(debug_name);
    return it == artifacts.end() ? fs::path{} : it->second;
}

std::vector<fs::path> ModelAssets::missing() const {
    std::vector<fs::path> absent;
    if (!zenzbench::exists(tokenizer)) {
        absent.push_back(tokenizer);
    }
    for (const auto& [name, path] : artifacts) {
        if (!zenzbench::exists(path)) {
            absent.push_back(path);
        }
    }
    return absent;
}

std::string AssetLocator::default_artifact_name(const std::string& debug_name) {
    return debug_name + ".safetensors";
}

ModelAssets AssetLocator::locate() const {
    ModelAssets assets;

    if (options_.model_dir) {
        if (!fs::is_directory(*options_.model_dir)) {
            throw std::runtime_error("Model directory does not exist: " + options_.model_dir->string());
        }
        assets.model_dir = absolute_path(*options_.model_dir);
    } else {
        std::vector<fs::path> hints{fs::current_path()};
        if (options_.executable_path) {
            hints.push_back(options_.executable_path->parent_path());
        }
        assets.model_dir = find_model_dir(hints);
        if (assets.model_dir.empty()) {
            throw std::runtime_error("Failed to locate a model/ directory; pass --model-dir");
        }
    }

    std::vector<fs::path> tokenizer_candidates;
    if (options_.tokenizer_path) {
        tokenizer_candidates.push_back(*options_.tokenizer_path);
    } else {
        tokenizer_candidates.push_back(assets.model_dir / "tokenizer.json");
        tokenizer_candidates.push_back(assets.model_dir / "tokenizer.model");
        tokenizer_candidates.push_back(assets.model_dir / "spiece.model");
    }
    assets.tokenizer = find_existing(tokenizer_candidates, "tokenizer");

    if (zenzbench::exists(assets.model_dir / "config.json")) {
        assets.config = assets.model_dir / "config.json";
    }

    const auto add_artifact = [&](const VariantInfo& info) {
        const auto override_it = options_.artifact_names.find(info.debug_name);
        const std::string file = override_it != options_.artifact_names.end()
            ? override_it->second
            : default_artifact_name(info.debug_name);
        assets.artifacts[info.debug_name] = assets.model_dir / file;
    };
    for (const auto variant : kAllStatelessVariants) {
        add_artifact(variant_info(variant));
    }
    for (const auto variant : kAllStatefulVariants) {
        add_artifact(variant_info(variant));
    }
    return assets;
}

} // namespace zenzbench
