#include "ZenzBench/BenchConfig.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zenzbench {

namespace {

std::vector<Precision> read_precisions(const json& node, const char* key) {
    if (!node.is_array()) {
        throw std::invalid_argument(std::string(key) + " must be an array of precisions");
    }
    std::vector<Precision> out;
    for (const auto& item : node) {
        const auto text = item.get<std::string>();
        const auto precision = parse_precision(text);
        if (!precision) {
            throw std::invalid_argument(std::string(key) + ": unknown precision '" + text + "'");
        }
        out.push_back(*precision);
    }
    return out;
}

// Signed read so a negative value is rejected instead of wrapping.
std::size_t read_positive(const json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto value = j.at(key).get<long long>();
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive, got " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

std::optional<fs::path> read_path(const json& j, const char* key, const fs::path& base) {
    const auto value = j.value(key, std::string{});
    if (value.empty()) {
        return std::nullopt;
    }
    const fs::path path(value);
    return path.is_relative() ? base / path : path;
}

} // namespace

std::vector<Precision> parse_precision_list(const std::string& text) {
    std::vector<Precision> out;
    if (text.empty() || text == "none") {
        return out;
    }
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) {
            continue;
        }
        const auto precision = parse_precision(item);
        if (!precision) {
            throw std::invalid_argument("unknown precision '" + item + "'");
        }
        out.push_back(*precision);
    }
    return out;
}

const char* cli_usage() {
    return "Usage: zenz_bench [options]\n"
           "  --config <file>      JSON settings file\n"
           "  --model-dir <dir>    directory holding the engine artifacts\n"
           "  --tokenizer <path>   tokenizer.json, SentencePiece model or directory\n"
           "  --cases <file>       JSON case list (defaults to the built-in corpus)\n"
           "  --stateless <list>   fp16,8bit or none\n"
           "  --stateful <list>    fp16,8bit or none\n"
           "  --sync               also time the blocking call\n"
           "  --short              run the first 6 cases only\n"
           "  --verbose            per-step generation traces\n"
           "  --help               show this message\n";
}

CliArguments parse_cli(const std::vector<std::string>& args) {
    CliArguments cli;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        const auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(flag + " needs a value");
            }
            return args[++i];
        };

        if (flag == "--config") {
            cli.config_path = fs::path(value());
        } else if (flag == "--model-dir") {
            cli.model_dir = fs::path(value());
        } else if (flag == "--tokenizer") {
            cli.tokenizer_path = fs::path(value());
        } else if (flag == "--cases") {
            cli.cases_path = fs::path(value());
        } else if (flag == "--stateless") {
            cli.stateless = parse_precision_list(value());
        } else if (flag == "--stateful") {
            cli.stateful = parse_precision_list(value());
        } else if (flag == "--sync") {
            cli.include_sync = true;
        } else if (flag == "--short") {
            cli.short_run = true;
        } else if (flag == "--verbose") {
            cli.verbose = true;
        } else if (flag == "--help" || flag == "-h") {
            cli.help = true;
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }
    return cli;
}

bool BenchConfig::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[BenchConfig] Failed to open " << path.string() << std::endl;
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        std::cerr << "[BenchConfig] JSON parse failed: " << e.what() << std::endl;
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[BenchConfig] " << path.string() << " is not a JSON object" << std::endl;
        return false;
    }

    const fs::path base = path.parent_path();
    BenchConfig parsed;
    try {
        parsed.model_dir = read_path(j, "model_dir", base);
        parsed.tokenizer_path = read_path(j, "tokenizer_path", base);
        parsed.cases_path = read_path(j, "cases_path", base);
        if (j.contains("stateless")) parsed.stateless = read_precisions(j["stateless"], "stateless");
        if (j.contains("stateful")) parsed.stateful = read_precisions(j["stateful"], "stateful");
        parsed.include_sync = j.value("include_sync", parsed.include_sync);
        parsed.short_run = j.value("short_run", parsed.short_run);
        parsed.verbose = j.value("verbose", parsed.verbose);
        if (j.contains("eos_token_id")) parsed.eos_token_id = j.at("eos_token_id").get<int>();
        parsed.max_sequence_length = read_positive(j, "max_sequence_length", parsed.max_sequence_length);
        parsed.predict_window = read_positive(j, "predict_window", parsed.predict_window);
        parsed.pad_marker = j.value("pad_marker", parsed.pad_marker);
        parsed.wrap_kana_markers = j.value("wrap_kana_markers", parsed.wrap_kana_markers);
        if (j.contains("artifacts")) {
            parsed.artifacts = j["artifacts"].get<std::map<std::string, std::string>>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[BenchConfig] Bad value in " << path.string() << ": " << e.what() << std::endl;
        return false;
    }

    *this = std::move(parsed);
    std::cout << "[BenchConfig] Loaded " << path.filename().string() << std::endl;
    return true;
}

void BenchConfig::apply(const CliArguments& cli) {
    if (cli.model_dir) model_dir = cli.model_dir;
    if (cli.tokenizer_path) tokenizer_path = cli.tokenizer_path;
    if (cli.cases_path) cases_path = cli.cases_path;
    if (cli.stateless) stateless = *cli.stateless;
    if (cli.stateful) stateful = *cli.stateful;
    include_sync = include_sync || cli.include_sync;
    short_run = short_run || cli.short_run;
    verbose = verbose || cli.verbose;
}

void BenchConfig::fit_to_model(const ModelConfig& model, LogSink& log) {
    if (!eos_token_id) {
        eos_token_id = model.eos_token_id;
    } else if (*eos_token_id != model.eos_token_id) {
        log.write("[BenchConfig] eos_token_id " + std::to_string(*eos_token_id) +
                  " overrides the model's " + std::to_string(model.eos_token_id));
    }
    if (model.max_position_embeddings > 0 &&
        max_sequence_length > static_cast<std::size_t>(model.max_position_embeddings)) {
        max_sequence_length = static_cast<std::size_t>(model.max_position_embeddings);
        log.write("[BenchConfig] max_sequence_length limited to the model's " +
                  std::to_string(max_sequence_length) + " positions");
    }
}

int BenchConfig::end_of_sequence_id() const {
    return eos_token_id.value_or(kDefaultEosTokenId);
}

ModelLoadConfiguration BenchConfig::load_configuration() const {
    ModelLoadConfiguration config;
    for (const auto precision : stateless) {
        config.stateless.insert(stateless_variant(precision));
    }
    for (const auto precision : stateful) {
        config.stateful.insert(stateful_variant(precision));
    }
    return config;
}

RunnerOptions BenchConfig::runner_options() const {
    RunnerOptions options;
    options.decode.eos_token_id = end_of_sequence_id();
    options.decode.max_sequence_length = max_sequence_length;
    options.decode.predict_window = predict_window;
    options.decode.pad_marker = pad_marker;
    options.decode.verbose = verbose;
    options.include_sync = include_sync;
    options.wrap_kana_markers = wrap_kana_markers;
    return options;
}

AssetOptions BenchConfig::asset_options(const std::optional<fs::path>& executable_path) const {
    AssetOptions options;
    options.executable_path = executable_path;
    options.model_dir = model_dir;
    options.tokenizer_path = tokenizer_path;
    options.artifact_names = artifacts;
    return options;
}

} // namespace zenzbench
