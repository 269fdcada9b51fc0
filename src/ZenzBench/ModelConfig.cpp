#include "ZenzBench/ModelConfig.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace zenzbench {

bool ModelConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ModelConfig] Failed to open " << path.string() << std::endl;
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ModelConfig] JSON parse failed: " << e.what() << std::endl;
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[ModelConfig] " << path.string() << " is not a JSON object" << std::endl;
        return false;
    }

    *this = ModelConfig();

    try {
        model_type = j.value("model_type", model_type);
        vocab_size = j.value("vocab_size", vocab_size);
        // GPT-2 style configs call it n_embd.
        hidden_size = j.value("hidden_size", j.value("n_embd", hidden_size));
        eos_token_id = j.value("eos_token_id", eos_token_id);
        max_position_embeddings = j.value("max_position_embeddings",
                                          j.value("n_positions", max_position_embeddings));
    } catch (const json::exception& e) {
        std::cerr << "[ModelConfig] Bad field type in " << path.string() << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "[ModelConfig] Loaded: model_type="
              << (model_type.empty() ? "unknown" : model_type)
              << ", hidden_size=" << hidden_size
              << ", vocab_size=" << vocab_size
              << ", eos_token_id=" << eos_token_id << std::endl;
    return true;
}

} // namespace zenzbench
