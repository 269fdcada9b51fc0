#pragma once

#include <filesystem>
#include <string>

namespace zenzbench {

// Contents of a model directory's config.json.
class ModelConfig {
public:
    ModelConfig() = default;

    std::string model_type;
    int vocab_size = 0;
    int hidden_size = 0;
    int eos_token_id = 3;
    /// Longest sequence the model accepts; 0 when the file does not say.
    int max_position_embeddings = 0;

    bool load(const std::filesystem::path& path);
};

} // namespace zenzbench
