#include "ZenzBench/Tokenizer.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zenzbench {

namespace {

std::optional<json> read_json(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    try {
        json root;
        in >> root;
        return root;
    } catch (const json::exception& e) {
        std::cerr << "[Tokenizer] Failed to parse " << path.string() << ": " << e.what() << '\n';
        return std::nullopt;
    }
}

// Token entries are either a plain string or {"content": "..."}.
std::string token_content(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_object()) {
        return value.value("content", std::string{});
    }
    return {};
}

bool looks_like_json(const fs::path& path) {
    if (path.extension() == ".json") {
        return true;
    }
    std::ifstream in(path);
    char c = '\0';
    while (in.get(c)) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return c == '{';
        }
    }
    return false;
}

fs::path pick_from_directory(const fs::path& directory) {
    for (const char* name : {"tokenizer.json", "tokenizer.model", "spiece.model"}) {
        const fs::path candidate = directory / name;
        if (fs::exists(candidate)) {
            return candidate;
        }
    }
    return {};
}

} // namespace

void Tokenizer::apply_metadata(const fs::path& directory) {
    for (const char* name : {"special_tokens_map.json", "tokenizer_config.json"}) {
        const fs::path path = directory / name;
        if (!fs::exists(path)) {
            continue;
        }
        const auto root = read_json(path);
        if (!root || !root->is_object()) {
            continue;
        }
        if (eos_id_ < 0 && root->contains("eos_token")) {
            eos_id_ = token_to_id(token_content((*root)["eos_token"]));
        }
        if (pad_id_ < 0 && root->contains("pad_token")) {
            pad_id_ = token_to_id(token_content((*root)["pad_token"]));
        }
    }
}

// ---- SentencePiece backend ----
bool SentencePieceTokenizer::load(const fs::path& model_path) {
    auto processor = std::make_unique<sentencepiece::SentencePieceProcessor>();
    const auto status = processor->Load(model_path.string());
    if (!status.ok()) {
        std::cerr << "[Tokenizer] Failed to load SentencePiece model: " << status.ToString() << '\n';
        return false;
    }
    processor_ = std::move(processor);

    eos_id_ = processor_->eos_id();
    pad_id_ = processor_->pad_id();
    if (eos_id_ < 0) {
        eos_id_ = token_to_id("</s>");
    }
    apply_metadata(model_path.parent_path());

    std::cout << "[Tokenizer] Loaded SentencePiece model from " << model_path.string() << '\n';
    return true;
}

std::vector<int> SentencePieceTokenizer::encode(const std::string& text) const {
    std::vector<int> ids;
    if (!processor_) {
        return ids;
    }
    const auto status = processor_->Encode(text, &ids);
    if (!status.ok()) {
        std::cerr << "[Tokenizer] Encode failed: " << status.ToString() << '\n';
        return {};
    }
    return ids;
}

std::string SentencePieceTokenizer::decode(const std::vector<int>& ids) const {
    std::string text;
    if (!processor_ || ids.empty()) {
        return text;
    }
    const auto status = processor_->Decode(ids, &text);
    if (!status.ok()) {
        std::cerr << "[Tokenizer] Decode failed: " << status.ToString() << '\n';
        return {};
    }
    return text;
}

int SentencePieceTokenizer::token_to_id(const std::string& token) const {
    if (!processor_ || token.empty()) {
        return -1;
    }
    // PieceToId answers unk for unknown pieces; only the unk piece itself maps to unk.
    const int unk = processor_->unk_id();
    const int id = processor_->PieceToId(token);
    if (id == unk && token != processor_->IdToPiece(unk)) {
        return -1;
    }
    return id;
}

// ---- backend selection ----
std::shared_ptr<const Tokenizer> load_tokenizer(const fs::path& path) {
    if (path.empty()) {
        std::cerr << "[Tokenizer] Empty tokenizer path provided.\n";
        return nullptr;
    }

    fs::path file = path;
    if (fs::is_directory(file)) {
        file = pick_from_directory(path);
        if (file.empty()) {
            std::cerr << "[Tokenizer] Directory " << path.string()
                      << " does not contain a supported tokenizer file.\n";
            return nullptr;
        }
    }
    if (!fs::exists(file)) {
        std::cerr << "[Tokenizer] Tokenizer file does not exist: " << file.string() << '\n';
        return nullptr;
    }

    if (looks_like_json(file)) {
        auto tokenizer = std::make_shared<BpeTokenizer>();
        if (tokenizer->load(file)) {
            return tokenizer;
        }
    } else {
        auto tokenizer = std::make_shared<SentencePieceTokenizer>();
        if (tokenizer->load(file)) {
            return tokenizer;
        }
    }
    std::cerr << "[Tokenizer] Failed to initialise tokenizer from " << file.string() << '\n';
    return nullptr;
}

} // namespace zenzbench
