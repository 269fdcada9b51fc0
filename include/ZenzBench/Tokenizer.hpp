#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <sentencepiece_processor.h>

namespace zenzbench {

/**
 * Text <-> token id conversion. Implementations are immutable after loading
 * and safe to share between the sync and async decoding paths.
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::vector<int> encode(const std::string& text) const = 0;
    virtual std::string decode(const std::vector<int>& ids) const = 0;

    /// -1 when the token is not in the vocabulary.
    virtual int token_to_id(const std::string& token) const = 0;

    int eos_token_id() const { return eos_id_; }
    int pad_token_id() const { return pad_id_; }

protected:
    // Fills unset ids from special_tokens_map.json / tokenizer_config.json
    // next to the tokenizer file.
    void apply_metadata(const std::filesystem::path& directory);

    int eos_id_{-1};
    int pad_id_{-1};
};

class SentencePieceTokenizer : public Tokenizer {
public:
    bool load(const std::filesystem::path& model_path);

    std::vector<int> encode(const std::string& text) const override;
    std::string decode(const std::vector<int>& ids) const override;
    int token_to_id(const std::string& token) const override;

private:
    std::unique_ptr<sentencepiece::SentencePieceProcessor> processor_;
};

/**
 * HuggingFace byte-level BPE (tokenizer.json). Every entry of
 * `added_tokens` is matched verbatim before BPE runs and decoded verbatim,
 * which is how `[PAD]`, `</s>` and the kana marker characters stay single
 * tokens.
 */
class BpeTokenizer : public Tokenizer {
public:
    bool load(const std::filesystem::path& json_path);

    std::vector<int> encode(const std::string& text) const override;
    std::string decode(const std::vector<int>& ids) const override;
    int token_to_id(const std::string& token) const override;

    std::size_t vocab_size() const { return id_to_token_.size(); }

private:
    bool read_vocab(const nlohmann::json& model);
    bool read_merges(const nlohmann::json& model);
    void read_added_tokens(const nlohmann::json& root);
    void build_byte_tables();

    void encode_text(const std::string& text, std::vector<int>& out) const;
    void encode_word(const std::string& word, std::vector<int>& out) const;
    std::vector<std::string> merge_word(const std::string& word) const;

    std::unordered_map<std::string, int> vocab_;
    std::vector<std::string> id_to_token_;
    std::unordered_map<std::string, std::size_t> merge_ranks_;
    std::regex pre_tokenizer_;

    std::vector<std::string> byte_to_unicode_;
    std::unordered_map<std::string, std::uint8_t> unicode_to_byte_;

    std::vector<std::pair<std::string, int>> added_tokens_; ///< longest first
    std::unordered_set<int> added_token_ids_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, std::vector<std::string>> merge_cache_;
};

/**
 * Loads the backend matching `path`: a `.model`/`.spm` file is SentencePiece,
 * a JSON file is byte-level BPE, and a directory is searched for
 * tokenizer.json, tokenizer.model and spiece.model in that order.
 * Returns nullptr (after logging) on failure.
 */
std::shared_ptr<const Tokenizer> load_tokenizer(const std::filesystem::path& path);

} // namespace zenzbench
