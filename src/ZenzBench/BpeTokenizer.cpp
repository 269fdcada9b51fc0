#include "ZenzBench/Tokenizer.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zenzbench {

namespace {

constexpr char kMergeSeparator = ' ';

std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

std::vector<std::string> utf8_chars(const std::string& text) {
    std::vector<std::string> chars;
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t n = std::min(utf8_length(static_cast<unsigned char>(text[i])), text.size() - i);
        chars.push_back(text.substr(i, n));
        i += n;
    }
    return chars;
}

std::string utf8_from_codepoint(std::uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::string merge_key(const std::string& left, const std::string& right) {
    return left + kMergeSeparator + right;
}

} // namespace

bool BpeTokenizer::load(const fs::path& json_path) {
    std::ifstream in(json_path);
    if (!in) {
        std::cerr << "[Tokenizer] Failed to open tokenizer JSON: " << json_path.string() << '\n';
        return false;
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        std::cerr << "[Tokenizer] Failed to parse tokenizer JSON: " << e.what() << '\n';
        return false;
    }

    const auto model = root.find("model");
    if (model == root.end() || !model->is_object()) {
        std::cerr << "[Tokenizer] tokenizer.json missing `model` section.\n";
        return false;
    }
    if (!read_vocab(*model) || !read_merges(*model)) {
        return false;
    }
    read_added_tokens(root);

    // std::regex has no \p{L}; non-ASCII runs fall into the punctuation class.
    pre_tokenizer_ = std::regex("'s|'t|'re|'ve|'m|'ll|'d| ?[A-Za-z]+| ?[0-9]+| ?[^\\sA-Za-z0-9]+|\\s+");
    build_byte_tables();

    apply_metadata(json_path.parent_path());
    for (const char* name : {"</s>", "<|endoftext|>"}) {
        if (eos_id_ < 0) eos_id_ = token_to_id(name);
    }
    for (const char* name : {"[PAD]", "<pad>"}) {
        if (pad_id_ < 0) pad_id_ = token_to_id(name);
    }

    std::cout << "[Tokenizer] Loaded byte-level BPE from " << json_path.string()
              << " (" << id_to_token_.size() << " tokens, " << merge_ranks_.size() << " merges)\n";
    return true;
}

bool BpeTokenizer::read_vocab(const json& model) {
    const auto vocab = model.find("vocab");
    if (vocab == model.end() || !vocab->is_object()) {
        std::cerr << "[Tokenizer] tokenizer.json missing vocab.\n";
        return false;
    }
    vocab_.clear();
    id_to_token_.clear();
    vocab_.reserve(vocab->size());
    for (const auto& [token, value] : vocab->items()) {
        if (!value.is_number_integer() || value.get<int>() < 0) {
            std::cerr << "[Tokenizer] Bad id for vocab entry " << token << '\n';
            return false;
        }
        const auto id = value.get<int>();
        vocab_[token] = id;
        if (static_cast<std::size_t>(id) >= id_to_token_.size()) {
            id_to_token_.resize(static_cast<std::size_t>(id) + 1);
        }
        id_to_token_[static_cast<std::size_t>(id)] = token;
    }
    return true;
}

// Merges come as "left right" strings (older files) or [left, right] pairs.
bool BpeTokenizer::read_merges(const json& model) {
    const auto merges = model.find("merges");
    if (merges == model.end() || !merges->is_array()) {
        std::cerr << "[Tokenizer] tokenizer.json missing merges.\n";
        return false;
    }
    merge_ranks_.clear();
    for (std::size_t rank = 0; rank < merges->size(); ++rank) {
        const auto& entry = (*merges)[rank];
        if (entry.is_string()) {
            const auto text = entry.get<std::string>();
            const auto split = text.find(kMergeSeparator);
            if (split == std::string::npos) {
                continue;
            }
            merge_ranks_.emplace(merge_key(text.substr(0, split), text.substr(split + 1)), rank);
        } else if (entry.is_array() && entry.size() == 2 && entry[0].is_string() && entry[1].is_string()) {
            merge_ranks_.emplace(merge_key(entry[0].get<std::string>(), entry[1].get<std::string>()), rank);
        }
    }
    return true;
}

void BpeTokenizer::read_added_tokens(const json& root) {
    added_tokens_.clear();
    added_token_ids_.clear();

    const auto added = root.find("added_tokens");
    if (added == root.end() || !added->is_array()) {
        return;
    }
    for (const auto& entry : *added) {
        if (!entry.is_object()) {
            continue;
        }
        const std::string content = entry.value("content", std::string{});
        const int id = entry.value("id", -1);
        if (content.empty() || id < 0) {
            continue;
        }
        added_tokens_.emplace_back(content, id);
        added_token_ids_.insert(id);
        vocab_[content] = id;
        if (static_cast<std::size_t>(id) >= id_to_token_.size()) {
            id_to_token_.resize(static_cast<std::size_t>(id) + 1);
        }
        id_to_token_[static_cast<std::size_t>(id)] = content;
    }
    std::stable_sort(added_tokens_.begin(), added_tokens_.end(),
                     [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

// GPT-2 byte <-> printable unicode table.
void BpeTokenizer::build_byte_tables() {
    byte_to_unicode_.assign(256, std::string{});
    unicode_to_byte_.clear();

    const auto printable = [](int b) {
        return (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
    };
    std::uint32_t next_free = 256;
    for (int b = 0; b < 256; ++b) {
        const std::uint32_t cp = printable(b) ? static_cast<std::uint32_t>(b) : next_free++;
        byte_to_unicode_[static_cast<std::size_t>(b)] = utf8_from_codepoint(cp);
        unicode_to_byte_[byte_to_unicode_[static_cast<std::size_t>(b)]] = static_cast<std::uint8_t>(b);
    }
}

std::vector<int> BpeTokenizer::encode(const std::string& text) const {
    std::vector<int> ids;
    std::size_t pos = 0;
    std::size_t segment_start = 0;
    while (pos < text.size()) {
        const auto match = std::find_if(added_tokens_.begin(), added_tokens_.end(), [&](const auto& token) {
            return text.compare(pos, token.first.size(), token.first) == 0;
        });
        if (match == added_tokens_.end()) {
            pos += std::min(utf8_length(static_cast<unsigned char>(text[pos])), text.size() - pos);
            continue;
        }
        encode_text(text.substr(segment_start, pos - segment_start), ids);
        ids.push_back(match->second);
        pos += match->first.size();
        segment_start = pos;
    }
    encode_text(text.substr(segment_start), ids);
    return ids;
}

void BpeTokenizer::encode_text(const std::string& text, std::vector<int>& out) const {
    if (text.empty()) {
        return;
    }
    std::size_t cursor = 0;
    for (std::sregex_iterator it(text.begin(), text.end(), pre_tokenizer_), end; it != end; ++it) {
        const auto start = static_cast<std::size_t>(it->position());
        if (start > cursor) {
            encode_word(text.substr(cursor, start - cursor), out);
        }
        encode_word(it->str(), out);
        cursor = start + static_cast<std::size_t>(it->length());
    }
    if (cursor < text.size()) {
        encode_word(text.substr(cursor), out);
    }
}

void BpeTokenizer::encode_word(const std::string& word, std::vector<int>& out) const {
    std::string mapped;
    for (const unsigned char byte : word) {
        mapped += byte_to_unicode_[byte];
    }
    for (const auto& piece : merge_word(mapped)) {
        const auto it = vocab_.find(piece);
        if (it != vocab_.end()) {
            out.push_back(it->second);
            continue;
        }
        for (const auto& ch : utf8_chars(piece)) {
            const auto single = vocab_.find(ch);
            if (single != vocab_.end()) {
                out.push_back(single->second);
            }
        }
    }
}

std::vector<std::string> BpeTokenizer::merge_word(const std::string& word) const {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto cached = merge_cache_.find(word);
        if (cached != merge_cache_.end()) {
            return cached->second;
        }
    }

    std::vector<std::string> parts = utf8_chars(word);
    while (parts.size() > 1) {
        std::size_t best_rank = std::numeric_limits<std::size_t>::max();
        std::size_t best_at = parts.size();
        for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
            const auto rank = merge_ranks_.find(merge_key(parts[i], parts[i + 1]));
            if (rank != merge_ranks_.end() && rank->second < best_rank) {
                best_rank = rank->second;
                best_at = i;
            }
        }
        if (best_at == parts.size()) {
            break;
        }

        const std::string left = parts[best_at];
        const std::string right = parts[best_at + 1];
        std::vector<std::string> merged;
        merged.reserve(parts.size());
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i + 1 < parts.size() && parts[i] == left && parts[i + 1] == right) {
                merged.push_back(left + right);
                ++i;
            } else {
                merged.push_back(parts[i]);
            }
        }
        parts = std::move(merged);
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    merge_cache_.emplace(word, parts);
    return parts;
}

std::string BpeTokenizer::decode(const std::vector<int>& ids) const {
    std::string text;
    for (const int id : ids) {
        if (id < 0 || static_cast<std::size_t>(id) >= id_to_token_.size()) {
            continue;
        }
        const std::string& piece = id_to_token_[static_cast<std::size_t>(id)];
        if (added_token_ids_.count(id) > 0) {
            text += piece;
            continue;
        }
        for (const auto& ch : utf8_chars(piece)) {
            const auto byte = unicode_to_byte_.find(ch);
            if (byte == unicode_to_byte_.end()) {
                text += ch;
            } else {
                text += static_cast<char>(byte->second);
            }
        }
    }
    return text;
}

int BpeTokenizer::token_to_id(const std::string& token) const {
    const auto it = vocab_.find(token);
    return it == vocab_.end() ? -1 : it->second;
}

} // namespace zenzbench
