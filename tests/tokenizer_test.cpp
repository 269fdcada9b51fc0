/**
 * @file tokenizer_test.cpp
 * @brief Byte-level BPE loading, added tokens and backend selection.
 */

#include "ZenzBench/BenchmarkCase.hpp"
#include "ZenzBench/Tokenizer.hpp"

#include "test_support.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace zenzbench;
namespace fs = std::filesystem;

namespace {

// "Ġ" is the GPT-2 byte-table stand-in for a space.
const char* const kTokenizerJson = R"({
  "version": "1.0",
  "added_tokens": [
    {"id": 7, "content": "</s>", "special": true},
    {"id": 8, "content": "[PAD]", "special": true},
    {"id": 9, "content": "\uEE00", "special": false},
    {"id": 10, "content": "\uEE01", "special": false}
  ],
  "model": {
    "type": "BPE",
    "vocab": {"a": 0, "b": 1, "c": 2, "ab": 3, "Ġ": 4, "Ġab": 5, "abc": 6},
    "merges": ["a b", "ab c", ["Ġ", "ab"]]
  }
})";

fs::path write_tokenizer(const std::string& name) {
    const auto dir = zenzbench::testing::scratch_dir(name);
    std::ofstream(dir / "tokenizer.json") << kTokenizerJson;
    return dir;
}

} // namespace

static void test_bpe_merges() {
    const auto dir = write_tokenizer("bpe");
    BpeTokenizer tokenizer;
    CHECK(tokenizer.load(dir / "tokenizer.json"));
    CHECK(tokenizer.vocab_size() == 11);

    const auto ids = tokenizer.encode("abc ab");
    CHECK(ids == (std::vector<int>{6, 5}));
    CHECK(tokenizer.decode(ids) == "abc ab");
    CHECK(tokenizer.encode("ba") == (std::vector<int>{1, 0}));
    CHECK(tokenizer.token_to_id("Ġab") == 5);
    CHECK(tokenizer.token_to_id("zz") == -1);
    std::printf("  test_bpe_merges: PASS\n");
}

static void test_added_tokens_verbatim() {
    const auto dir = write_tokenizer("added");
    BpeTokenizer tokenizer;
    CHECK(tokenizer.load(dir / "tokenizer.json"));
    CHECK(tokenizer.eos_token_id() == 7);
    CHECK(tokenizer.pad_token_id() == 8);

    CHECK(tokenizer.encode("a[PAD]b</s>") == (std::vector<int>{0, 8, 1, 7}));
    CHECK(tokenizer.decode({0, 8, 1, 7}) == "a[PAD]b</s>");

    const std::string prompt = encode_prompt("ab", true);
    CHECK(tokenizer.encode(prompt) == (std::vector<int>{9, 3, 10}));
    CHECK(tokenizer.decode({9, 3, 10}) == prompt);
    std::printf("  test_added_tokens_verbatim: PASS\n");
}

static void test_metadata_overrides_fallbacks() {
    const auto dir = write_tokenizer("metadata");
    std::ofstream(dir / "special_tokens_map.json")
        << R"({"eos_token": {"content": "[PAD]"}, "pad_token": "</s>"})";
    BpeTokenizer tokenizer;
    CHECK(tokenizer.load(dir / "tokenizer.json"));
    CHECK(tokenizer.eos_token_id() == 8);
    CHECK(tokenizer.pad_token_id() == 7);
    std::printf("  test_metadata_overrides_fallbacks: PASS\n");
}

static void test_backend_selection() {
    const auto dir = write_tokenizer("select");
    const auto from_dir = load_tokenizer(dir);
    CHECK(from_dir != nullptr);
    CHECK(from_dir->encode("abc") == (std::vector<int>{6}));

    CHECK(load_tokenizer(dir / "tokenizer.json") != nullptr);
    CHECK(load_tokenizer(dir / "absent.json") == nullptr);
    CHECK(load_tokenizer(fs::path{}) == nullptr);

    const auto empty_dir = zenzbench::testing::scratch_dir("select_empty");
    CHECK(load_tokenizer(empty_dir) == nullptr);

    // Not JSON, so it goes to SentencePiece, which rejects it.
    std::ofstream(empty_dir / "broken.model") << "not a model";
    CHECK(load_tokenizer(empty_dir / "broken.model") == nullptr);

    std::ofstream(empty_dir / "broken.json") << "{ \"model\": 3 }";
    CHECK(load_tokenizer(empty_dir / "broken.json") == nullptr);
    std::printf("  test_backend_selection: PASS\n");
}

int main() {
    std::printf("tokenizer_test:\n");
    test_bpe_merges();
    test_added_tokens_verbatim();
    test_metadata_overrides_fallbacks();
    test_backend_selection();
    std::printf("tokenizer_test: ALL PASSED\n");
    return 0;
}
