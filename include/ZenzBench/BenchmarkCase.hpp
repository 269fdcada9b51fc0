#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace zenzbench {

/// Private-use code points that delimit a kana prompt for the zenz tokenizer.
inline constexpr const char* kKanaOpenMarker = "\xEE\xB8\x80";  // U+EE00
inline constexpr const char* kKanaCloseMarker = "\xEE\xB8\x81"; // U+EE01

struct BenchmarkCase {
    std::string label;
    std::string prompt;
    std::string expected_output;
};

/// The built-in corpus of 23 katakana prompts.
const std::vector<BenchmarkCase>& default_benchmark_cases();

[[nodiscard]] std::string remove_kana_markers(std::string text);
[[nodiscard]] std::string trim(const std::string& text);

/**
 * Trims every field, strips kana markers from prompt and expected output and
 * substitutes `[Custom]` for a blank label. Returns nullopt for a blank prompt.
 */
[[nodiscard]] std::optional<BenchmarkCase> sanitize_case(BenchmarkCase input);

/**
 * Reads `[{"label": ..., "prompt": ..., "expected": ...}, ...]`.
 * Entries without a usable prompt are dropped with a log line.
 * Throws std::runtime_error when the file cannot be read or parsed.
 */
std::vector<BenchmarkCase> load_cases(const std::filesystem::path& path);

/// The text actually sent to the tokenizer for a case prompt.
[[nodiscard]] std::string encode_prompt(const std::string& prompt, bool wrap_markers);

/// nullopt when `expected` is blank.
[[nodiscard]] std::optional<bool> output_matches_expected(const std::string& output,
                                                          const std::string& expected);

} // namespace zenzbench
