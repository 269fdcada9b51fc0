#include "ZenzBench/BenchmarkCase.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace zenzbench {

namespace {

const char* const kCustomLabel = "[Custom]";

std::string erase_all(std::string text, const std::string& needle) {
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos)) {
        text.erase(pos, needle.size());
    }
    return text;
}

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

// Base letters for U+00C0..U+00FF; '\0' keeps the character (no canonical decomposition).
const char kLatin1Base[] =
    "AAAAAA\0CEEEEIIII\0NOOOOO\0\0UUUUY\0\0"
    "aaaaaa\0ceeeeiiii\0nooooo\0\0uuuuy\0y";

bool is_combining_mark(std::uint32_t cp) {
    return (cp >= 0x0300 && cp <= 0x036F) || cp == 0x3099 || cp == 0x309A || cp == 0xFF9E || cp == 0xFF9F;
}

bool is_wide_space(std::uint32_t cp) {
    return cp == 0x00A0 || cp == 0x3000 || (cp >= 0x2000 && cp <= 0x200B) || cp == 0x2028 || cp == 0x2029;
}

// Voiced and semi-voiced kana to the plain syllable.
std::uint32_t unvoice_kana(std::uint32_t cp) {
    switch (cp) {
        case 0x3094: return 0x3046; // ゔ
        case 0x309E: return 0x309D; // ゞ
        case 0x30F4: return 0x30A6; // ヴ
        case 0x30F7: case 0x30F8: case 0x30F9: case 0x30FA: return cp - 8; // ヷヸヹヺ
        case 0x30FE: return 0x30FD; // ヾ
        default: break;
    }
    const bool katakana = cp >= 0x30A1 && cp <= 0x30F6;
    const std::uint32_t h = katakana ? cp - 0x60 : cp;
    std::uint32_t base = h;
    if (h >= 0x304C && h <= 0x3062 && (h - 0x304B) % 2 == 1) {
        base = h - 1; // が..ぢ
    } else if (h == 0x3065 || h == 0x3067 || h == 0x3069) {
        base = h - 1; // づ で ど
    } else if (h >= 0x3070 && h <= 0x307D) {
        base = h - (h - 0x306F) % 3; // ば/ぱ .. ぼ/ぽ
    }
    if (base == h) {
        return cp;
    }
    return katakana ? base + 0x60 : base;
}

std::uint32_t fold_codepoint(std::uint32_t cp) {
    if (cp < 0x80) {
        return static_cast<std::uint32_t>(std::tolower(static_cast<int>(cp)));
    }
    if (cp >= 0xC0 && cp <= 0xFF) {
        const char base = kLatin1Base[cp - 0xC0];
        if (base != '\0') {
            return static_cast<std::uint32_t>(std::tolower(static_cast<unsigned char>(base)));
        }
        // Æ Ð Ø Þ lower to æ ð ø þ; × ß ÷ stay.
        return (cp <= 0xDE && cp != 0xD7) ? cp + 0x20 : cp;
    }
    return unvoice_kana(cp);
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Decodes the sequence at `pos` and advances past it. A malformed sequence
// yields its lead byte, copied through unchanged by the caller.
bool next_codepoint(const std::string& text, std::size_t& pos, std::uint32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        cp = lead;
        length = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        length = 4;
    }
    if (length == 0 || pos + length > text.size()) {
        ++pos;
        return false;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            ++pos;
            return false;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }
    pos += length;
    return true;
}

// Markers and whitespace removed, case and diacritics folded.
std::string comparison_form(const std::string& text) {
    const std::string plain = remove_kana_markers(text);
    std::string out;
    std::size_t pos = 0;
    while (pos < plain.size()) {
        const std::size_t start = pos;
        std::uint32_t cp = 0;
        if (!next_codepoint(plain, pos, cp)) {
            out += plain[start];
            continue;
        }
        if ((cp < 0x80 && is_space(static_cast<unsigned char>(cp))) || is_wide_space(cp) || is_combining_mark(cp)) {
            continue;
        }
        append_utf8(out, fold_codepoint(cp));
    }
    return out;
}

} // namespace

const std::vector<BenchmarkCase>& default_benchmark_cases() {
    static const std::vector<BenchmarkCase> cases = {
        {"[ニホンゴ]", "ニホンゴ", ""},
        {"[カンコクゴ]", "カンコクゴヲベンキョウスル", ""},
        {"[LongJP]", "ワタシハイマニホンゴノベンキョウヲシテイテ、スマートフォンノキーボードデヘンカンセイドヲアゲタイトオモッテイマス", ""},
        {"[Greet1]", "オハヨウゴザイマス", ""},
        {"[Greet2]", "ハジメマシテ、ワタシハスカイラインデス", ""},
        {"[ShortQ]", "ゲンキデスカ", ""},
        {"[Weather]", "キョウハトテモアツイデスネ", ""},
        {"[Meetup]", "アシタノゴゴサンジニエキデアイマショウ", ""},
        {"[Dinner]", "キョウノバンナニヲタベタイデスカ", ""},
        {"[Culture]", "ニホンノブンカニキョウミガアリマス", ""},
        {"[KoreanSkill]", "カンコクゴヲモットジョウズニハナセルヨウニナリタイデス", ""},
        {"[HobbyMovie]", "ヒマナトキハヨクエイガヲミマス", ""},
        {"[HobbyBook]", "ワタシノシュミハホンヲヨムコトデス", ""},
        {"[PCFreeze]", "コンピュータノガメンガフリーズシテシマイマシタ", ""},
        {"[Battery]", "スマホノバッテリーガスグニナクナッテコマッテイマス", ""},
        {"[Keyboard]", "キーボードノヘンカンセイドガアガルトモットハヤクウテマス", ""},
        {"[Cafe]", "キノウハトモダチトエキマエノカフェデコーヒーヲノミマシタ", ""},
        {"[TimeMeet]", "サンジニシゴトガオワルノデヨジニアエマス", ""},
        {"[NextHoliday]", "ツギノヤスミハドコニイキマショウカ", ""},
        {"[LongJP2]", "ワタシノシュミハホンヲヨムコトデ、トクニミステリーショウセツガスキデス", ""},
        {"[LongJP3]", "マイニチシゴトノマエニコーヒーヲイッパイノムノガナンタノシミデス", ""},
        {"[LongJP4]", "ワタシハマイニチネルトキニニジカンホドニホンゴノベンキョウヲシテイマス", ""},
        {"[LongJPKeyboard]", "イツモスマートフォンノキーボードデニホンゴヲウツノデ、ヘンカンセイドガタカイトホントウニタスカリマス", ""},
    };
    return cases;
}

std::string remove_kana_markers(std::string text) {
    return erase_all(erase_all(std::move(text), kKanaOpenMarker), kKanaCloseMarker);
}

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(), [](char c) { return is_space(static_cast<unsigned char>(c)); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(), [](char c) { return is_space(static_cast<unsigned char>(c)); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::optional<BenchmarkCase> sanitize_case(BenchmarkCase input) {
    BenchmarkCase out;
    out.label = trim(input.label);
    if (out.label.empty()) {
        out.label = kCustomLabel;
    }
    out.prompt = trim(remove_kana_markers(std::move(input.prompt)));
    out.expected_output = trim(remove_kana_markers(std::move(input.expected_output)));
    if (out.prompt.empty()) {
        return std::nullopt;
    }
    return out;
}

std::vector<BenchmarkCase> load_cases(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open case file " + path.string());
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse case file " + path.string() + ": " + e.what());
    }
    if (!root.is_array()) {
        throw std::runtime_error("Case file " + path.string() + " must hold a JSON array");
    }

    std::vector<BenchmarkCase> cases;
    for (std::size_t i = 0; i < root.size(); ++i) {
        const auto& entry = root[i];
        if (!entry.is_object()) {
            std::cerr << "[Cases] Entry " << i << " is not an object, skipped\n";
            continue;
        }
        BenchmarkCase raw;
        try {
            raw.label = entry.value("label", std::string{});
            raw.prompt = entry.value("prompt", std::string{});
            raw.expected_output = entry.value("expected", std::string{});
        } catch (const json::exception& e) {
            std::cerr << "[Cases] Entry " << i << " has a non-string field, skipped: " << e.what() << '\n';
            continue;
        }
        if (auto sanitized = sanitize_case(std::move(raw))) {
            cases.push_back(std::move(*sanitized));
        } else {
            std::cerr << "[Cases] Entry " << i << " has an empty prompt, skipped\n";
        }
    }

    std::cout << "[Cases] Loaded " << cases.size() << " cases from " << path.filename().string() << std::endl;
    return cases;
}

std::string encode_prompt(const std::string& prompt, bool wrap_markers) {
    const std::string body = trim(remove_kana_markers(prompt));
    if (!wrap_markers || body.empty()) {
        return body;
    }
    return std::string(kKanaOpenMarker) + body + kKanaCloseMarker;
}

std::optional<bool> output_matches_expected(const std::string& output, const std::string& expected) {
    const std::string want = comparison_form(expected);
    if (want.empty()) {
        return std::nullopt;
    }
    const std::string got = comparison_form(output);
    return !got.empty() && (got.find(want) != std::string::npos || want.find(got) != std::string::npos);
}

} // namespace zenzbench
