/**
 * @file benchmark_test.cpp
 * @brief Environment assembly, case handling, ranking and the runner.
 */

#include "ZenzBench/Benchmark.hpp"
#include "ZenzBench/BenchmarkCase.hpp"
#include "ZenzBench/Environment.hpp"

#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace zenzbench;
using zenzbench::testing::LetterTokenizer;
using zenzbench::testing::make_parameters;
using zenzbench::testing::ScriptedPredictor;

namespace {

BenchmarkResult result(const std::string& label, const std::string& case_label, double duration) {
    BenchmarkResult r;
    r.label = label + case_label;
    r.case_label = case_label;
    r.variant_key = variant_key(r.label, case_label);
    r.duration = duration;
    r.input = "in";
    r.output = "out";
    return r;
}

template<typename T>
std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

std::shared_ptr<const Tokenizer> letters() {
    return std::make_shared<LetterTokenizer>();
}

std::shared_ptr<StatelessPredictor> scripted_eos() {
    return std::make_shared<ScriptedPredictor>(LetterTokenizer().vocab_size(), std::vector<int>{5, 3});
}

// Loaders that succeed only for the listed variants.
EngineLoaders partial_loaders(std::vector<StatelessVariant> stateless, std::vector<StatefulVariant> stateful) {
    EngineLoaders loaders;
    loaders.load_tokenizer = []() { return letters(); };
    loaders.load_stateless = [stateless](StatelessVariant variant) {
        for (const auto v : stateless) {
            if (v == variant) return ready<std::shared_ptr<StatelessPredictor>>(scripted_eos());
        }
        return ready<std::shared_ptr<StatelessPredictor>>(nullptr);
    };
    loaders.load_stateful = [stateful](StatefulVariant variant) {
        for (const auto v : stateful) {
            if (v == variant) {
                auto model = std::make_shared<StatefulFp16Model>(
                    Fp16Weights(make_parameters(LetterTokenizer().vocab_size(), 4)));
                return ready<std::optional<StatefulHandle>>(StatefulHandle(model));
            }
        }
        return ready<std::optional<StatefulHandle>>(std::nullopt);
    };
    return loaders;
}

RunnerOptions plain_options() {
    RunnerOptions options;
    options.wrap_kana_markers = false;
    options.decode.max_sequence_length = 6;
    return options;
}

} // namespace

static void test_variant_key_and_ranking() {
    CHECK(variant_key("[Stateless Greedy][Async global] [FP16][Greet1]", "[Greet1]") ==
          "[Stateless Greedy][Async global] [FP16]");
    CHECK(variant_key("abc", "") == "abc");

    const std::vector<BenchmarkResult> results = {
        result("slow ", "[A]", 0.30),
        result("fast ", "[A]", 0.10),
        result("other ", "[B]", 0.01),
        result("mid ", "[A]", 0.20),
    };
    const std::string ranking = format_ranking("[A]", results);
    CHECK(ranking.rfind("===== Benchmark Ranking for [A] (fast → slow) =====", 0) == 0);
    const auto fast = ranking.find("1. fast [A]");
    const auto mid = ranking.find("2. mid [A]");
    const auto slow = ranking.find("3. slow [A]");
    CHECK(fast != std::string::npos && mid != std::string::npos && slow != std::string::npos);
    CHECK(fast < mid && mid < slow);
    CHECK(ranking.find("other") == std::string::npos);
    CHECK(format_ranking("[Z]", results).empty());
    std::printf("  test_variant_key_and_ranking: PASS\n");
}

static void test_aggregator_averages() {
    VariantAggregator aggregator;
    aggregator.add(result("x ", "[A]", 1.0));
    aggregator.add(result("x ", "[B]", 3.0));
    aggregator.add(result("y ", "[A]", 0.5));
    const auto sorted = aggregator.sorted();
    CHECK(sorted.size() == 2);
    CHECK(sorted[0].variant == "y");
    CHECK(sorted[1].variant == "x");
    CHECK(sorted[1].samples == 2);
    CHECK(sorted[1].average() == 2.0);
    aggregator.clear();
    CHECK(aggregator.sorted().empty());
    std::printf("  test_aggregator_averages: PASS\n");
}

static void test_case_sanitizing() {
    CHECK(default_benchmark_cases().size() == 23);
    CHECK(default_benchmark_cases()[3].label == "[Greet1]");

    const auto blank = sanitize_case({"x", std::string("  ") + kKanaOpenMarker + kKanaCloseMarker, ""});
    CHECK(!blank.has_value());

    const auto custom = sanitize_case({"  ", std::string(kKanaOpenMarker) + " ニホンゴ " + kKanaCloseMarker, " 日本語 "});
    CHECK(custom.has_value());
    CHECK(custom->label == "[Custom]");
    CHECK(custom->prompt == "ニホンゴ");
    CHECK(custom->expected_output == "日本語");

    CHECK(encode_prompt("ニホンゴ", true) == std::string(kKanaOpenMarker) + "ニホンゴ" + kKanaCloseMarker);
    CHECK(encode_prompt(std::string(kKanaOpenMarker) + "ab" + kKanaCloseMarker, false) == "ab");
    CHECK(encode_prompt("   ", true).empty());
    std::printf("  test_case_sanitizing: PASS\n");
}

static void test_expected_output_matching() {
    CHECK(!output_matches_expected("anything", "  ").has_value());
    CHECK(output_matches_expected(std::string(kKanaOpenMarker) + "ニホンゴ" + kKanaCloseMarker + "日本語", "日本語") == true);
    CHECK(output_matches_expected("Hello World", "hello world") == true);
    CHECK(output_matches_expected("", "日本語") == false);
    CHECK(output_matches_expected("韓国語", "日本語") == false);

    // Diacritics and case fold on both sides, precomposed or combining.
    CHECK(output_matches_expected("Caf\xC3\xA9 au lait", "CAFE") == true);
    CHECK(output_matches_expected("cafe\xCC\x81", "caf\xC3\xA9") == true);
    CHECK(output_matches_expected("\xC3\x89" "COLE", "\xC3\xA9" "cole") == true);
    CHECK(output_matches_expected("ベンキョウ", "ヘンキョウ") == true);
    CHECK(output_matches_expected("ばば", "はは") == true);
    CHECK(output_matches_expected("ヴァ", "ウァ") == true);
    CHECK(output_matches_expected("日本\xE3\x80\x80語", "日本語") == true);
    CHECK(output_matches_expected("ベンキョウ", "ケンキュウ") == false);
    std::printf("  test_expected_output_matching: PASS\n");
}

static void test_load_cases_file() {
    const auto dir = zenzbench::testing::scratch_dir("cases");
    const auto path = dir / "cases.json";
    {
        std::ofstream out(path);
        out << R"([{"label": "[One]", "prompt": "ab", "expected": "ab"},
                  {"label": "[Empty]", "prompt": "  "},
                  {"prompt": "cd"},
                  42])";
    }
    const auto cases = load_cases(path);
    CHECK(cases.size() == 2);
    CHECK(cases[0].label == "[One]");
    CHECK(cases[0].expected_output == "ab");
    CHECK(cases[1].label == "[Custom]");

    bool threw = false;
    try {
        (void)load_cases(dir / "missing.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
    std::printf("  test_load_cases_file: PASS\n");
}

static void test_configuration_summary() {
    ModelLoadConfiguration config;
    CHECK(config.empty());
    CHECK(config.summary() == "stateless: none | stateful: none");
    config.stateless.insert(StatelessVariant::Compressed8Bit);
    config.stateless.insert(StatelessVariant::StandardFP16);
    CHECK(config.summary() ==
          "stateless: zenz_v1 (FP16 stateless), zenz_v1 (8-bit stateless) | stateful: none");
    CHECK(ModelLoadConfiguration::all().stateful.size() == 2);
    std::printf("  test_configuration_summary: PASS\n");
}

static void test_environment_assembly() {
    MemoryLogSink log;
    CHECK(!make_benchmark_environment(ModelLoadConfiguration{}, partial_loaders({}, {}), log));
    CHECK(log.contains("[BenchmarkEnvironment] Skipped loading: empty configuration."));

    log.clear();
    auto env = make_benchmark_environment(ModelLoadConfiguration::all(),
                                          partial_loaders({StatelessVariant::StandardFP16},
                                                          {StatefulVariant::StandardFP16}),
                                          log);
    CHECK(env.has_value());
    CHECK(env->stateless(StatelessVariant::StandardFP16) != nullptr);
    CHECK(env->stateless(StatelessVariant::Compressed8Bit) == nullptr);
    CHECK(env->stateful(StatefulVariant::StandardFP16) != nullptr);
    CHECK(env->stateful(StatefulVariant::Compressed8Bit) == nullptr);
    CHECK(log.contains("[BenchmarkEnvironment] Missing stateless model zenz_v1-8bit."));
    CHECK(log.contains("[BenchmarkEnvironment] Missing stateful model zenz_v1_stateful-8bit."));

    log.clear();
    CHECK(!make_benchmark_environment(ModelLoadConfiguration::all(), partial_loaders({}, {}), log));
    CHECK(log.contains("[BenchmarkEnvironment] Failed to load any selected models."));

    EngineLoaders no_tokenizer = partial_loaders({StatelessVariant::StandardFP16}, {});
    no_tokenizer.load_tokenizer = []() { return std::shared_ptr<const Tokenizer>{}; };
    bool threw = false;
    try {
        (void)make_benchmark_environment(ModelLoadConfiguration::all(), no_tokenizer, log);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
    std::printf("  test_environment_assembly: PASS\n");
}

static void test_runner_ranks_loaded_variants_only() {
    MemoryLogSink log;
    // Slots 1 and 3 of the declaration order.
    auto env = make_benchmark_environment(ModelLoadConfiguration::all(),
                                          partial_loaders({StatelessVariant::StandardFP16},
                                                          {StatefulVariant::StandardFP16}),
                                          log);
    CHECK(env.has_value());

    BenchmarkRunner runner(*env, log, plain_options());
    runner.run_case({"[Tiny]", "ab", ""});

    const auto& results = runner.results();
    CHECK(results.size() == 2);
    CHECK(results[0].label == "[Stateless Greedy][Async global] [FP16][Tiny]");
    CHECK(results[0].output == "abb");
    CHECK(results[1].label == "[Stateful Greedy][Async global] [Stateful FP16][Tiny]");
    CHECK(!results[1].matches_expected.has_value());
    CHECK(log.contains("[Case] [Tiny]"));
    CHECK(log.contains("===== Benchmark Ranking for [Tiny] (fast → slow) ====="));
    CHECK(!log.contains("\n3. "));
    CHECK(runner.averages().size() == 2);
    std::printf("  test_runner_ranks_loaded_variants_only: PASS\n");
}

static void test_runner_sync_and_suite() {
    MemoryLogSink log;
    auto env = make_benchmark_environment(ModelLoadConfiguration::all(),
                                          partial_loaders({StatelessVariant::Compressed8Bit}, {}),
                                          log);
    CHECK(env.has_value());

    RunnerOptions options = plain_options();
    options.include_sync = true;
    BenchmarkRunner runner(*env, log, options);

    std::vector<BenchmarkCase> cases;
    for (int i = 0; i < 8; ++i) {
        cases.push_back({"[C" + std::to_string(i) + "]", "a", "ab"});
    }
    runner.run_suite(cases, SuiteScope::Short);
    CHECK(runner.results().size() == 2 * kShortSuiteSize);
    CHECK(log.contains("[RunShort] Started at"));
    CHECK(log.contains("[RunShort] Finished at"));
    CHECK(runner.results()[1].label == "[Stateless Greedy][Sync main] [8-bit][C0]");
    // The first run decodes "ab"; later ones stop at the prompt.
    CHECK(runner.results()[0].matches_expected == true);

    const auto averages = runner.averages();
    CHECK(averages.size() == 2);
    CHECK(averages[0].samples == kShortSuiteSize);

    runner.reset();
    CHECK(runner.results().empty());
    log.clear();
    runner.run_suite({}, SuiteScope::All);
    CHECK(log.contains("[RunAll] Aborted: no benchmark cases."));

    log.clear();
    runner.run_case({"[Blank]", "   ", ""});
    CHECK(log.contains("[Benchmarks] Skipped: Empty prompt for [Blank]."));
    std::printf("  test_runner_sync_and_suite: PASS\n");
}

static void test_runner_leaves_out_failed_runs() {
    MemoryLogSink log;
    BenchmarkEnvironment env;
    env.tokenizer = letters();
    env.stateless_models[StatelessVariant::StandardFP16] =
        std::make_shared<ScriptedPredictor>(LetterTokenizer().vocab_size(), std::vector<int>{5}, 0);
    env.stateless_models[StatelessVariant::Compressed8Bit] = scripted_eos();

    BenchmarkRunner runner(env, log, plain_options());
    runner.run_case({"[P]", "a", ""});

    const auto& results = runner.results();
    CHECK(results.size() == 1);
    CHECK(results[0].label == "[Stateless Greedy][Async global] [8-bit][P]");
    CHECK(results[0].output == "ab");
    CHECK(log.contains("zenz_v1 step 0 failed"));
    CHECK(log.contains("[Benchmarks] Omitted: [Stateless Greedy][Async global] [FP16][P] failed."));
    CHECK(log.contains("1. [Stateless Greedy][Async global] [8-bit][P]"));
    CHECK(!log.contains("\n2. "));
    CHECK(!log.contains("[FP16][P]: "));

    const auto averages = runner.averages();
    CHECK(averages.size() == 1);
    CHECK(averages[0].variant == "[Stateless Greedy][Async global] [8-bit]");

    // Every run failing leaves no ranking block at all.
    runner.reset();
    log.clear();
    env.stateless_models.erase(StatelessVariant::Compressed8Bit);
    runner.run_case({"[Q]", "a", ""});
    CHECK(runner.results().empty());
    CHECK(runner.averages().empty());
    CHECK(!log.contains("Benchmark Ranking for [Q]"));
    std::printf("  test_runner_leaves_out_failed_runs: PASS\n");
}

static void test_runner_without_models() {
    MemoryLogSink log;
    BenchmarkEnvironment env;
    env.tokenizer = letters();
    BenchmarkRunner runner(env, log, plain_options());
    runner.run_case({"[None]", "ab", ""});
    CHECK(runner.results().empty());
    CHECK(log.contains("[Benchmarks] Skipped: No models loaded for [None]."));
    std::printf("  test_runner_without_models: PASS\n");
}

int main() {
    std::printf("benchmark_test:\n");
    test_variant_key_and_ranking();
    test_aggregator_averages();
    test_case_sanitizing();
    test_expected_output_matching();
    test_load_cases_file();
    test_configuration_summary();
    test_environment_assembly();
    test_runner_ranks_loaded_variants_only();
    test_runner_sync_and_suite();
    test_runner_leaves_out_failed_runs();
    test_runner_without_models();
    std::printf("benchmark_test: ALL PASSED\n");
    return 0;
}
