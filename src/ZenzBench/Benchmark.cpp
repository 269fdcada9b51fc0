#include "ZenzBench/Benchmark.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace zenzbench {

namespace {

const char* const kStatelessAsync = "[Stateless Greedy][Async global]";
const char* const kStatelessSync = "[Stateless Greedy][Sync main]";
const char* const kStatefulAsync = "[Stateful Greedy][Async global]";
const char* const kStatefulSync = "[Stateful Greedy][Sync main]";

template<typename Run>
std::pair<double, std::optional<std::string>> timed(Run&& run) {
    const auto start = std::chrono::steady_clock::now();
    std::optional<std::string> output = run();
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return {elapsed.count(), std::move(output)};
}

std::string timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

// ---- aggregation ----
void VariantAggregator::add(const BenchmarkResult& result) {
    const std::string& key = result.variant_key.empty() ? result.label : result.variant_key;
    auto& aggregate = aggregates_[key];
    aggregate.variant = key;
    aggregate.total += result.duration;
    aggregate.samples += 1;
}

std::vector<VariantAggregate> VariantAggregator::sorted() const {
    std::vector<VariantAggregate> out;
    out.reserve(aggregates_.size());
    for (const auto& [key, aggregate] : aggregates_) {
        out.push_back(aggregate);
    }
    std::stable_sort(out.begin(), out.end(), [](const VariantAggregate& a, const VariantAggregate& b) {
        return a.average() < b.average();
    });
    return out;
}

std::string variant_key(const std::string& label, const std::string& case_label) {
    if (case_label.empty()) {
        return label;
    }
    std::string key = label;
    for (auto pos = key.find(case_label); pos != std::string::npos; pos = key.find(case_label, pos)) {
        key.erase(pos, case_label.size());
    }
    return trim(key);
}

// ---- ranking ----
std::string format_ranking(const std::string& case_label, const std::vector<BenchmarkResult>& results) {
    std::vector<const BenchmarkResult*> ranked;
    for (const auto& result : results) {
        if (result.case_label == case_label) {
            ranked.push_back(&result);
        }
    }
    if (ranked.empty()) {
        return {};
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const BenchmarkResult* a, const BenchmarkResult* b) {
        return a->duration < b->duration;
    });

    std::ostringstream oss;
    oss << "===== Benchmark Ranking for " << case_label << " (fast → slow) =====";
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        const auto& r = *ranked[i];
        oss << '\n' << (i + 1) << ". " << r.label << ": " << r.duration << " s " << r.input << ", " << r.output;
    }
    return oss.str();
}

// ---- runner ----
BenchmarkRunner::BenchmarkRunner(const BenchmarkEnvironment& env, LogSink& log, RunnerOptions options)
    : env_(env), log_(log), options_(std::move(options)) {}

void BenchmarkRunner::reset() {
    results_.clear();
    aggregator_.clear();
}

void BenchmarkRunner::record_result(std::string label, const BenchmarkCase& benchmark_case, double duration,
                                    const std::string& input, std::optional<std::string> output,
                                    std::vector<BenchmarkResult>& out) const {
    if (!output) {
        log_.write("[Benchmarks] Omitted: " + label + " failed.");
        return;
    }
    BenchmarkResult result;
    result.variant_key = variant_key(label, benchmark_case.label);
    result.label = std::move(label);
    result.case_label = benchmark_case.label;
    result.duration = duration;
    result.input = input;
    result.matches_expected = output_matches_expected(*output, benchmark_case.expected_output);
    result.output = std::move(*output);
    out.push_back(std::move(result));
}

void BenchmarkRunner::run_stateless(StatelessVariant variant, StatelessPredictor& model,
                                    const BenchmarkCase& benchmark_case, const std::string& prompt,
                                    std::vector<BenchmarkResult>& out) {
    const VariantInfo& info = variant_info(variant);
    DecodeOptions decode = options_.decode;
    decode.variant_name = info.debug_name;
    const Tokenizer& tokenizer = *env_.tokenizer;

    auto [async_seconds, async_output] = timed([&]() {
        return greedy_predict_async(prompt, model, tokenizer, decode, log_).get();
    });
    record_result(kStatelessAsync + std::string(info.label_suffix) + benchmark_case.label,
                  benchmark_case, async_seconds, prompt, std::move(async_output), out);

    if (options_.include_sync) {
        auto [sync_seconds, sync_output] = timed([&]() {
            return greedy_predict(prompt, model, tokenizer, decode, log_);
        });
        record_result(kStatelessSync + std::string(info.label_suffix) + benchmark_case.label,
                      benchmark_case, sync_seconds, prompt, std::move(sync_output), out);
    }
}

void BenchmarkRunner::run_stateful(StatefulVariant variant, const StatefulHandle& handle,
                                   const BenchmarkCase& benchmark_case, const std::string& prompt,
                                   std::vector<BenchmarkResult>& out) {
    const VariantInfo& info = variant_info(variant);
    DecodeOptions decode = options_.decode;
    decode.variant_name = info.debug_name;
    const Tokenizer& tokenizer = *env_.tokenizer;

    // Plan building happens on first use; keep it out of the timed run.
    warm_up_stateful(handle, decode, log_);

    auto [async_seconds, async_output] = timed([&]() {
        return greedy_predict_stateful_async(prompt, handle, tokenizer, decode, log_).get();
    });
    record_result(kStatefulAsync + std::string(info.label_suffix) + benchmark_case.label,
                  benchmark_case, async_seconds, prompt, std::move(async_output), out);

    if (options_.include_sync) {
        auto [sync_seconds, sync_output] = timed([&]() {
            return greedy_predict_stateful(prompt, handle, tokenizer, decode, log_);
        });
        record_result(kStatefulSync + std::string(info.label_suffix) + benchmark_case.label,
                      benchmark_case, sync_seconds, prompt, std::move(sync_output), out);
    }
}

void BenchmarkRunner::run_case(const BenchmarkCase& benchmark_case) {
    const std::string prompt = encode_prompt(benchmark_case.prompt, options_.wrap_kana_markers);
    if (prompt.empty()) {
        log_.write("[Benchmarks] Skipped: Empty prompt for " + benchmark_case.label + ".");
        return;
    }
    log_.write("[Case] " + benchmark_case.label);

    std::vector<BenchmarkPlanEntry> active;
    for (const auto& entry : BenchmarkPlanEntry::default_order()) {
        const bool loaded = entry.is_stateless()
            ? env_.stateless(std::get<StatelessVariant>(entry.kind)) != nullptr
            : env_.stateful(std::get<StatefulVariant>(entry.kind)) != nullptr;
        if (loaded) {
            active.push_back(entry);
        }
    }
    if (active.empty() || !env_.tokenizer) {
        log_.write("[Benchmarks] Skipped: No models loaded for " + benchmark_case.label + ".");
        return;
    }

    std::vector<BenchmarkResult> case_results;
    for (const auto& entry : active) {
        if (entry.is_stateless()) {
            const auto variant = std::get<StatelessVariant>(entry.kind);
            run_stateless(variant, *env_.stateless(variant), benchmark_case, prompt, case_results);
        } else {
            const auto variant = std::get<StatefulVariant>(entry.kind);
            run_stateful(variant, *env_.stateful(variant), benchmark_case, prompt, case_results);
        }
    }

    for (const auto& result : case_results) {
        aggregator_.add(result);
        results_.push_back(result);
    }
    const std::string ranking = format_ranking(benchmark_case.label, case_results);
    if (!ranking.empty()) {
        log_.write(ranking);
    }
}

void BenchmarkRunner::run_suite(const std::vector<BenchmarkCase>& cases, SuiteScope scope) {
    const char* tag = scope == SuiteScope::Short ? "[RunShort]" : "[RunAll]";
    const std::size_t count = scope == SuiteScope::Short ? std::min(cases.size(), kShortSuiteSize) : cases.size();
    if (count == 0) {
        log_.write(std::string(tag) + " Aborted: no benchmark cases.");
        return;
    }

    log_.write(std::string(tag) + " Started at " + timestamp());
    for (std::size_t i = 0; i < count; ++i) {
        run_case(cases[i]);
    }
    log_.write(std::string(tag) + " Finished at " + timestamp());
}

} // namespace zenzbench
