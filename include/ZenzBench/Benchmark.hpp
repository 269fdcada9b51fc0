#pragma once

#include "ZenzBench/BenchmarkCase.hpp"
#include "ZenzBench/Decoding.hpp"
#include "ZenzBench/Environment.hpp"
#include "ZenzBench/LogSink.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zenzbench {

struct BenchmarkResult {
    std::string label;       ///< e.g. "[Stateless Greedy][Async global] [FP16][Greet1]"
    std::string case_label;
    std::string variant_key; ///< label with the case label removed
    double duration = 0.0;   ///< seconds
    std::string input;
    std::string output;
    std::optional<bool> matches_expected;
};

struct VariantAggregate {
    std::string variant;
    double total = 0.0;
    std::size_t samples = 0;

    [[nodiscard]] double average() const { return samples == 0 ? 0.0 : total / static_cast<double>(samples); }
};

/// Running per-variant duration totals across every case of a session.
class VariantAggregator {
public:
    void add(const BenchmarkResult& result);
    /// Ascending by average duration.
    [[nodiscard]] std::vector<VariantAggregate> sorted() const;
    void clear() { aggregates_.clear(); }

private:
    std::map<std::string, VariantAggregate> aggregates_;
};

[[nodiscard]] std::string variant_key(const std::string& label, const std::string& case_label);

/**
 * Ranking block for one case: the header line followed by
 * `<position>. <label>: <duration> s <input>, <output>` per result of that
 * case, fastest first. Empty when the case has no results.
 */
[[nodiscard]] std::string format_ranking(const std::string& case_label,
                                         const std::vector<BenchmarkResult>& results);

enum class SuiteScope {
    All,
    Short, ///< first kShortSuiteSize cases
};

inline constexpr std::size_t kShortSuiteSize = 6;

struct RunnerOptions {
    DecodeOptions decode;
    /// Also time the directly blocking call after the async one.
    bool include_sync = false;
    bool wrap_kana_markers = true;
};

/**
 * Times every loaded variant against each case, one run at a time in the
 * fixed declaration order, and writes one ranking block per case to the
 * sink. Failed runs are not ranked or averaged. Results and aggregates stay
 * queryable after the run.
 */
class BenchmarkRunner {
public:
    BenchmarkRunner(const BenchmarkEnvironment& env, LogSink& log, RunnerOptions options);

    void run_case(const BenchmarkCase& benchmark_case);
    void run_suite(const std::vector<BenchmarkCase>& cases, SuiteScope scope = SuiteScope::All);

    [[nodiscard]] const std::vector<BenchmarkResult>& results() const { return results_; }
    [[nodiscard]] std::vector<VariantAggregate> averages() const { return aggregator_.sorted(); }

    void reset();

private:
    void run_stateless(StatelessVariant variant, StatelessPredictor& model,
                       const BenchmarkCase& benchmark_case, const std::string& prompt,
                       std::vector<BenchmarkResult>& out);
    void run_stateful(StatefulVariant variant, const StatefulHandle& handle,
                      const BenchmarkCase& benchmark_case, const std::string& prompt,
                      std::vector<BenchmarkResult>& out);

    /// Appends a result for a successful run; a failed run (no output) is logged and left out.
    void record_result(std::string label, const BenchmarkCase& benchmark_case, double duration,
                       const std::string& input, std::optional<std::string> output,
                       std::vector<BenchmarkResult>& out) const;

    const BenchmarkEnvironment& env_;
    LogSink& log_;
    RunnerOptions options_;
    std::vector<BenchmarkResult> results_;
    VariantAggregator aggregator_;
};

} // namespace zenzbench
