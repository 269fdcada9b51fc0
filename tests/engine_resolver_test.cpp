/**
 * @file engine_resolver_test.cpp
 * @brief Preferred-then-alternate engine resolution for both modes.
 */

#include "ZenzBench/EngineResolver.hpp"

#include "test_support.hpp"

#include <cstdio>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace zenzbench;
using zenzbench::testing::make_parameters;
using zenzbench::testing::ScriptedPredictor;

namespace {

struct CallLog {
    std::vector<std::string> calls;
};

StatelessLoader counting(CallLog& log, const std::string& name, std::shared_ptr<StatelessPredictor> result) {
    return [&log, name, result]() {
        log.calls.push_back(name);
        return result;
    };
}

std::shared_ptr<StatelessPredictor> scripted() {
    return std::make_shared<ScriptedPredictor>(8, std::vector<int>{3});
}

} // namespace

static void test_stateless_prefers_requested() {
    CallLog log;
    const auto fp16 = scripted();
    const auto int8 = scripted();
    auto got = resolve_stateless_model(StatelessVariant::StandardFP16,
                                       counting(log, "fp16", fp16), counting(log, "8bit", int8));
    CHECK(got == fp16);
    CHECK(log.calls == (std::vector<std::string>{"fp16"}));

    log.calls.clear();
    got = resolve_stateless_model(StatelessVariant::Compressed8Bit,
                                  counting(log, "fp16", fp16), counting(log, "8bit", int8));
    CHECK(got == int8);
    CHECK(log.calls == (std::vector<std::string>{"8bit"}));
    std::printf("  test_stateless_prefers_requested: PASS\n");
}

static void test_stateless_falls_back() {
    CallLog log;
    const auto int8 = scripted();
    auto got = resolve_stateless_model(StatelessVariant::StandardFP16,
                                       counting(log, "fp16", nullptr), counting(log, "8bit", int8));
    CHECK(got == int8);
    CHECK(log.calls == (std::vector<std::string>{"fp16", "8bit"}));

    log.calls.clear();
    got = resolve_stateless_model(StatelessVariant::Compressed8Bit,
                                  counting(log, "fp16", nullptr), counting(log, "8bit", nullptr));
    CHECK(got == nullptr);
    CHECK(log.calls == (std::vector<std::string>{"8bit", "fp16"}));
    std::printf("  test_stateless_falls_back: PASS\n");
}

static void test_empty_and_throwing_loaders() {
    const auto fp16 = scripted();
    auto got = resolve_stateless_model(StatelessVariant::Compressed8Bit, [fp16]() { return fp16; }, StatelessLoader{});
    CHECK(got == fp16);

    got = resolve_stateless_model(StatelessVariant::StandardFP16,
                                  []() -> std::shared_ptr<StatelessPredictor> { throw std::runtime_error("disk"); },
                                  [fp16]() { return fp16; });
    CHECK(got == fp16);

    CHECK(resolve_stateless_model(StatelessVariant::StandardFP16, StatelessLoader{}, StatelessLoader{}) == nullptr);
    std::printf("  test_empty_and_throwing_loaders: PASS\n");
}

static void test_stateless_async() {
    const auto fp16 = scripted();
    int fp16_calls = 0;
    int int8_calls = 0;
    auto pending = resolve_stateless_model_async(
        StatelessVariant::StandardFP16,
        [&fp16_calls]() {
            ++fp16_calls;
            std::promise<std::shared_ptr<StatelessPredictor>> p;
            p.set_value(nullptr);
            return p.get_future();
        },
        [&int8_calls, fp16]() {
            ++int8_calls;
            return std::async(std::launch::async, [fp16]() { return fp16; });
        });
    CHECK(pending.get() == fp16);
    CHECK(fp16_calls == 1);
    CHECK(int8_calls == 1);

    // An invalid future counts as unavailable.
    auto none = resolve_stateless_model_async(
        StatelessVariant::Compressed8Bit,
        []() { return std::future<std::shared_ptr<StatelessPredictor>>{}; },
        StatelessAsyncLoader{});
    CHECK(none.get() == nullptr);
    std::printf("  test_stateless_async: PASS\n");
}

static void test_stateful_handle_reports_actual_precision() {
    auto fp16 = std::make_shared<StatefulFp16Model>(Fp16Weights(make_parameters(8, 4)));
    auto int8 = std::make_shared<Stateful8BitModel>(Int8Weights(make_parameters(8, 4)));

    auto handle = resolve_stateful_model(StatefulVariant::Compressed8Bit,
                                         [fp16]() { return fp16; },
                                         []() { return std::shared_ptr<Stateful8BitModel>{}; });
    CHECK(handle.has_value());
    CHECK(handle->precision() == Precision::StandardFP16);

    int fp16_calls = 0;
    handle = resolve_stateful_model(StatefulVariant::Compressed8Bit,
                                    [&fp16_calls, fp16]() { ++fp16_calls; return fp16; },
                                    [int8]() { return int8; });
    CHECK(handle->precision() == Precision::Compressed8Bit);
    CHECK(fp16_calls == 0);

    handle = resolve_stateful_model(StatefulVariant::StandardFP16, StatefulFp16Loader{}, Stateful8BitLoader{});
    CHECK(!handle.has_value());
    std::printf("  test_stateful_handle_reports_actual_precision: PASS\n");
}

static void test_stateful_async() {
    auto int8 = std::make_shared<Stateful8BitModel>(Int8Weights(make_parameters(8, 4)));
    auto pending = resolve_stateful_model_async(
        StatefulVariant::StandardFP16,
        []() -> std::future<std::shared_ptr<StatefulFp16Model>> { throw std::runtime_error("missing"); },
        [int8]() { return std::async(std::launch::async, [int8]() { return int8; }); });
    const auto handle = pending.get();
    CHECK(handle.has_value());
    CHECK(handle->precision() == Precision::Compressed8Bit);
    std::printf("  test_stateful_async: PASS\n");
}

int main() {
    std::printf("engine_resolver_test:\n");
    test_stateless_prefers_requested();
    test_stateless_falls_back();
    test_empty_and_throwing_loaders();
    test_stateless_async();
    test_stateful_handle_reports_actual_precision();
    test_stateful_async();
    std::printf("engine_resolver_test: ALL PASSED\n");
    return 0;
}
