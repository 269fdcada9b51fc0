#pragma once

#include "ZenzBench/Engine.hpp"
#include "ZenzBench/Variants.hpp"

#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace zenzbench {

/**
 * Loader slots for one execution mode. An empty std::function, a loader
 * that returns nullptr and a loader whose future yields nullptr all count
 * as "this precision is unavailable".
 */
using StatelessLoader = std::function<std::shared_ptr<StatelessPredictor>()>;
using StatelessAsyncLoader = std::function<std::future<std::shared_ptr<StatelessPredictor>>()>;

using StatefulFp16Loader = std::function<std::shared_ptr<StatefulFp16Model>()>;
using Stateful8BitLoader = std::function<std::shared_ptr<Stateful8BitModel>()>;
using StatefulFp16AsyncLoader = std::function<std::future<std::shared_ptr<StatefulFp16Model>>()>;
using Stateful8BitAsyncLoader = std::function<std::future<std::shared_ptr<Stateful8BitModel>>()>;

// Try the requested precision's loader first, then the other one. Each
// loader is called at most once per resolution; nothing is cached.
[[nodiscard]] std::shared_ptr<StatelessPredictor> resolve_stateless_model(
    StatelessVariant variant,
    const StatelessLoader& load_fp16,
    const StatelessLoader& load_8bit);

std::future<std::shared_ptr<StatelessPredictor>> resolve_stateless_model_async(
    StatelessVariant variant,
    StatelessAsyncLoader load_fp16,
    StatelessAsyncLoader load_8bit);

// The handle records which concrete engine was obtained, so callers dispatch
// on the handle rather than on the variant they asked for.
[[nodiscard]] std::optional<StatefulHandle> resolve_stateful_model(
    StatefulVariant variant,
    const StatefulFp16Loader& load_fp16,
    const Stateful8BitLoader& load_8bit);

std::future<std::optional<StatefulHandle>> resolve_stateful_model_async(
    StatefulVariant variant,
    StatefulFp16AsyncLoader load_fp16,
    Stateful8BitAsyncLoader load_8bit);

} // namespace zenzbench
