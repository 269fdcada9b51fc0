#include "ZenzBench/EngineResolver.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace zenzbench {

namespace {

// A loader that throws is reported and treated like one that returned nothing.
template<typename Loader>
auto call_loader(const Loader& load) -> decltype(load()) {
    if (!load) {
        return nullptr;
    }
    try {
        return load();
    } catch (const std::exception& e) {
        std::cerr << "[EngineResolver] Loader failed: " << e.what() << std::endl;
        return nullptr;
    }
}

template<typename AsyncLoader>
auto await_loader(const AsyncLoader& load) -> decltype(load().get()) {
    if (!load) {
        return nullptr;
    }
    try {
        auto pending = load();
        if (!pending.valid()) {
            return nullptr;
        }
        return pending.get();
    } catch (const std::exception& e) {
        std::cerr << "[EngineResolver] Loader failed: " << e.what() << std::endl;
        return nullptr;
    }
}

template<typename Attempt>
auto first_available(bool prefer_first, const Attempt& first, const Attempt& second) -> decltype(first()) {
    const Attempt& preferred = prefer_first ? first : second;
    const Attempt& alternate = prefer_first ? second : first;
    if (auto result = preferred()) {
        return result;
    }
    return alternate();
}

template<typename Model>
std::optional<StatefulHandle> to_handle(std::shared_ptr<Model> model) {
    if (!model) {
        return std::nullopt;
    }
    return StatefulHandle(std::move(model));
}

} // namespace

std::shared_ptr<StatelessPredictor> resolve_stateless_model(StatelessVariant variant,
                                                            const StatelessLoader& load_fp16,
                                                            const StatelessLoader& load_8bit) {
    using Attempt = std::function<std::shared_ptr<StatelessPredictor>()>;
    const Attempt fp16 = [&]() { return call_loader(load_fp16); };
    const Attempt bit8 = [&]() { return call_loader(load_8bit); };
    return first_available(variant == StatelessVariant::StandardFP16, fp16, bit8);
}

std::future<std::shared_ptr<StatelessPredictor>> resolve_stateless_model_async(StatelessVariant variant,
                                                                               StatelessAsyncLoader load_fp16,
                                                                               StatelessAsyncLoader load_8bit) {
    return std::async(std::launch::async,
                      [variant, load_fp16 = std::move(load_fp16), load_8bit = std::move(load_8bit)]() {
        using Attempt = std::function<std::shared_ptr<StatelessPredictor>()>;
        const Attempt fp16 = [&]() { return await_loader(load_fp16); };
        const Attempt bit8 = [&]() { return await_loader(load_8bit); };
        return first_available(variant == StatelessVariant::StandardFP16, fp16, bit8);
    });
}

std::optional<StatefulHandle> resolve_stateful_model(StatefulVariant variant,
                                                     const StatefulFp16Loader& load_fp16,
                                                     const Stateful8BitLoader& load_8bit) {
    using Attempt = std::function<std::optional<StatefulHandle>()>;
    const Attempt fp16 = [&]() { return to_handle(call_loader(load_fp16)); };
    const Attempt bit8 = [&]() { return to_handle(call_loader(load_8bit)); };
    return first_available(variant == StatefulVariant::StandardFP16, fp16, bit8);
}

std::future<std::optional<StatefulHandle>> resolve_stateful_model_async(StatefulVariant variant,
                                                                        StatefulFp16AsyncLoader load_fp16,
                                                                        Stateful8BitAsyncLoader load_8bit) {
    return std::async(std::launch::async,
                      [variant, load_fp16 = std::move(load_fp16), load_8bit = std::move(load_8bit)]() {
        using Attempt = std::function<std::optional<StatefulHandle>()>;
        const Attempt fp16 = [&]() { return to_handle(await_loader(load_fp16)); };
        const Attempt bit8 = [&]() { return to_handle(await_loader(load_8bit)); };
        return first_available(variant == StatefulVariant::StandardFP16, fp16, bit8);
    });
}

} // namespace zenzbench
