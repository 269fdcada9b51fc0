#include "ZenzBench/Variants.hpp"

#include <cctype>

namespace zenzbench {

namespace {

const VariantInfo kStatelessFp16{
    " [FP16]",
    "zenz_v1",
    "zenz_v1 (FP16 stateless)",
    "Highest fidelity logits with the largest memory footprint."};

const VariantInfo kStateless8Bit{
    " [8-bit]",
    "zenz_v1-8bit",
    "zenz_v1 (8-bit stateless)",
    "Quantized for lower RAM/GPU demand at the cost of precision."};

const VariantInfo kStatefulFp16{
    " [Stateful FP16]",
    "zenz_v1_stateful",
    "zenz_v1_stateful (FP16)",
    "Streaming graph with full precision states."};

const VariantInfo kStateful8Bit{
    " [Stateful 8-bit]",
    "zenz_v1_stateful-8bit",
    "zenz_v1_stateful (8-bit)",
    "Smaller recurrent weights for lower-latency streaming."};

} // namespace

const VariantInfo& variant_info(StatelessVariant variant) {
    switch (variant) {
        case StatelessVariant::StandardFP16: return kStatelessFp16;
        case StatelessVariant::Compressed8Bit: return kStateless8Bit;
    }
    return kStatelessFp16;
}

const VariantInfo& variant_info(StatefulVariant variant) {
    switch (variant) {
        case StatefulVariant::StandardFP16: return kStatefulFp16;
        case StatefulVariant::Compressed8Bit: return kStateful8Bit;
    }
    return kStatefulFp16;
}

std::optional<Precision> parse_precision(const std::string& text) {
    std::string key;
    for (char ch : text) {
        if (ch == '-' || ch == '_' || std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (key == "fp16" || key == "f16" || key == "standard") {
        return Precision::StandardFP16;
    }
    if (key == "8bit" || key == "int8" || key == "i8" || key == "compressed") {
        return Precision::Compressed8Bit;
    }
    return std::nullopt;
}

StatelessVariant stateless_variant(Precision precision) {
    return precision == Precision::StandardFP16 ? StatelessVariant::StandardFP16
                                                : StatelessVariant::Compressed8Bit;
}

StatefulVariant stateful_variant(Precision precision) {
    return precision == Precision::StandardFP16 ? StatefulVariant::StandardFP16
                                                : StatefulVariant::Compressed8Bit;
}

std::vector<BenchmarkPlanEntry> BenchmarkPlanEntry::default_order() {
    return {
        BenchmarkPlanEntry{StatelessVariant::StandardFP16},
        BenchmarkPlanEntry{StatelessVariant::Compressed8Bit},
        BenchmarkPlanEntry{StatefulVariant::StandardFP16},
        BenchmarkPlanEntry{StatefulVariant::Compressed8Bit},
    };
}

} // namespace zenzbench
