#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zenzbench {

enum class Precision {
    StandardFP16,
    Compressed8Bit,
};

enum class StatelessVariant {
    StandardFP16,
    Compressed8Bit,
};

enum class StatefulVariant {
    StandardFP16,
    Compressed8Bit,
};

inline constexpr std::array<StatelessVariant, 2> kAllStatelessVariants = {
    StatelessVariant::StandardFP16, StatelessVariant::Compressed8Bit};
inline constexpr std::array<StatefulVariant, 2> kAllStatefulVariants = {
    StatefulVariant::StandardFP16, StatefulVariant::Compressed8Bit};

struct VariantInfo {
    const char* label_suffix;
    const char* debug_name;
    const char* title;
    const char* description;
};

[[nodiscard]] const VariantInfo& variant_info(StatelessVariant variant);
[[nodiscard]] const VariantInfo& variant_info(StatefulVariant variant);

/// "fp16" / "8bit" (case, '-' and '_' ignored) as used in configuration files and on the command line.
[[nodiscard]] std::optional<Precision> parse_precision(const std::string& text);

[[nodiscard]] StatelessVariant stateless_variant(Precision precision);
[[nodiscard]] StatefulVariant stateful_variant(Precision precision);

/// One slot of the benchmark declaration order.
struct BenchmarkPlanEntry {
    using Kind = std::variant<StatelessVariant, StatefulVariant>;

    Kind kind;

    [[nodiscard]] bool is_stateless() const { return std::holds_alternative<StatelessVariant>(kind); }

    /// stateless FP16, stateless 8-bit, stateful FP16, stateful 8-bit.
    static std::vector<BenchmarkPlanEntry> default_order();
};

} // namespace zenzbench
