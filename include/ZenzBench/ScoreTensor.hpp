#pragma once

#include <Eigen/Core>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace zenzbench {

enum class ScalarType {
    Float32,
    Float16,
    BFloat16,
    Float64,
    Int32,
};

[[nodiscard]] const char* scalar_type_name(ScalarType type);

/**
 * Read-only [batch, time, vocab] score buffer returned by one inference call.
 *
 * The declared shape and the stored element count are kept separately: an
 * engine may hand back a buffer shorter than its shape claims, and readers
 * are expected to check `element_count()` before touching a row.
 */
class ScoreTensor {
public:
    using Shape = std::array<std::size_t, 3>;
    using Storage = std::variant<std::vector<float>,
                                 std::vector<Eigen::half>,
                                 std::vector<Eigen::bfloat16>,
                                 std::vector<double>>;

    ScoreTensor() = default;
    ScoreTensor(Shape shape, Storage storage)
        : shape_(shape), storage_(std::move(storage)) {}

    /// Convert `values` into a buffer of `type`. Int32 is rejected.
    static ScoreTensor from_floats(Shape shape, const std::vector<float>& values, ScalarType type);

    [[nodiscard]] const Shape& shape() const { return shape_; }
    [[nodiscard]] std::size_t batch_size() const { return shape_[0]; }
    [[nodiscard]] std::size_t time_size() const { return shape_[1]; }
    [[nodiscard]] std::size_t vocab_size() const { return shape_[2]; }

    [[nodiscard]] std::size_t element_count() const;
    [[nodiscard]] ScalarType scalar_type() const;
    [[nodiscard]] const Storage& storage() const { return storage_; }

    /// Typed view of the buffer, or nullptr when the element type differs.
    template<typename T>
    [[nodiscard]] const T* data() const {
        const auto* values = std::get_if<std::vector<T>>(&storage_);
        return values ? values->data() : nullptr;
    }

    /// Slow element accessor. Throws std::out_of_range past the buffer.
    [[nodiscard]] float value_at(std::size_t flat_index) const;
    [[nodiscard]] float value_at(std::size_t batch, std::size_t time, std::size_t vocab) const;

private:
    Shape shape_{0, 0, 0};
    Storage storage_;
};

/**
 * Token-id input tensor shaped [batch, length].
 *
 * Ids are held as int32 regardless of the declared element type; the
 * declared type only records what the engine was handed (the stateless
 * single-shot window is a float tensor, everything else int32).
 */
class TokenTensor {
public:
    static constexpr std::size_t kMaxElements = std::size_t{1} << 20;

    /// Zero-filled tensor, or nullopt for an empty/oversized shape or a
    /// non-token element type.
    static std::optional<TokenTensor> create(std::size_t batch,
                                             std::size_t length,
                                             ScalarType type = ScalarType::Int32);

    [[nodiscard]] std::size_t batch_size() const { return batch_; }
    [[nodiscard]] std::size_t length() const { return length_; }
    [[nodiscard]] std::size_t size() const { return values_.size(); }
    [[nodiscard]] ScalarType scalar_type() const { return type_; }

    std::int32_t& operator[](std::size_t index) { return values_[index]; }
    std::int32_t operator[](std::size_t index) const { return values_[index]; }
    [[nodiscard]] std::int32_t at(std::size_t batch, std::size_t position) const;

    [[nodiscard]] const std::vector<std::int32_t>& values() const { return values_; }

private:
    TokenTensor(std::size_t batch, std::size_t length, ScalarType type)
        : batch_(batch), length_(length), type_(type), values_(batch * length, 0) {}

    std::size_t batch_;
    std::size_t length_;
    ScalarType type_;
    std::vector<std::int32_t> values_;
};

} // namespace zenzbench
