#include "ZenzBench/ScoreTensor.hpp"

#include <stdexcept>
#include <string>

namespace zenzbench {

const char* scalar_type_name(ScalarType type) {
    switch (type) {
        case ScalarType::Float32: return "F32";
        case ScalarType::Float16: return "F16";
        case ScalarType::BFloat16: return "BF16";
        case ScalarType::Float64: return "F64";
        case ScalarType::Int32: return "I32";
    }
    return "unknown";
}

ScoreTensor ScoreTensor::from_floats(Shape shape, const std::vector<float>& values, ScalarType type) {
    switch (type) {
        case ScalarType::Float32:
            return ScoreTensor(shape, values);
        case ScalarType::Float16: {
            std::vector<Eigen::half> converted(values.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                converted[i] = Eigen::half(values[i]);
            }
            return ScoreTensor(shape, std::move(converted));
        }
        case ScalarType::BFloat16: {
            std::vector<Eigen::bfloat16> converted(values.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                converted[i] = Eigen::bfloat16(values[i]);
            }
            return ScoreTensor(shape, std::move(converted));
        }
        case ScalarType::Float64:
            return ScoreTensor(shape, std::vector<double>(values.begin(), values.end()));
        case ScalarType::Int32:
            break;
    }
    throw std::invalid_argument(std::string("ScoreTensor: unsupported score type ") +
                                scalar_type_name(type));
}

std::size_t ScoreTensor::element_count() const {
    return std::visit([](const auto& values) { return values.size(); }, storage_);
}

ScalarType ScoreTensor::scalar_type() const {
    switch (storage_.index()) {
        case 1: return ScalarType::Float16;
        case 2: return ScalarType::BFloat16;
        case 3: return ScalarType::Float64;
        default: return ScalarType::Float32;
    }
}

float ScoreTensor::value_at(std::size_t flat_index) const {
    return std::visit([flat_index](const auto& values) -> float {
        if (flat_index >= values.size()) {
            throw std::out_of_range("ScoreTensor: element " + std::to_string(flat_index) +
                                    " past buffer of " + std::to_string(values.size()));
        }
        return static_cast<float>(values[flat_index]);
    }, storage_);
}

float ScoreTensor::value_at(std::size_t batch, std::size_t time, std::size_t vocab) const {
    if (batch >= batch_size() || time >= time_size() || vocab >= vocab_size()) {
        throw std::out_of_range("ScoreTensor: coordinate outside declared shape");
    }
    return value_at((batch * time_size() + time) * vocab_size() + vocab);
}

std::optional<TokenTensor> TokenTensor::create(std::size_t batch, std::size_t length, ScalarType type) {
    if (type != ScalarType::Int32 && type != ScalarType::Float32) {
        return std::nullopt;
    }
    if (batch == 0 || length == 0) {
        return std::nullopt;
    }
    if (length > kMaxElements / batch) {
        return std::nullopt;
    }
    return TokenTensor(batch, length, type);
}

std::int32_t TokenTensor::at(std::size_t batch, std::size_t position) const {
    if (batch >= batch_ || position >= length_) {
        throw std::out_of_range("TokenTensor: coordinate outside shape");
    }
    return values_[batch * length_ + position];
}

} // namespace zenzbench
