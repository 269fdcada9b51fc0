#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace zenzbench {

/**
 * Reader for HuggingFace safetensors engine artifacts.
 *
 * The container is
 *   [8 byte little-endian header size][JSON header][tensor bytes...]
 * and the JSON header gives dtype, shape and data offsets (relative to the
 * data section) per tensor. Metadata is parsed once by `load()`; tensor
 * bytes are read lazily.
 *
 * Supported dtypes: F32, F16, BF16, I8.
 */
class WeightLoader {
public:
    struct TensorInfo {
        std::string dtype;
        std::vector<std::size_t> shape;
        std::uint64_t offset_start = 0; ///< absolute file offset
        std::uint64_t offset_end = 0;   ///< absolute file offset

        [[nodiscard]] std::size_t element_count() const;
    };

    WeightLoader() = default;

    /// Parse the header at `path`. Returns false (and logs) on any error.
    bool load(const std::filesystem::path& path);

    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] std::vector<std::size_t> get_shape(const std::string& name) const;
    [[nodiscard]] std::string get_dtype(const std::string& name) const;

    /// Tensor values widened to float. Empty on a missing tensor or read error.
    [[nodiscard]] std::vector<float> get(const std::string& name) const;

    /// Raw int8 values of an I8 tensor. Empty when the tensor is not I8.
    [[nodiscard]] std::vector<std::int8_t> get_int8(const std::string& name) const;

    [[nodiscard]] std::size_t tensor_count() const { return tensors_.size(); }

    /// Bytes per element for a safetensors dtype string, 0 when unsupported.
    static std::size_t dtype_width(const std::string& dtype);

private:
    [[nodiscard]] const TensorInfo* find(const std::string& name) const;
    bool read_bytes(const TensorInfo& info, std::vector<char>& out) const;

    std::filesystem::path file_path_;
    std::map<std::string, TensorInfo> tensors_;
};

} // namespace zenzbench
