#include "ZenzBench/WeightLoader.hpp"

#include <Eigen/Core>
#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zenzbench {

namespace {

// Upper bound on the JSON header; anything larger is a corrupt file.
constexpr std::uint64_t kMaxHeaderBytes = 100ull * 1024 * 1024;

std::string canonical_dtype(const std::string& dtype) {
    if (dtype == "F32" || dtype == "f32" || dtype == "Float32") return "F32";
    if (dtype == "F16" || dtype == "f16" || dtype == "Float16") return "F16";
    if (dtype == "BF16" || dtype == "bf16" || dtype == "BFloat16") return "BF16";
    if (dtype == "I8" || dtype == "i8" || dtype == "Int8") return "I8";
    return dtype;
}

} // namespace

std::size_t WeightLoader::TensorInfo::element_count() const {
    std::size_t count = 1;
    for (const auto dim : shape) {
        count *= dim;
    }
    return count;
}

std::size_t WeightLoader::dtype_width(const std::string& dtype) {
    const std::string key = canonical_dtype(dtype);
    if (key == "F32") return sizeof(float);
    if (key == "F16" || key == "BF16") return sizeof(std::uint16_t);
    if (key == "I8") return sizeof(std::int8_t);
    return 0;
}

// ---- safetensors header ----
bool WeightLoader::load(const fs::path& path) {
    file_path_ = path;
    tensors_.clear();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[WeightLoader] Failed to open " << path.string() << std::endl;
        return false;
    }

    std::error_code ec;
    const std::uint64_t file_size = fs::file_size(path, ec);
    if (ec) {
        std::cerr << "[WeightLoader] Failed to stat " << path.string() << ": " << ec.message() << std::endl;
        return false;
    }

    std::uint64_t header_len = 0;
    file.read(reinterpret_cast<char*>(&header_len), sizeof(header_len));
    if (!file) {
        std::cerr << "[WeightLoader] Failed to read header length\n";
        return false;
    }
    if (header_len == 0 || header_len > kMaxHeaderBytes ||
        header_len > file_size - sizeof(header_len)) {
        std::cerr << "[WeightLoader] Implausible header length " << header_len << std::endl;
        return false;
    }

    std::string header_str(static_cast<std::size_t>(header_len), '\0');
    file.read(header_str.data(), static_cast<std::streamsize>(header_len));
    if (!file) {
        std::cerr << "[WeightLoader] Failed to read header data\n";
        return false;
    }

    json header;
    try {
        header = json::parse(header_str);
    } catch (const std::exception& e) {
        std::cerr << "[WeightLoader] Failed to parse header: " << e.what() << std::endl;
        return false;
    }
    if (!header.is_object()) {
        std::cerr << "[WeightLoader] Header is not a JSON object\n";
        return false;
    }

    const std::uint64_t data_base = sizeof(std::uint64_t) + header_len;

    for (const auto& [name, meta] : header.items()) {
        if (name == "__metadata__" || !meta.is_object()) {
            continue;
        }

        TensorInfo info;
        info.dtype = canonical_dtype(meta.value("dtype", std::string{}));
        const std::size_t width = dtype_width(info.dtype);
        if (width == 0) {
            std::cerr << "[WeightLoader] Unsupported dtype (" << info.dtype << ") - " << name << std::endl;
            continue;
        }

        try {
            if (meta.contains("shape") && meta["shape"].is_array()) {
                for (const auto& d : meta["shape"]) {
                    info.shape.push_back(d.get<std::size_t>());
                }
            }

            const auto& offsets = meta.at("data_offsets");
            if (!offsets.is_array() || offsets.size() != 2) {
                std::cerr << "[WeightLoader] Malformed data_offsets: " << name << std::endl;
                continue;
            }
            const auto relative_start = offsets[0].get<std::uint64_t>();
            const auto relative_end = offsets[1].get<std::uint64_t>();
            if (relative_end < relative_start) {
                std::cerr << "[WeightLoader] Invalid offset range: " << name << std::endl;
                continue;
            }

            const std::uint64_t expected = static_cast<std::uint64_t>(info.element_count()) * width;
            if (relative_end - relative_start != expected) {
                std::cerr << "[WeightLoader] Size mismatch: " << name
                          << " | metadata=" << (relative_end - relative_start)
                          << " bytes, expected=" << expected << " bytes" << std::endl;
                continue;
            }

            info.offset_start = data_base + relative_start;
            info.offset_end = data_base + relative_end;
        } catch (const json::exception& e) {
            std::cerr << "[WeightLoader] Bad metadata for " << name << ": " << e.what() << std::endl;
            continue;
        }

        if (info.offset_end > file_size) {
            std::cerr << "[WeightLoader] Tensor extends past end of file: " << name << std::endl;
            continue;
        }

        tensors_[name] = std::move(info);
    }

    std::cout << "[WeightLoader] Indexed " << tensors_.size() << " tensors from "
              << path.filename().string() << std::endl;
    return true;
}

const WeightLoader::TensorInfo* WeightLoader::find(const std::string& name) const {
    const auto it = tensors_.find(name);
    return it == tensors_.end() ? nullptr : &it->second;
}

bool WeightLoader::has(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::size_t> WeightLoader::get_shape(const std::string& name) const {
    const auto* info = find(name);
    return info ? info->shape : std::vector<std::size_t>{};
}

std::string WeightLoader::get_dtype(const std::string& name) const {
    const auto* info = find(name);
    return info ? info->dtype : std::string{};
}

bool WeightLoader::read_bytes(const TensorInfo& info, std::vector<char>& out) const {
    std::ifstream file(file_path_, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[WeightLoader] Failed to reopen " << file_path_.string() << std::endl;
        return false;
    }
    file.seekg(static_cast<std::streamoff>(info.offset_start), std::ios::beg);
    if (!file) {
        std::cerr << "[WeightLoader] Seek failed in " << file_path_.string() << std::endl;
        return false;
    }
    out.resize(static_cast<std::size_t>(info.offset_end - info.offset_start));
    file.read(out.data(), static_cast<std::streamsize>(out.size()));
    if (!file) {
        std::cerr << "[WeightLoader] Short read in " << file_path_.string() << std::endl;
        return false;
    }
    return true;
}

// ---- tensor values ----
std::vector<float> WeightLoader::get(const std::string& name) const {
    const auto* info = find(name);
    if (info == nullptr) {
        std::cerr << "[WeightLoader] No such tensor: " << name << std::endl;
        return {};
    }

    std::vector<char> bytes;
    if (!read_bytes(*info, bytes)) {
        return {};
    }

    const std::size_t count = info->element_count();
    std::vector<float> data(count);
    if (info->dtype == "F32") {
        std::memcpy(data.data(), bytes.data(), count * sizeof(float));
    } else if (info->dtype == "F16" || info->dtype == "BF16") {
        std::vector<std::uint16_t> raw(count);
        std::memcpy(raw.data(), bytes.data(), count * sizeof(std::uint16_t));
        const bool is_half = info->dtype == "F16";
        for (std::size_t i = 0; i < count; ++i) {
            data[i] = is_half
                ? static_cast<float>(Eigen::numext::bit_cast<Eigen::half>(raw[i]))
                : static_cast<float>(Eigen::numext::bit_cast<Eigen::bfloat16>(raw[i]));
        }
    } else if (info->dtype == "I8") {
        for (std::size_t i = 0; i < count; ++i) {
            data[i] = static_cast<float>(static_cast<std::int8_t>(bytes[i]));
        }
    }
    return data;
}

std::vector<std::int8_t> WeightLoader::get_int8(const std::string& name) const {
    const auto* info = find(name);
    if (info == nullptr || info->dtype != "I8") {
        return {};
    }
    std::vector<char> bytes;
    if (!read_bytes(*info, bytes)) {
        return {};
    }
    std::vector<std::int8_t> data(bytes.size());
    std::memcpy(data.data(), bytes.data(), bytes.size());
    return data;
}

} // namespace zenzbench
