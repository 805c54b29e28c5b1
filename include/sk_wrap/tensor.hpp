// sk_wrap/tensor.hpp
// Owning wrapper for TF_Tensor, the in-process backend's native tensor type
//
// - Move-only; the moved-from tensor is empty, never dangling
// - Host arrays enter through FromArray (always float32, the feature dtype
//   converted graphs are built for)
// - Fetched tensors leave through ToArray, which copies into host memory

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <source_location>
#include <span>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "sk_wrap/array.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"
#include "sk_wrap/detail/tf_handle.hpp"

namespace sk_wrap {

// ============================================================================
// Type mapping: C++ type <-> TF_DataType
// ============================================================================

template<ArrayScalar T>
[[nodiscard]] constexpr TF_DataType tf_dtype_of() noexcept {
    if constexpr (std::same_as<T, float>)             return TF_FLOAT;
    else if constexpr (std::same_as<T, double>)       return TF_DOUBLE;
    else if constexpr (std::same_as<T, std::int32_t>) return TF_INT32;
    else if constexpr (std::same_as<T, std::int64_t>) return TF_INT64;
    else static_assert(detail::always_false_v<T>, "Unsupported scalar type");
}

template<ArrayScalar T>
inline constexpr TF_DataType tf_dtype_v = tf_dtype_of<T>();

[[nodiscard]] constexpr const char* tf_dtype_name(TF_DataType dtype) noexcept {
    switch (dtype) {
        case TF_FLOAT:  return "float32";
        case TF_DOUBLE: return "float64";
        case TF_INT8:   return "int8";
        case TF_INT16:  return "int16";
        case TF_INT32:  return "int32";
        case TF_INT64:  return "int64";
        case TF_UINT8:  return "uint8";
        case TF_BOOL:   return "bool";
        case TF_STRING: return "string";
        case TF_HALF:   return "float16";
        default:        return "unknown";
    }
}

// ============================================================================
// Tensor
// ============================================================================

class Tensor {
public:
    Tensor() = default;
    ~Tensor() = default;

    Tensor(const Tensor&) = delete;
    Tensor& operator=(const Tensor&) = delete;

    Tensor(Tensor&& other) noexcept
        : raw_(std::move(other.raw_))
        , shape_(std::move(other.shape_))
    {
        other.shape_.clear();
    }

    Tensor& operator=(Tensor&& other) noexcept {
        if (this != &other) {
            raw_ = std::move(other.raw_);
            shape_ = std::move(other.shape_);
            other.shape_.clear();
        }
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept { return shape_; }
    [[nodiscard]] int rank() const noexcept { return static_cast<int>(shape_.size()); }

    [[nodiscard]] TF_DataType dtype() const noexcept {
        return raw_ ? TF_TensorType(raw_.get()) : TF_FLOAT;
    }

    [[nodiscard]] const char* dtype_name() const noexcept { return tf_dtype_name(dtype()); }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return raw_ ? TF_TensorByteSize(raw_.get()) : 0;
    }

    [[nodiscard]] std::size_t num_elements() const {
        if (!raw_) return 0;
        const std::int64_t n = TF_TensorElementCount(raw_.get());
        if (n < 0) {
            throw Error::Wrapper(ErrorCode::BackendFailure, "Tensor::num_elements",
                "TF_TensorElementCount returned a negative value");
        }
        return static_cast<std::size_t>(n);
    }

    [[nodiscard]] bool valid() const noexcept { return raw_ != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
    [[nodiscard]] TF_Tensor* handle() const noexcept { return raw_.get(); }

    // ─────────────────────────────────────────────────────────────────
    // Data extraction (copies)
    // ─────────────────────────────────────────────────────────────────

    template<ArrayScalar T>
    [[nodiscard]] std::vector<T> ToVector() const {
        ensure_tensor_("ToVector");
        if (dtype() != tf_dtype_v<T>) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Tensor::ToVector",
                detail::format("dtype mismatch - requested {} but tensor is {}",
                    tf_dtype_name(tf_dtype_v<T>), dtype_name()));
        }
        const auto* p = static_cast<const T*>(TF_TensorData(raw_.get()));
        return std::vector<T>(p, p + num_elements());
    }

    /// Host Array with the same dtype, shape and values.
    [[nodiscard]] Array ToArray() const {
        ensure_tensor_("ToArray");

        DType dt{};
        switch (dtype()) {
            case TF_FLOAT:  dt = DType::Float32; break;
            case TF_DOUBLE: dt = DType::Float64; break;
            case TF_INT32:  dt = DType::Int32; break;
            case TF_INT64:  dt = DType::Int64; break;
            default:
                throw Error::Wrapper(ErrorCode::BackendFailure, "Tensor::ToArray",
                    detail::format("cannot materialize a {} tensor as a host array", dtype_name()));
        }
        return Array::FromBytes(dt, shape_, TF_TensorData(raw_.get()), byte_size());
    }

    [[nodiscard]] Tensor Clone() const {
        if (!raw_) return Tensor{};

        const std::size_t bytes = byte_size();
        const void* src = TF_TensorData(raw_.get());
        return create_tensor_alloc_(dtype(), shape_, bytes,
            [&](void* dst, std::size_t len) {
                if (len != 0) std::memcpy(dst, src, len);
            });
    }

    // ─────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────

    template<ArrayScalar T>
    [[nodiscard]] static Tensor FromVector(
        std::span<const std::int64_t> dims,
        const std::vector<T>& values,
        std::source_location loc = std::source_location::current())
    {
        const std::size_t expected = detail::checked_product(dims, "Tensor::FromVector");
        if (expected != values.size()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Tensor::FromVector",
                detail::format("shape requires {} elements, got {}", expected, values.size()),
                {}, -1, loc);
        }

        return create_tensor_alloc_(tf_dtype_v<T>, dims, expected * sizeof(T),
            [&](void* dst, std::size_t len) {
                if (len != 0) std::memcpy(dst, values.data(), len);
            });
    }

    template<ArrayScalar T>
    [[nodiscard]] static Tensor FromVector(
        std::initializer_list<std::int64_t> dims,
        std::initializer_list<T> values,
        std::source_location loc = std::source_location::current())
    {
        const std::vector<std::int64_t> shape(dims);
        return FromVector<T>(shape, std::vector<T>(values), loc);
    }

    /// float32 tensor holding `array`'s values, whatever the array's dtype.
    [[nodiscard]] static Tensor FromArray(const Array& array) {
        const std::vector<float> values = array.to_vector<float>();
        return FromVector<float>(array.shape(), values);
    }

    /// Adopt ownership of a raw TF_Tensor.
    [[nodiscard]] static Tensor FromRaw(TF_Tensor* raw) {
        if (!raw) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Tensor::FromRaw", "null TF_Tensor*");
        }

        Tensor t;
        t.raw_.reset(raw);
        const int ndims = TF_NumDims(raw);
        t.shape_.reserve(static_cast<std::size_t>(ndims));
        for (int i = 0; i < ndims; ++i) {
            t.shape_.push_back(TF_Dim(raw, i));
        }
        return t;
    }

private:
    detail::RawTensorPtr raw_{};
    std::vector<std::int64_t> shape_{};

    void ensure_tensor_(const char* fn) const {
        if (!raw_) {
            throw Error::Wrapper(ErrorCode::InvalidArgument,
                detail::format("Tensor::{}", fn), "tensor is empty (moved-from or default-constructed)");
        }
    }

    template<class Init>
    [[nodiscard]] static Tensor create_tensor_alloc_(
        TF_DataType dtype,
        std::span<const std::int64_t> dims,
        std::size_t bytes,
        Init&& init)
    {
        TF_Tensor* raw = TF_AllocateTensor(dtype, dims.data(), static_cast<int>(dims.size()), bytes);
        if (!raw) {
            throw Error::TensorFlow("RESOURCE_EXHAUSTED", "Tensor",
                detail::format("TF_AllocateTensor failed for {} bytes", bytes));
        }

        Tensor t = FromRaw(raw);
        init(TF_TensorData(raw), bytes);
        return t;
    }
};

} // namespace sk_wrap
