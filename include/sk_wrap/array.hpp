// sk_wrap/array.hpp
// Host-resident numeric array: the backend-independent result type
//
// Every backend output is materialized into an Array before it reaches the
// caller, and every caller-supplied numeric input can be given as one.
// Storage is row-major and owned; copies are deep.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <source_location>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"

namespace sk_wrap {

namespace detail {
    template<class>
    inline constexpr bool always_false_v = false;

    /// Product of dimensions; throws on negative dimensions or overflow.
    [[nodiscard]] inline std::size_t checked_product(
        std::span<const std::int64_t> dims,
        const char* context = "shape calculation")
    {
        std::size_t result = 1;
        for (auto d : dims) {
            if (d < 0) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, context,
                    detail::format("negative dimension {}", d));
            }
            const auto ud = static_cast<std::size_t>(d);
            if (ud != 0 && result > std::numeric_limits<std::size_t>::max() / ud) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, context,
                    "element count overflows size_t");
            }
            result *= ud;
        }
        return result;
    }
}

// ============================================================================
// Element types
// ============================================================================

enum class DType {
    Float32,
    Float64,
    Int32,
    Int64,
};

template<class T>
concept ArrayScalar =
    std::same_as<T, float>        ||
    std::same_as<T, double>       ||
    std::same_as<T, std::int32_t> ||
    std::same_as<T, std::int64_t>;

template<ArrayScalar T>
[[nodiscard]] constexpr DType dtype_of() noexcept {
    if constexpr (std::same_as<T, float>)             return DType::Float32;
    else if constexpr (std::same_as<T, double>)       return DType::Float64;
    else if constexpr (std::same_as<T, std::int32_t>) return DType::Int32;
    else if constexpr (std::same_as<T, std::int64_t>) return DType::Int64;
    else static_assert(detail::always_false_v<T>, "Unsupported scalar type");
}

template<ArrayScalar T>
inline constexpr DType dtype_v = dtype_of<T>();

[[nodiscard]] constexpr const char* dtype_name(DType dtype) noexcept {
    switch (dtype) {
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
        case DType::Int32:   return "int32";
        case DType::Int64:   return "int64";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_floating(DType dtype) noexcept {
    return dtype == DType::Float32 || dtype == DType::Float64;
}

// ============================================================================
// Array
// ============================================================================

class Array {
public:
    using Storage = std::variant<
        std::vector<float>,
        std::vector<double>,
        std::vector<std::int32_t>,
        std::vector<std::int64_t>>;

    /// Empty float32 array of shape {0}.
    Array() : shape_{0}, data_(std::vector<float>{}) {}

    // ─────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────

    template<ArrayScalar T>
    [[nodiscard]] static Array FromVector(
        std::vector<std::int64_t> shape,
        std::vector<T> values,
        std::source_location loc = std::source_location::current())
    {
        const std::size_t expected = detail::checked_product(shape, "Array::FromVector");
        if (expected != values.size()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::FromVector",
                detail::format("shape requires {} elements, got {}", expected, values.size()),
                {}, -1, loc);
        }

        Array a;
        a.shape_ = std::move(shape);
        a.data_ = std::move(values);
        return a;
    }

    template<ArrayScalar T>
    [[nodiscard]] static Array FromVector(
        std::initializer_list<std::int64_t> shape,
        std::initializer_list<T> values,
        std::source_location loc = std::source_location::current())
    {
        return FromVector<T>(std::vector<std::int64_t>(shape), std::vector<T>(values), loc);
    }

    /// One-dimensional array over `values`.
    template<ArrayScalar T>
    [[nodiscard]] static Array FromVector(std::vector<T> values) {
        const auto n = static_cast<std::int64_t>(values.size());
        return FromVector<T>(std::vector<std::int64_t>{n}, std::move(values));
    }

    /// Array of `dtype` whose elements are copied from raw host memory.
    [[nodiscard]] static Array FromBytes(
        DType dtype,
        std::vector<std::int64_t> shape,
        const void* src,
        std::size_t byte_len)
    {
        const std::size_t n = detail::checked_product(shape, "Array::FromBytes");
        Array a;
        a.shape_ = std::move(shape);
        a.data_ = make_storage_(dtype, n);
        if (a.byte_size() != byte_len) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::FromBytes",
                detail::format("byte_len mismatch - expected {} but got {}", a.byte_size(), byte_len));
        }
        if (byte_len != 0) {
            std::memcpy(a.raw_data_(), src, byte_len);
        }
        return a;
    }

    // ─────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] DType dtype() const noexcept { return static_cast<DType>(data_.index()); }
    [[nodiscard]] const char* dtype_name() const noexcept { return sk_wrap::dtype_name(dtype()); }
    [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept { return shape_; }
    [[nodiscard]] int rank() const noexcept { return static_cast<int>(shape_.size()); }

    [[nodiscard]] std::size_t size() const noexcept {
        return std::visit([](const auto& v) { return v.size(); }, data_);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Leading dimension; a rank-0 array counts as one row.
    [[nodiscard]] std::int64_t rows() const noexcept {
        return shape_.empty() ? 1 : shape_.front();
    }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return std::visit([](const auto& v) {
            return v.size() * sizeof(typename std::decay_t<decltype(v)>::value_type);
        }, data_);
    }

    [[nodiscard]] const void* data() const noexcept {
        return std::visit([](const auto& v) -> const void* { return v.data(); }, data_);
    }

    [[nodiscard]] const Storage& storage() const noexcept { return data_; }

    /// Typed element access; throws InvalidArgument on dtype mismatch.
    template<ArrayScalar T>
    [[nodiscard]] const std::vector<T>& values() const {
        if (const auto* v = std::get_if<std::vector<T>>(&data_)) {
            return *v;
        }
        throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::values",
            detail::format("dtype mismatch - requested {} but array is {}",
                sk_wrap::dtype_name(dtype_v<T>), dtype_name()));
    }

    /// Copy of the elements converted to T.
    template<ArrayScalar T>
    [[nodiscard]] std::vector<T> to_vector() const {
        return std::visit([](const auto& v) {
            return std::vector<T>(v.begin(), v.end());
        }, data_);
    }

    template<ArrayScalar T>
    [[nodiscard]] Array astype() const {
        if (dtype() == dtype_v<T>) return *this;
        return FromVector<T>(shape_, to_vector<T>());
    }

    // ─────────────────────────────────────────────────────────────────
    // Shape manipulation (returns new arrays)
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] Array flatten() const {
        Array a(*this);
        a.shape_ = {static_cast<std::int64_t>(size())};
        return a;
    }

    /// Reshape; at most one dimension may be -1 and is inferred.
    [[nodiscard]] Array reshape(std::vector<std::int64_t> shape) const {
        std::int64_t known = 1;
        int inferred = -1;
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (shape[i] == -1) {
                if (inferred >= 0) {
                    throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::reshape",
                        "only one dimension can be inferred");
                }
                inferred = static_cast<int>(i);
            } else if (shape[i] < 0) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::reshape",
                    detail::format("negative dimension {}", shape[i]));
            } else {
                known *= shape[i];
            }
        }

        const auto n = static_cast<std::int64_t>(size());
        if (inferred >= 0) {
            if (known == 0 || n % known != 0) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::reshape",
                    detail::format("cannot infer dimension for {} elements", n));
            }
            shape[static_cast<std::size_t>(inferred)] = n / known;
        } else if (known != n) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::reshape",
                detail::format("cannot reshape {} elements into {} elements", n, known));
        }

        Array a(*this);
        a.shape_ = std::move(shape);
        return a;
    }

    /// Rows [begin, end) along the first axis.
    [[nodiscard]] Array slice_rows(std::int64_t begin, std::int64_t end) const {
        if (shape_.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::slice_rows",
                "cannot slice a rank-0 array");
        }
        if (begin < 0 || end < begin || end > shape_.front()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::slice_rows",
                detail::format("row range [{}, {}) out of bounds for {} rows", begin, end, shape_.front()));
        }

        const std::size_t stride = row_stride_();
        Array a;
        a.shape_ = shape_;
        a.shape_.front() = end - begin;
        a.data_ = std::visit([&](const auto& v) -> Storage {
            using V = std::decay_t<decltype(v)>;
            const auto first = v.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(begin) * stride);
            const auto last = v.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(end) * stride);
            return V(first, last);
        }, data_);
        return a;
    }

    /// Concatenate along the first axis. All parts share dtype and trailing shape.
    [[nodiscard]] static Array concat_rows(std::span<const Array> parts) {
        if (parts.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::concat_rows", "no arrays to concatenate");
        }
        if (parts.size() == 1) return parts.front();

        const Array& first = parts.front();
        if (first.shape_.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::concat_rows",
                "cannot concatenate rank-0 arrays");
        }

        std::int64_t total_rows = 0;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            const Array& p = parts[i];
            const bool same_tail = p.rank() == first.rank() &&
                std::equal(p.shape_.begin() + 1, p.shape_.end(), first.shape_.begin() + 1);
            if (p.dtype() != first.dtype() || !same_tail) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "Array::concat_rows",
                    "arrays differ in dtype or trailing shape", {}, static_cast<int>(i));
            }
            total_rows += p.shape_.front();
        }

        Array out;
        out.shape_ = first.shape_;
        out.shape_.front() = total_rows;
        out.data_ = std::visit([&](const auto& v) -> Storage {
            using V = std::decay_t<decltype(v)>;
            V merged;
            merged.reserve(v.size() * parts.size());
            for (const Array& p : parts) {
                const auto& pv = std::get<V>(p.data_);
                merged.insert(merged.end(), pv.begin(), pv.end());
            }
            return merged;
        }, first.data_);
        return out;
    }

    // ─────────────────────────────────────────────────────────────────
    // Arithmetic
    // ─────────────────────────────────────────────────────────────────

    /// Add a scalar to every element.
    ///
    /// Floating arrays keep their dtype: the scalar is first cast to the
    /// element type, then added in that type. Integer arrays promote to float64.
    [[nodiscard]] Array plus(double scalar) const {
        Array out;
        out.shape_ = shape_;
        out.data_ = std::visit([&](const auto& v) -> Storage {
            using T = typename std::decay_t<decltype(v)>::value_type;
            if constexpr (std::is_floating_point_v<T>) {
                const T s = static_cast<T>(scalar);
                std::vector<T> r(v.size());
                for (std::size_t i = 0; i < v.size(); ++i) r[i] = v[i] + s;
                return r;
            } else {
                std::vector<double> r(v.size());
                for (std::size_t i = 0; i < v.size(); ++i) r[i] = static_cast<double>(v[i]) + scalar;
                return r;
            }
        }, data_);
        return out;
    }

    /// Same dtype, shape and element values.
    [[nodiscard]] friend bool operator==(const Array& a, const Array& b) {
        return a.shape_ == b.shape_ && a.data_ == b.data_;
    }

private:
    std::vector<std::int64_t> shape_;
    Storage data_;

    [[nodiscard]] std::size_t row_stride_() const noexcept {
        if (shape_.empty() || shape_.front() == 0) return 0;
        return size() / static_cast<std::size_t>(shape_.front());
    }

    [[nodiscard]] void* raw_data_() noexcept {
        return std::visit([](auto& v) -> void* { return v.data(); }, data_);
    }

    [[nodiscard]] static Storage make_storage_(DType dtype, std::size_t n) {
        switch (dtype) {
            case DType::Float32: return std::vector<float>(n);
            case DType::Float64: return std::vector<double>(n);
            case DType::Int32:   return std::vector<std::int32_t>(n);
            case DType::Int64:   return std::vector<std::int64_t>(n);
        }
        throw Error::Wrapper(ErrorCode::InvalidArgument, "Array", "unknown dtype");
    }
};

} // namespace sk_wrap
