// sk_wrap/status.hpp
// TF_Status holder; a failed status becomes sk_wrap::Error (source TensorFlow)

#pragma once

#include <array>
#include <new>
#include <source_location>
#include <string>
#include <string_view>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "sk_wrap/error.hpp"
#include "sk_wrap/detail/tf_handle.hpp"

namespace sk_wrap {

namespace detail {

// Indexed by TF_Code (TF_OK = 0 .. TF_UNAUTHENTICATED = 16)
inline constexpr std::array<const char*, 17> kTfCodeNames = {
    "OK", "CANCELLED", "UNKNOWN", "INVALID_ARGUMENT", "DEADLINE_EXCEEDED",
    "NOT_FOUND", "ALREADY_EXISTS", "PERMISSION_DENIED", "RESOURCE_EXHAUSTED",
    "FAILED_PRECONDITION", "ABORTED", "OUT_OF_RANGE", "UNIMPLEMENTED",
    "INTERNAL", "UNAVAILABLE", "DATA_LOSS", "UNAUTHENTICATED",
};

} // namespace detail

/// Name carried in Error::engine_status() for TensorFlow failures. Never throws.
[[nodiscard]] constexpr const char* tf_code_name(TF_Code code) noexcept {
    const auto i = static_cast<std::size_t>(code);
    return i < detail::kTfCodeNames.size() ? detail::kTfCodeNames[i] : "UNKNOWN_CODE";
}

// ============================================================================
// Status
// ============================================================================

/// Out-parameter for TF_* calls. Move-only; a moved-from Status reads as OK.
class Status {
public:
    Status() : st_(TF_NewStatus()) {
        if (!st_) throw std::bad_alloc();
    }

    [[nodiscard]] TF_Status* get() noexcept { return st_.get(); }
    [[nodiscard]] const TF_Status* get() const noexcept { return st_.get(); }

    [[nodiscard]] TF_Code code() const noexcept { return st_ ? TF_GetCode(st_.get()) : TF_OK; }
    [[nodiscard]] const char* code_name() const noexcept { return tf_code_name(code()); }
    [[nodiscard]] bool ok() const noexcept { return code() == TF_OK; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] std::string_view message() const noexcept {
        const char* msg = st_ ? TF_Message(st_.get()) : nullptr;
        return msg ? std::string_view(msg) : std::string_view{};
    }

    void set(TF_Code code, std::string_view msg) {
        TF_SetStatus(st_.get(), code, std::string(msg).c_str());
    }

    void reset() noexcept { TF_SetStatus(st_.get(), TF_OK, ""); }

    void throw_if_error(
        std::string_view context = "",
        std::source_location loc = std::source_location::current()) const
    {
        if (!ok()) throw Error::TensorFlow(code_name(), context, message(), loc);
    }

private:
    detail::StatusPtr st_;
};

} // namespace sk_wrap
