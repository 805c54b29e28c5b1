// sk_wrap/error.hpp
// Structured exception type for SklearnWrap
//
// Goals:
// - Callers that only care about failure can catch std::runtime_error
// - Callers that branch on the failure kind read ErrorCode
// - Engine failures keep the engine's own status name (TF_Code / OrtErrorCode)
// - Every error records where it was raised

#pragma once

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include "sk_wrap/format.hpp"

namespace sk_wrap {

enum class ErrorSource {
    TensorFlow,
    OnnxRuntime,
    Wrapper,
};

enum class ErrorCode {
    UnsupportedInputType,  // positional input is neither an array nor the backend's tensor type
    InputArityMismatch,    // input count differs from the declared input names
    BackendUnavailable,    // inference engine missing or unusable; fatal at construction
    MissingConfigKey,      // required ExtraConfig key absent
    InvalidConstruction,   // task-mode / output-count invariant violated
    InvalidArgument,       // malformed caller value (shape, config range, dtype)
    BackendFailure,        // engine reported an error while loading or running
};

[[nodiscard]] constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnsupportedInputType: return "UNSUPPORTED_INPUT_TYPE";
        case ErrorCode::InputArityMismatch:   return "INPUT_ARITY_MISMATCH";
        case ErrorCode::BackendUnavailable:   return "BACKEND_UNAVAILABLE";
        case ErrorCode::MissingConfigKey:     return "MISSING_CONFIG_KEY";
        case ErrorCode::InvalidConstruction:  return "INVALID_CONSTRUCTION";
        case ErrorCode::InvalidArgument:      return "INVALID_ARGUMENT";
        case ErrorCode::BackendFailure:       return "BACKEND_FAILURE";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* error_source_name(ErrorSource source) noexcept {
    switch (source) {
        case ErrorSource::TensorFlow:  return "TF";
        case ErrorSource::OnnxRuntime: return "ORT";
        case ErrorSource::Wrapper:     return "WRAP";
    }
    return "?";
}

/// Structured error for engine status failures and wrapper-level validation.
///
/// `subject` names what the error is about (an input name, a config key, an
/// endpoint); `index` is a positional input index or -1.
class Error : public std::runtime_error {
public:
    Error(
        ErrorSource source,
        ErrorCode code,
        std::string_view context,
        std::string_view message,
        std::string_view subject = {},
        int index = -1,
        std::string_view engine_status = {},
        std::source_location loc = std::source_location::current())
        : std::runtime_error(build_what_(source, code, context, message, subject, index, engine_status, loc))
        , source_(source)
        , code_(code)
        , context_(context)
        , message_(message)
        , subject_(subject)
        , index_(index)
        , engine_status_(engine_status)
        , loc_(loc)
    {}

    [[nodiscard]] ErrorSource source() const noexcept { return source_; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const char* code_name() const noexcept { return error_code_name(code_); }

    [[nodiscard]] std::string_view context() const noexcept { return context_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subject() const noexcept { return subject_; }
    [[nodiscard]] int index() const noexcept { return index_; }
    /// Engine status name ("INVALID_ARGUMENT", "INVALID_GRAPH", ...); empty for wrapper errors.
    [[nodiscard]] std::string_view engine_status() const noexcept { return engine_status_; }
    [[nodiscard]] std::source_location location() const noexcept { return loc_; }

    // ─────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error TensorFlow(
        std::string_view engine_status,
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::TensorFlow, ErrorCode::BackendFailure,
            context, message, {}, -1, engine_status, loc);
    }

    [[nodiscard]] static Error OnnxRuntime(
        std::string_view engine_status,
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::OnnxRuntime, ErrorCode::BackendFailure,
            context, message, {}, -1, engine_status, loc);
    }

    [[nodiscard]] static Error Wrapper(
        ErrorCode code,
        std::string_view context,
        std::string_view message,
        std::string_view subject = {},
        int index = -1,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Wrapper, code, context, message, subject, index, {}, loc);
    }

    [[nodiscard]] static Error UnsupportedInputType(
        std::size_t index,
        std::string_view type_name,
        std::string_view context,
        std::source_location loc = std::source_location::current())
    {
        return Wrapper(ErrorCode::UnsupportedInputType, context,
            detail::format("input tensor {} of unsupported type {}", index, type_name),
            type_name, static_cast<int>(index), loc);
    }

    [[nodiscard]] static Error InputArityMismatch(
        std::size_t expected,
        std::size_t actual,
        std::string_view context,
        std::source_location loc = std::source_location::current())
    {
        return Wrapper(ErrorCode::InputArityMismatch, context,
            detail::format("expected {} inputs, got {}", expected, actual),
            {}, -1, loc);
    }

    [[nodiscard]] static Error MissingConfigKey(
        std::string_view key,
        std::string_view context,
        std::source_location loc = std::source_location::current())
    {
        return Wrapper(ErrorCode::MissingConfigKey, context,
            "required configuration key is absent", key, -1, loc);
    }

private:
    ErrorSource source_{ErrorSource::Wrapper};
    ErrorCode code_{ErrorCode::BackendFailure};
    std::string context_;
    std::string message_;
    std::string subject_;
    int index_{-1};
    std::string engine_status_;
    std::source_location loc_{};

    static std::string build_what_(
        ErrorSource source,
        ErrorCode code,
        std::string_view context,
        std::string_view message,
        std::string_view subject,
        int index,
        std::string_view engine_status,
        const std::source_location& loc)
    {
        std::string head = detail::format("[{}_{}]", error_source_name(source),
            engine_status.empty() ? std::string_view(error_code_name(code)) : engine_status);

        if (!context.empty()) {
            head += ' ';
            head += context;
        }
        if (!subject.empty()) {
            head += detail::format(" '{}'", subject);
        }
        if (index >= 0) {
            head += detail::format(" #{}", index);
        }

        return detail::format("{} at {}:{} in {}: {}",
            head, loc.file_name(), loc.line(), loc.function_name(), message);
    }
};

} // namespace sk_wrap
