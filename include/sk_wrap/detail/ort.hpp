// sk_wrap/detail/ort.hpp
// ONNX Runtime glue: manual API initialization, the process Env, and
// conversions between Ort::Value and host Arrays
//
// The runtime is not linked. ensure_ort_api() loads it with dlopen on first
// use and binds the C API manually, so a missing or too-old runtime surfaces
// as BackendUnavailable from backend construction instead of a loader abort,
// and in-process-only programs never need it installed.
//
// Library: $SK_WRAP_ONNXRUNTIME_LIBRARY if set, else the platform soname.

#pragma once

#ifndef ORT_API_MANUAL_INIT
#define ORT_API_MANUAL_INIT
#endif

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <dlfcn.h>

#include <onnxruntime_cxx_api.h>

#include "sk_wrap/array.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"
#include "sk_wrap/logging.hpp"

namespace sk_wrap::detail {

[[nodiscard]] constexpr const char* ort_code_name(OrtErrorCode code) noexcept {
    switch (code) {
        case ORT_OK:                return "OK";
        case ORT_FAIL:              return "FAIL";
        case ORT_INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case ORT_NO_SUCHFILE:       return "NO_SUCHFILE";
        case ORT_NO_MODEL:          return "NO_MODEL";
        case ORT_ENGINE_ERROR:      return "ENGINE_ERROR";
        case ORT_RUNTIME_EXCEPTION: return "RUNTIME_EXCEPTION";
        case ORT_INVALID_PROTOBUF:  return "INVALID_PROTOBUF";
        case ORT_MODEL_LOADED:      return "MODEL_LOADED";
        case ORT_NOT_IMPLEMENTED:   return "NOT_IMPLEMENTED";
        case ORT_INVALID_GRAPH:     return "INVALID_GRAPH";
        case ORT_EP_FAIL:           return "EP_FAIL";
        default:                    return "UNKNOWN";
    }
}

[[nodiscard]] inline Error ort_error(const Ort::Exception& e, std::string_view context) {
    return Error::OnnxRuntime(ort_code_name(e.GetOrtErrorCode()), context, e.what());
}

#if defined(__APPLE__)
inline constexpr const char* kOrtDefaultLibrary = "libonnxruntime.dylib";
#else
inline constexpr const char* kOrtDefaultLibrary = "libonnxruntime.so";
#endif

inline constexpr const char* kOrtLibraryEnvVar = "SK_WRAP_ONNXRUNTIME_LIBRARY";

[[nodiscard]] inline std::string ort_library_path() {
    const char* env = std::getenv(kOrtLibraryEnvVar);
    return (env && *env) ? std::string(env) : std::string(kOrtDefaultLibrary);
}

/// Load the runtime and bind the C API. Binds once per process; a failed
/// attempt is retried on the next call. Throws BackendUnavailable if the
/// library cannot be loaded, does not export OrtGetApiBase, or cannot serve
/// the API version these headers were built against.
inline void ensure_ort_api() {
    static std::mutex mu;
    static bool bound = false;

    const std::lock_guard<std::mutex> lock(mu);
    if (bound) return;

    const std::string path = ort_library_path();
    // Kept open for the life of the process: Ort objects may be destroyed late
    void* lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!lib) {
        const char* why = dlerror();
        throw Error::Wrapper(ErrorCode::BackendUnavailable, "ensure_ort_api",
            detail::format("cannot load ONNX Runtime: {}", why ? why : "unknown error"), path);
    }

    const auto get_api_base = reinterpret_cast<decltype(&OrtGetApiBase)>(dlsym(lib, "OrtGetApiBase"));
    const OrtApiBase* base = get_api_base ? get_api_base() : nullptr;
    const OrtApi* api = base ? base->GetApi(ORT_API_VERSION) : nullptr;
    if (!api) {
        dlclose(lib);
        throw Error::Wrapper(ErrorCode::BackendUnavailable, "ensure_ort_api",
            get_api_base
                ? detail::format("ONNX Runtime does not provide API version {}", ORT_API_VERSION)
                : std::string("library does not export OrtGetApiBase"),
            path);
    }

    Ort::InitApi(api);
    bound = true;
    logging::debug("bound ONNX Runtime API version {} ({}) from {}",
        ORT_API_VERSION, base->GetVersionString(), path);
}

[[nodiscard]] inline OrtLoggingLevel ort_logging_level() noexcept {
    switch (Logger::level()) {
        case LogLevel::Trace: return ORT_LOGGING_LEVEL_VERBOSE;
        case LogLevel::Debug:
        case LogLevel::Info:  return ORT_LOGGING_LEVEL_INFO;
        case LogLevel::Warn:  return ORT_LOGGING_LEVEL_WARNING;
        case LogLevel::Error: return ORT_LOGGING_LEVEL_ERROR;
        case LogLevel::None:  return ORT_LOGGING_LEVEL_FATAL;
    }
    return ORT_LOGGING_LEVEL_WARNING;
}

/// One Env per process, shared by every portable session.
[[nodiscard]] inline Ort::Env& ort_env() {
    ensure_ort_api();
    static Ort::Env env{ort_logging_level(), "sk_wrap"};
    return env;
}

// ─────────────────────────────────────────────────────────────────
// Element types
// ─────────────────────────────────────────────────────────────────

[[nodiscard]] constexpr std::size_t ort_element_size(ONNXTensorElementDataType type) noexcept {
    switch (type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:  return 4;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: return 8;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:   return 1;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT16:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16: return 2;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT32: return 4;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT64: return 8;
        default:                                   return 0;
    }
}

[[nodiscard]] constexpr const char* ort_element_name(ONNXTensorElementDataType type) noexcept {
    switch (type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:  return "float32";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: return "float64";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:  return "int32";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:  return "int64";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:   return "bool";
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_STRING: return "string";
        default:                                   return "unknown";
    }
}

// ─────────────────────────────────────────────────────────────────
// Conversions
// ─────────────────────────────────────────────────────────────────

/// Owned float32 tensor holding `array`'s values.
[[nodiscard]] inline Ort::Value array_to_ort(const Array& array) {
    ensure_ort_api();
    const std::vector<float> values = array.to_vector<float>();
    const std::vector<std::int64_t>& shape = array.shape();

    Ort::AllocatorWithDefaultOptions allocator;
    Ort::Value value = Ort::Value::CreateTensor<float>(allocator, shape.data(), shape.size());
    if (!values.empty()) {
        std::memcpy(value.GetTensorMutableData<float>(), values.data(), values.size() * sizeof(float));
    }
    return value;
}

/// Non-owning tensor over `source`'s buffer. `source` must outlive the result.
[[nodiscard]] inline Ort::Value ort_view(const Ort::Value& source) {
    if (!source.IsTensor()) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "ort_view", "value is not a tensor");
    }

    const auto info = source.GetTensorTypeAndShapeInfo();
    const ONNXTensorElementDataType type = info.GetElementType();
    const std::size_t elem = ort_element_size(type);
    if (elem == 0) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "ort_view",
            detail::format("unsupported element type {}", ort_element_name(type)));
    }

    const std::vector<std::int64_t> shape = info.GetShape();
    const std::size_t bytes = info.GetElementCount() * elem;
    // ORT never writes to feeds; the const_cast only satisfies CreateTensor's signature
    void* data = const_cast<void*>(source.GetTensorRawData());
    return Ort::Value::CreateTensor(source.GetTensorMemoryInfo(), data, bytes,
        shape.data(), shape.size(), type);
}

/// Host Array copy of a CPU-resident output tensor.
[[nodiscard]] inline Array ort_to_array(const Ort::Value& value, std::string_view name) {
    if (!value.IsTensor()) {
        throw Error::Wrapper(ErrorCode::BackendFailure, "ort_to_array",
            "output is not a tensor (sequence and map outputs are not supported)", name);
    }

    const auto info = value.GetTensorTypeAndShapeInfo();
    const ONNXTensorElementDataType type = info.GetElementType();

    DType dt{};
    switch (type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:  dt = DType::Float32; break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE: dt = DType::Float64; break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:  dt = DType::Int32; break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:  dt = DType::Int64; break;
        default:
            throw Error::Wrapper(ErrorCode::BackendFailure, "ort_to_array",
                detail::format("cannot materialize a {} output as a host array", ort_element_name(type)),
                name);
    }

    const std::size_t bytes = info.GetElementCount() * ort_element_size(type);
    return Array::FromBytes(dt, info.GetShape(), value.GetTensorRawData(), bytes);
}

} // namespace sk_wrap::detail
