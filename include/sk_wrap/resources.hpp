// sk_wrap/resources.hpp
// Execution resource configuration for both engines
//
// Both engines get the same policy: one inter-op thread, sequential
// operator execution, and the configured number of intra-op threads (or the
// engine default when unset).
//
// TensorFlow takes these through a serialized ConfigProto. Only three scalar
// fields are needed, so the message is encoded here directly. Field numbers
// are those of message ConfigProto in tensorflow/core/protobuf/config.proto
// (see detail::config_proto below).
// use_per_session_threads gives each session its own pools, so two containers
// with different thread counts do not share process-wide pools.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sk_wrap/config.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/session.hpp"
#include "sk_wrap/detail/ort.hpp"

namespace sk_wrap {

namespace detail {

inline void append_varint(std::vector<std::uint8_t>& out, std::uint64_t v) {
    while (v >= 0x80) {
        out.push_back(static_cast<std::uint8_t>(v | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(v));
}

// tensorflow/core/protobuf/config.proto, message ConfigProto
namespace config_proto {
inline constexpr int kIntraOpParallelismThreads = 2;   // int32
inline constexpr int kInterOpParallelismThreads = 5;   // int32
inline constexpr int kUsePerSessionThreads = 9;        // bool
} // namespace config_proto

/// Tag byte for a varint field (wire type 0).
[[nodiscard]] constexpr std::uint8_t varint_tag(int field) noexcept {
    return static_cast<std::uint8_t>(field << 3);
}

} // namespace detail

/// Serialized tensorflow.ConfigProto for `cfg`.
[[nodiscard]] inline std::vector<std::uint8_t> tf_config_proto(const ExecutionResourceConfig& cfg) {
    std::vector<std::uint8_t> proto;

    if (cfg.thread_count) {
        proto.push_back(detail::varint_tag(detail::config_proto::kIntraOpParallelismThreads));
        detail::append_varint(proto, static_cast<std::uint64_t>(*cfg.thread_count));
    }

    proto.push_back(detail::varint_tag(detail::config_proto::kInterOpParallelismThreads));
    detail::append_varint(proto, 1);

    proto.push_back(detail::varint_tag(detail::config_proto::kUsePerSessionThreads));
    detail::append_varint(proto, 1);

    return proto;
}

[[nodiscard]] inline SessionOptions tf_session_options(const ExecutionResourceConfig& cfg) {
    cfg.validate();

    SessionOptions opts;
    opts.SetConfig(tf_config_proto(cfg));

    if (cfg.thread_count) {
        logging::debug("TensorFlow session: intra_op={} inter_op=1", *cfg.thread_count);
    } else {
        logging::debug("TensorFlow session: intra_op=default inter_op=1");
    }
    return opts;
}

/// TensorFlow device spec for cfg.device: empty for the default device,
/// "/device:GPU:<N>" for "cuda" / "cuda:<N>". Other devices are
/// BackendUnavailable.
[[nodiscard]] inline std::string tf_device_spec(const ExecutionResourceConfig& cfg) {
    const std::optional<int> gpu = cfg.cuda_ordinal("tf_device_spec");
    return gpu ? detail::format("/device:GPU:{}", *gpu) : std::string{};
}

/// Apply threading and device placement to portable-engine session options.
/// Throws BackendUnavailable if a non-default device cannot be attached.
inline void apply_resources(Ort::SessionOptions& opts, const ExecutionResourceConfig& cfg) {
    cfg.validate();

    try {
        if (cfg.thread_count) {
            opts.SetIntraOpNumThreads(*cfg.thread_count);
        }
        opts.SetInterOpNumThreads(1);
        opts.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
    } catch (const Ort::Exception& e) {
        throw detail::ort_error(e, "apply_resources");
    }

    if (cfg.thread_count) {
        logging::debug("ONNX Runtime session: intra_op={} inter_op=1 sequential", *cfg.thread_count);
    } else {
        logging::debug("ONNX Runtime session: intra_op=default inter_op=1 sequential");
    }

    const std::optional<int> gpu = cfg.cuda_ordinal("apply_resources");
    if (!gpu) return;

    try {
        OrtCUDAProviderOptions cuda{};
        cuda.device_id = *gpu;
        opts.AppendExecutionProvider_CUDA(cuda);
    } catch (const Ort::Exception& e) {
        throw Error::Wrapper(ErrorCode::BackendUnavailable, "apply_resources",
            detail::format("CUDA execution provider unavailable: {}", e.what()), cfg.device);
    }
    logging::info("ONNX Runtime session placed on {}", cfg.device);
}

} // namespace sk_wrap
