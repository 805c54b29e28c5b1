// sk_wrap/ort_backend.hpp
// Portable backend on ONNX Runtime
//
// The serialized model is parsed once into a long-lived Ort::Session; the
// declared input and output names are captured at construction. run() takes
// inputs keyed by exactly those names and returns host arrays.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "sk_wrap/backend.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/resources.hpp"
#include "sk_wrap/detail/ort.hpp"

namespace sk_wrap {

struct OnnxModel {
    std::vector<std::uint8_t> model;   // serialized ModelProto
};

class OnnxRuntimeBackend final : public Backend {
public:
    /// Throws BackendUnavailable if the runtime cannot be bound, or BackendFailure
    /// (source OnnxRuntime) if the model does not load.
    OnnxRuntimeBackend(const OnnxModel& artifact, const ExecutionResourceConfig& cfg)
        : session_(load_(artifact, cfg))
    {
        try {
            Ort::AllocatorWithDefaultOptions allocator;
            const std::size_t n_in = session_.GetInputCount();
            input_names_.reserve(n_in);
            for (std::size_t i = 0; i < n_in; ++i) {
                input_names_.emplace_back(session_.GetInputNameAllocated(i, allocator).get());
            }
            const std::size_t n_out = session_.GetOutputCount();
            output_names_.reserve(n_out);
            for (std::size_t i = 0; i < n_out; ++i) {
                output_names_.emplace_back(session_.GetOutputNameAllocated(i, allocator).get());
            }
        } catch (const Ort::Exception& e) {
            throw detail::ort_error(e, "OnnxRuntimeBackend");
        }

        logging::info("loaded ONNX model ({} bytes, {} inputs, {} outputs)",
            artifact.model.size(), input_names_.size(), output_names_.size());
    }

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Portable; }
    [[nodiscard]] const std::vector<std::string>& input_names() const noexcept override { return input_names_; }
    [[nodiscard]] const std::vector<std::string>& output_names() const noexcept override { return output_names_; }

    [[nodiscard]] std::vector<Array> run(
        const AdaptedInputs& inputs,
        std::span<const std::size_t> outputs) const override
    {
        const auto* named = std::get_if<NamedInputSet>(&inputs);
        if (!named) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "OnnxRuntimeBackend::run",
                "expected a named input set, got positional tensors");
        }
        if (named->size() != input_names_.size()) {
            throw Error::InputArityMismatch(input_names_.size(), named->size(), "OnnxRuntimeBackend::run");
        }

        std::vector<const char*> in_names;
        in_names.reserve(named->size());
        for (const auto& name : named->names) {
            in_names.push_back(name.c_str());
        }

        std::vector<const char*> out_names;
        out_names.reserve(outputs.size());
        for (std::size_t idx : outputs) {
            if (idx >= output_names_.size()) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "OnnxRuntimeBackend::run",
                    detail::format("output index {} out of range ({} outputs)", idx, output_names_.size()));
            }
            out_names.push_back(output_names_[idx].c_str());
        }

        std::vector<Ort::Value> results;
        try {
            results = session_.Run(Ort::RunOptions{nullptr},
                in_names.data(), named->values.data(), in_names.size(),
                out_names.data(), out_names.size());
        } catch (const Ort::Exception& e) {
            throw detail::ort_error(e, "OnnxRuntimeBackend::run");
        }

        std::vector<Array> arrays;
        arrays.reserve(results.size());
        for (std::size_t i = 0; i < results.size(); ++i) {
            arrays.push_back(detail::ort_to_array(results[i], out_names[i]));
        }
        return arrays;
    }

private:
    mutable Ort::Session session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;

    [[nodiscard]] static Ort::Session load_(const OnnxModel& artifact, const ExecutionResourceConfig& cfg) {
        Ort::Env& env = detail::ort_env();
        if (artifact.model.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "OnnxRuntimeBackend", "model bytes are empty");
        }

        try {
            Ort::SessionOptions opts;
            apply_resources(opts, cfg);
            return Ort::Session(env, artifact.model.data(), artifact.model.size(), opts);
        } catch (const Ort::Exception& e) {
            throw detail::ort_error(e, "OnnxRuntimeBackend");
        }
    }
};

} // namespace sk_wrap
