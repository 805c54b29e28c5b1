// sk_wrap/backend.hpp
// Backend capability: one engine session that runs adapted inputs
//
// A backend is constructed once from a model artifact, captures its
// declared input and output names, and exposes a single run() that returns
// host-resident arrays for the requested outputs.

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sk_wrap/array.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/detail/ort.hpp"

namespace sk_wrap {

enum class BackendKind {
    InProcess,  // TensorFlow C API
    Portable,   // ONNX Runtime
};

[[nodiscard]] constexpr const char* backend_kind_name(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::InProcess: return "in-process";
        case BackendKind::Portable:  return "portable";
    }
    return "unknown";
}

/// Inputs keyed by the portable session's declared names, in declared order.
/// names[i] keys values[i]; values stay contiguous for Ort::Session::Run.
struct NamedInputSet {
    std::vector<std::string> names;
    std::vector<Ort::Value> values;

    void add(std::string name, Ort::Value value) {
        names.push_back(std::move(name));
        values.push_back(std::move(value));
    }

    [[nodiscard]] std::size_t size() const noexcept { return names.size(); }
};

/// Positional tensors for the in-process backend, or named values for the
/// portable backend.
using AdaptedInputs = std::variant<std::vector<Tensor>, NamedInputSet>;

class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
    [[nodiscard]] virtual const std::vector<std::string>& input_names() const noexcept = 0;
    [[nodiscard]] virtual const std::vector<std::string>& output_names() const noexcept = 0;

    /// Run once and return the outputs at `outputs` (indices into
    /// output_names()), in that order, as host arrays.
    [[nodiscard]] virtual std::vector<Array> run(
        const AdaptedInputs& inputs,
        std::span<const std::size_t> outputs) const = 0;

    [[nodiscard]] std::size_t num_outputs() const noexcept { return output_names().size(); }

protected:
    Backend() = default;
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;
};

} // namespace sk_wrap
