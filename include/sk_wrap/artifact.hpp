// sk_wrap/artifact.hpp
// Model artifacts and backend selection

#pragma once

#include <memory>
#include <type_traits>
#include <variant>

#include "sk_wrap/backend.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/ort_backend.hpp"
#include "sk_wrap/tf_backend.hpp"

namespace sk_wrap {

/// Executable representation handed over by model conversion.
using ModelArtifact = std::variant<TensorFlowGraphDef, TensorFlowSavedModel, OnnxModel>;

[[nodiscard]] inline BackendKind backend_kind_of(const ModelArtifact& artifact) noexcept {
    return std::holds_alternative<OnnxModel>(artifact) ? BackendKind::Portable : BackendKind::InProcess;
}

/// Construct the backend that runs `artifact` with `cfg` applied.
[[nodiscard]] inline std::unique_ptr<Backend> make_backend(
    const ModelArtifact& artifact,
    const ExecutionResourceConfig& cfg)
{
    cfg.validate();
    return std::visit([&](const auto& a) -> std::unique_ptr<Backend> {
        using A = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<A, OnnxModel>) {
            return std::make_unique<OnnxRuntimeBackend>(a, cfg);
        } else {
            return std::make_unique<TensorFlowBackend>(a, cfg);
        }
    }, artifact);
}

} // namespace sk_wrap
