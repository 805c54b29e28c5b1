// sk_wrap/tf_backend.hpp
// In-process backend on the TensorFlow C API
//
// The artifact is a frozen GraphDef or a SavedModel directory, plus the
// endpoint names of the converted model's inputs and outputs. Endpoints are
// resolved once at construction. The graph is only ever executed: no
// gradient operations are added and no training targets are run.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "sk_wrap/backend.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"
#include "sk_wrap/graph.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/resources.hpp"
#include "sk_wrap/session.hpp"
#include "sk_wrap/status.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/detail/tf_handle.hpp"

namespace sk_wrap {

struct TensorFlowGraphDef {
    std::vector<std::uint8_t> graph_def;
    std::vector<std::string> inputs;   // "op" or "op:index", positional order
    std::vector<std::string> outputs;
};

struct TensorFlowSavedModel {
    std::string export_dir;
    std::vector<std::string> tags{"serve"};
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
};

class TensorFlowBackend final : public Backend {
public:
    /// A non-default device pins the imported graph to it; the device must be
    /// visible to the session, otherwise construction fails with
    /// BackendUnavailable.
    TensorFlowBackend(const TensorFlowGraphDef& artifact, const ExecutionResourceConfig& cfg)
        : device_(tf_device_spec(cfg))
        , graph_(import_(artifact, device_))
        , session_(graph_, tf_session_options(cfg))
        , input_names_(artifact.inputs)
        , output_names_(artifact.outputs)
    {
        verify_device_();
        resolve_endpoints_();
        logging::info("loaded TensorFlow graph ({} operations, {} inputs, {} outputs)",
            graph_.num_operations(), input_names_.size(), output_names_.size());
    }

    /// SavedModels keep the placement recorded at export; a non-default
    /// device is BackendUnavailable.
    TensorFlowBackend(const TensorFlowSavedModel& artifact, const ExecutionResourceConfig& cfg)
        : session_(load_(graph_, artifact, cfg))
        , input_names_(artifact.inputs)
        , output_names_(artifact.outputs)
    {
        resolve_endpoints_();
        logging::info("loaded TensorFlow SavedModel {} ({} inputs, {} outputs)",
            artifact.export_dir, input_names_.size(), output_names_.size());
    }

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::InProcess; }
    [[nodiscard]] const std::vector<std::string>& input_names() const noexcept override { return input_names_; }
    [[nodiscard]] const std::vector<std::string>& output_names() const noexcept override { return output_names_; }

    [[nodiscard]] std::vector<Array> run(
        const AdaptedInputs& inputs,
        std::span<const std::size_t> outputs) const override
    {
        const auto* tensors = std::get_if<std::vector<Tensor>>(&inputs);
        if (!tensors) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "TensorFlowBackend::run",
                "expected positional tensors, got a named input set");
        }
        if (tensors->size() != feeds_.size()) {
            throw Error::InputArityMismatch(feeds_.size(), tensors->size(), "TensorFlowBackend::run");
        }

        std::vector<TF_Output> fetches;
        fetches.reserve(outputs.size());
        for (std::size_t idx : outputs) {
            if (idx >= fetches_.size()) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "TensorFlowBackend::run",
                    detail::format("output index {} out of range ({} outputs)", idx, fetches_.size()));
            }
            fetches.push_back(fetches_[idx]);
        }

        const std::vector<Tensor> results = session_.Run(feeds_, *tensors, fetches);

        std::vector<Array> arrays;
        arrays.reserve(results.size());
        for (const Tensor& t : results) {
            arrays.push_back(t.ToArray());
        }
        return arrays;
    }

private:
    std::string device_;
    Graph graph_;
    Session session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<TF_Output> feeds_;
    std::vector<TF_Output> fetches_;

    [[nodiscard]] static Graph import_(const TensorFlowGraphDef& artifact, const std::string& device) {
        Graph graph;
        graph.ImportGraphDef(artifact.graph_def, device);
        return graph;
    }

    [[nodiscard]] static Session load_(
        Graph& graph,
        const TensorFlowSavedModel& artifact,
        const ExecutionResourceConfig& cfg)
    {
        if (!tf_device_spec(cfg).empty()) {
            throw Error::Wrapper(ErrorCode::BackendUnavailable, "TensorFlowBackend",
                "device placement is only available for GraphDef artifacts", cfg.device);
        }
        return Session::LoadSavedModel(graph, artifact.export_dir, artifact.tags, tf_session_options(cfg));
    }

    void verify_device_() const {
        if (device_.empty()) return;

        Status st;
        const detail::DeviceListPtr devices(TF_SessionListDevices(session_.handle(), st.get()));
        st.throw_if_error("TF_SessionListDevices");

        const int n = TF_DeviceListCount(devices.get());
        for (int i = 0; i < n; ++i) {
            const char* name = TF_DeviceListName(devices.get(), i, st.get());
            st.throw_if_error("TF_DeviceListName");
            // Full names end in the short device name: /job:localhost/.../device:GPU:0
            if (name && std::string_view(name).ends_with(device_)) {
                logging::info("TensorFlow graph placed on {}", name);
                return;
            }
        }
        throw Error::Wrapper(ErrorCode::BackendUnavailable, "TensorFlowBackend",
            detail::format("device {} is not available to TensorFlow", device_), device_);
    }

    void resolve_endpoints_() {
        if (output_names_.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidConstruction, "TensorFlowBackend",
                "model declares no outputs");
        }
        feeds_.reserve(input_names_.size());
        for (const auto& name : input_names_) {
            feeds_.push_back(graph_.resolve(name));
        }
        fetches_.reserve(output_names_.size());
        for (const auto& name : output_names_) {
            fetches_.push_back(graph_.resolve(name));
        }
    }
};

} // namespace sk_wrap
