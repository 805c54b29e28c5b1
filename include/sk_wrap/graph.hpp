// sk_wrap/graph.hpp
// Serialized-graph buffers and the imported TF_Graph
//
// Graphs are produced by model conversion and arrive here as serialized
// GraphDef bytes (or inside a SavedModel). The wrapper imports them once,
// resolves endpoint names, and never adds operations afterwards.

#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include <tensorflow/c/c_api.h>
}

#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"
#include "sk_wrap/status.hpp"
#include "sk_wrap/tensor_name.hpp"
#include "sk_wrap/detail/tf_handle.hpp"

namespace sk_wrap {

// ============================================================================
// Buffer
// ============================================================================

/// TF_Buffer holding GraphDef or ConfigProto bytes.
class Buffer {
public:
    Buffer() : buf_(TF_NewBuffer()) { check_("TF_NewBuffer"); }

    Buffer(const void* data, std::size_t len) : buf_(TF_NewBufferFromString(data, len)) {
        check_("TF_NewBufferFromString");
    }

    [[nodiscard]] TF_Buffer* handle() const noexcept { return buf_.get(); }
    [[nodiscard]] std::size_t length() const noexcept { return buf_ ? buf_->length : 0; }
    [[nodiscard]] bool empty() const noexcept { return length() == 0; }

    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const {
        if (empty() || !buf_->data) return {};
        const auto* p = static_cast<const std::uint8_t*>(buf_->data);
        return {p, p + buf_->length};
    }

private:
    detail::BufferPtr buf_;

    void check_(const char* fn) const {
        if (!buf_) throw Error::TensorFlow("RESOURCE_EXHAUSTED", "Buffer", detail::format("{} failed", fn));
    }
};

// ============================================================================
// Graph
// ============================================================================

class Graph {
public:
    Graph() : graph_(detail::new_graph()) {
        if (!graph_) throw Error::TensorFlow("RESOURCE_EXHAUSTED", "Graph", "TF_NewGraph failed");
    }

    /// Import serialized GraphDef bytes. A non-empty `default_device` pins
    /// every imported node that carries no explicit device.
    void ImportGraphDef(
        std::span<const std::uint8_t> graph_def,
        std::string_view default_device = {},
        std::source_location loc = std::source_location::current())
    {
        if (graph_def.empty()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Graph::ImportGraphDef",
                "GraphDef is empty", {}, -1, loc);
        }

        const Buffer buf(graph_def.data(), graph_def.size());
        const detail::ImportOptionsPtr opts(TF_NewImportGraphDefOptions());
        const std::string device(default_device);
        if (!device.empty()) {
            TF_ImportGraphDefOptionsSetDefaultDevice(opts.get(), device.c_str());
        }

        Status st;
        TF_GraphImportGraphDef(handle_("ImportGraphDef"), buf.handle(), opts.get(), st.get());
        st.throw_if_error("TF_GraphImportGraphDef", loc);
    }

    [[nodiscard]] std::vector<std::uint8_t> ToGraphDef() const {
        Buffer buf;
        Status st;
        TF_GraphToGraphDef(handle_("ToGraphDef"), buf.handle(), st.get());
        st.throw_if_error("TF_GraphToGraphDef");
        return buf.to_bytes();
    }

    /// nullptr if the graph has no operation called `name`.
    [[nodiscard]] TF_Operation* find(const std::string& name) const {
        return TF_GraphOperationByName(handle_("find"), name.c_str());
    }

    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }

    [[nodiscard]] std::size_t num_operations() const {
        TF_Graph* g = handle_("num_operations");
        std::size_t pos = 0;
        std::size_t n = 0;
        for (; TF_GraphNextOperation(g, &pos) != nullptr; ++n) {}
        return n;
    }

    /// Resolve "op" or "op:index" to a TF_Output. Done once at load time.
    [[nodiscard]] TF_Output resolve(
        std::string_view name,
        std::source_location loc = std::source_location::current()) const
    {
        const detail::EndpointName ep = detail::parse_endpoint_name(name);

        TF_Operation* op = find(ep.op);
        if (!op) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Graph::resolve",
                "operation not found in graph", ep.op, ep.index, loc);
        }
        if (const int n = TF_OperationNumOutputs(op); ep.index >= n) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Graph::resolve",
                detail::format("output index {} out of range (operation has {} outputs)", ep.index, n),
                ep.op, ep.index, loc);
        }
        return TF_Output{op, ep.index};
    }

    [[nodiscard]] TF_Graph* handle() const noexcept { return graph_.get(); }

    /// Shared ownership for sessions that outlive this wrapper.
    [[nodiscard]] const detail::SharedGraph& shared() const noexcept { return graph_; }

private:
    detail::SharedGraph graph_;

    TF_Graph* handle_(const char* fn) const {
        if (!graph_) {
            throw Error::Wrapper(ErrorCode::InvalidArgument,
                detail::format("Graph::{}", fn), "graph is in moved-from state");
        }
        return graph_.get();
    }
};

} // namespace sk_wrap
