// sk_wrap/session.hpp
// Session options and the inference session over an imported graph
//
// Thread safety:
// - Session::Run() may be called concurrently (TensorFlow's guarantee)
// - Options are applied once at construction and never changed

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
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
#include "sk_wrap/graph.hpp"
#include "sk_wrap/status.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/detail/tf_handle.hpp"

namespace sk_wrap {

// ============================================================================
// SessionOptions
// ============================================================================

class SessionOptions {
public:
    SessionOptions() : opts_(TF_NewSessionOptions()) {
        if (!opts_) {
            throw Error::TensorFlow("RESOURCE_EXHAUSTED", "SessionOptions", "TF_NewSessionOptions failed");
        }
    }

    /// Apply a serialized tensorflow.ConfigProto.
    SessionOptions& SetConfig(std::span<const std::uint8_t> proto) {
        Status st;
        TF_SetConfig(opts_.get(), proto.data(), proto.size(), st.get());
        st.throw_if_error("TF_SetConfig");
        return *this;
    }

    [[nodiscard]] TF_SessionOptions* handle() const noexcept { return opts_.get(); }

private:
    detail::SessionOptionsPtr opts_;
};

// ============================================================================
// Session
// ============================================================================

class Session {
public:
    Session(const Graph& graph, const SessionOptions& opts) : graph_(graph.shared()) {
        if (!graph_) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Session",
                "cannot open a session on a moved-from graph");
        }
        Status st;
        session_.reset(TF_NewSession(graph.handle(), opts.handle(), st.get()));
        st.throw_if_error("TF_NewSession");
    }

    explicit Session(const Graph& graph) : Session(graph, SessionOptions()) {}

    /// Load a SavedModel into `graph` and open a session on it.
    [[nodiscard]] static Session LoadSavedModel(
        Graph& graph,
        const std::string& export_dir,
        const std::vector<std::string>& tags,
        const SessionOptions& opts)
    {
        std::vector<const char*> tag_ptrs;
        tag_ptrs.reserve(tags.size());
        for (const auto& t : tags) tag_ptrs.push_back(t.c_str());

        Status st;
        TF_Session* raw = TF_LoadSessionFromSavedModel(
            opts.handle(), nullptr, export_dir.c_str(),
            tag_ptrs.data(), count_(tags.size(), "tags"),
            graph.handle(), nullptr, st.get());
        st.throw_if_error("TF_LoadSessionFromSavedModel");
        return Session(graph.shared(), raw);
    }

    /// Feed `inputs` to `feeds` pairwise and fetch `fetches`. No target
    /// operations are ever run.
    [[nodiscard]] std::vector<Tensor> Run(
        std::span<const TF_Output> feeds,
        std::span<const Tensor> inputs,
        std::span<const TF_Output> fetches,
        std::source_location loc = std::source_location::current()) const
    {
        if (feeds.size() != inputs.size()) {
            throw Error::InputArityMismatch(feeds.size(), inputs.size(), "Session::Run", loc);
        }

        std::vector<TF_Tensor*> in(inputs.size());
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            in[i] = inputs[i].handle();
            if (!in[i]) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "Session::Run",
                    "input tensor is empty", {}, static_cast<int>(i), loc);
            }
        }

        std::vector<TF_Tensor*> out(fetches.size(), nullptr);
        Status st;
        TF_SessionRun(session_.get(), nullptr,
            feeds.data(), in.data(), count_(feeds.size(), "feeds"),
            fetches.data(), out.data(), count_(fetches.size(), "fetches"),
            nullptr, 0, nullptr, st.get());

        // Own every fetched tensor before anything can throw
        std::vector<detail::RawTensorPtr> owned(out.begin(), out.end());
        st.throw_if_error("TF_SessionRun", loc);

        std::vector<Tensor> results;
        results.reserve(owned.size());
        for (std::size_t i = 0; i < owned.size(); ++i) {
            if (!owned[i]) {
                throw Error::Wrapper(ErrorCode::BackendFailure, "Session::Run",
                    "fetch returned no tensor", TF_OperationName(fetches[i].oper), fetches[i].index, loc);
            }
            results.push_back(Tensor::FromRaw(owned[i].release()));
        }
        return results;
    }

    [[nodiscard]] TF_Session* handle() const noexcept { return session_.get(); }

private:
    struct Closer {
        void operator()(TF_Session* s) const noexcept {
            if (!s) return;
            if (TF_Status* st = TF_NewStatus()) {
                TF_CloseSession(s, st);
                TF_DeleteSession(s, st);
                TF_DeleteStatus(st);
            }
        }
    };

    detail::SharedGraph graph_;
    std::unique_ptr<TF_Session, Closer> session_;

    Session(detail::SharedGraph graph, TF_Session* raw) : graph_(std::move(graph)), session_(raw) {}

    [[nodiscard]] static int count_(std::size_t n, const char* what) {
        if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Session",
                detail::format("{} count {} exceeds int range", what, n));
        }
        return static_cast<int>(n);
    }
};

} // namespace sk_wrap
