// sk_wrap/container.hpp
// Uniform prediction API over a backend, one type per task mode
//
// Container<Mode> composes a Backend (how to run) with a TaskMode (which
// operations exist and how outputs are read). Operations that are illegal
// for a mode are not declared for it, so calling one does not compile.
//
// Every operation runs: InputAdapter -> Backend::run -> post-processing.
// With a batch size configured, host inputs are scored in row partitions
// and the outputs concatenated along the first axis.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include "sk_wrap/array.hpp"
#include "sk_wrap/artifact.hpp"
#include "sk_wrap/backend.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/input.hpp"
#include "sk_wrap/input_adapter.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/post_process.hpp"
#include "sk_wrap/task_mode.hpp"

namespace sk_wrap {

namespace detail {

template<class... Args>
concept PositionalInputs = sizeof...(Args) > 0 && (std::constructible_from<Input, Args> && ...);

/// Common row count when every input is a host Array (rank >= 1) or Frame
/// of the same length; nullopt otherwise.
[[nodiscard]] inline std::optional<std::int64_t> batchable_rows(std::span<const Input> inputs) {
    std::optional<std::int64_t> rows;
    for (const Input& in : inputs) {
        std::int64_t r = 0;
        if (const Array* a = in.get_if<Array>()) {
            if (a->rank() == 0) return std::nullopt;
            r = a->rows();
        } else if (const Frame* f = in.get_if<Frame>()) {
            r = f->rows();
        } else {
            return std::nullopt;
        }
        if (rows && *rows != r) return std::nullopt;
        rows = r;
    }
    return rows;
}

[[nodiscard]] inline std::vector<Input> slice_inputs(
    std::span<const Input> inputs, std::int64_t begin, std::int64_t end)
{
    std::vector<Input> out;
    out.reserve(inputs.size());
    for (const Input& in : inputs) {
        if (const Array* a = in.get_if<Array>()) {
            out.emplace_back(a->slice_rows(begin, end));
        } else {
            out.emplace_back(in.get_if<Frame>()->slice_rows(begin, end));
        }
    }
    return out;
}

} // namespace detail

template<TaskMode Mode>
class Container {
public:
    static constexpr TaskMode mode = Mode;

    /// Throws InvalidConstruction if the backend's output count does not fit Mode.
    Container(
        std::unique_ptr<Backend> backend,
        ExecutionResourceConfig resources = {},
        ExtraConfig extra = {})
        : backend_(std::move(backend))
        , resources_(std::move(resources))
        , extra_(std::move(extra))
    {
        if (!backend_) {
            throw Error::Wrapper(ErrorCode::InvalidConstruction, "Container", "backend is null");
        }
        resources_.validate();
        check_output_count(Mode, backend_->num_outputs());
        logging::debug("{} container over {} backend ({} inputs, {} outputs)",
            task_mode_name(Mode), backend_kind_name(backend_->kind()),
            backend_->input_names().size(), backend_->num_outputs());
    }

    Container(
        const ModelArtifact& artifact,
        ExecutionResourceConfig resources = {},
        ExtraConfig extra = {})
        : Container(make_backend(artifact, resources), resources, std::move(extra))
    {}

    [[nodiscard]] const Backend& backend() const noexcept { return *backend_; }
    [[nodiscard]] BackendKind backend_kind() const noexcept { return backend_->kind(); }
    [[nodiscard]] const ExecutionResourceConfig& resources() const noexcept { return resources_; }
    [[nodiscard]] const ExtraConfig& extra_config() const noexcept { return extra_; }

    // ─────────────────────────────────────────────────────────────────
    // Transformer
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] Array transform(std::span<const Input> inputs) const
        requires (Mode == TaskMode::Transformer)
    {
        return post::transform(score_one_(inputs, 0));
    }

    template<class... Args>
        requires (Mode == TaskMode::Transformer) && detail::PositionalInputs<Args...>
    [[nodiscard]] Array transform(Args&&... args) const {
        const std::vector<Input> inputs = make_inputs(std::forward<Args>(args)...);
        return transform(std::span<const Input>(inputs));
    }

    // ─────────────────────────────────────────────────────────────────
    // Regressor / Classifier / AnomalyDetector
    // ─────────────────────────────────────────────────────────────────

    /// Regressor: flattened predictions. Classifier: labels as returned.
    /// AnomalyDetector: flattened labels (-1 / 1).
    [[nodiscard]] Array predict(std::span<const Input> inputs) const
        requires (Mode != TaskMode::Transformer)
    {
        Array out = score_one_(inputs, post::kLabels);
        if constexpr (Mode == TaskMode::Regressor) return post::regression(out);
        else if constexpr (Mode == TaskMode::Classifier) return post::class_labels(std::move(out));
        else return post::anomaly_labels(out);
    }

    template<class... Args>
        requires (Mode != TaskMode::Transformer) && detail::PositionalInputs<Args...>
    [[nodiscard]] Array predict(Args&&... args) const {
        const std::vector<Input> inputs = make_inputs(std::forward<Args>(args)...);
        return predict(std::span<const Input>(inputs));
    }

    [[nodiscard]] Array predict_proba(std::span<const Input> inputs) const
        requires (Mode == TaskMode::Classifier)
    {
        return post::probabilities(score_one_(inputs, post::kProbabilities));
    }

    template<class... Args>
        requires (Mode == TaskMode::Classifier) && detail::PositionalInputs<Args...>
    [[nodiscard]] Array predict_proba(Args&&... args) const {
        const std::vector<Input> inputs = make_inputs(std::forward<Args>(args)...);
        return predict_proba(std::span<const Input>(inputs));
    }

    [[nodiscard]] Array decision_function(std::span<const Input> inputs) const
        requires (Mode == TaskMode::AnomalyDetector)
    {
        return post::decision_scores(score_one_(inputs, post::kScores), extra_);
    }

    template<class... Args>
        requires (Mode == TaskMode::AnomalyDetector) && detail::PositionalInputs<Args...>
    [[nodiscard]] Array decision_function(Args&&... args) const {
        const std::vector<Input> inputs = make_inputs(std::forward<Args>(args)...);
        return decision_function(std::span<const Input>(inputs));
    }

    /// decision_function(inputs) + offset. The offset is resolved before the
    /// backend runs: MissingConfigKey if absent, InvalidArgument if not numeric.
    [[nodiscard]] Array score_samples(std::span<const Input> inputs) const
        requires (Mode == TaskMode::AnomalyDetector)
    {
        const double offset = offset_();
        return post::sample_scores(decision_function(inputs), offset);
    }

    template<class... Args>
        requires (Mode == TaskMode::AnomalyDetector) && detail::PositionalInputs<Args...>
    [[nodiscard]] Array score_samples(Args&&... args) const {
        const std::vector<Input> inputs = make_inputs(std::forward<Args>(args)...);
        return score_samples(std::span<const Input>(inputs));
    }

private:
    std::unique_ptr<Backend> backend_;
    ExecutionResourceConfig resources_;
    ExtraConfig extra_;

    [[nodiscard]] double offset_() const {
        if (!extra_.contains(keys::kOffset)) {
            throw Error::MissingConfigKey(keys::kOffset, "Container::score_samples");
        }
        return extra_.number(keys::kOffset);
    }

    [[nodiscard]] Array score_one_(std::span<const Input> inputs, std::size_t output) const {
        const std::size_t wanted[] = {output};
        return std::move(score_(inputs, wanted).front());
    }

    [[nodiscard]] std::vector<Array> run_once_(
        std::span<const Input> inputs,
        std::span<const std::size_t> outputs) const
    {
        const AdaptedInputs adapted =
            InputAdapter::adapt(backend_->kind(), backend_->input_names(), inputs);
        return backend_->run(adapted, outputs);
    }

    [[nodiscard]] std::vector<Array> score_(
        std::span<const Input> inputs,
        std::span<const std::size_t> outputs) const
    {
        if (!resources_.batch_size) {
            return run_once_(inputs, outputs);
        }

        const std::int64_t batch = *resources_.batch_size;
        const std::optional<std::int64_t> rows = detail::batchable_rows(inputs);
        if (!rows || *rows <= batch) {
            if (!rows) logging::debug("inputs are not row-sliceable host data; scoring unbatched");
            return run_once_(inputs, outputs);
        }

        logging::debug("scoring {} rows in batches of {}", *rows, batch);

        std::vector<std::vector<Array>> parts(outputs.size());
        for (std::int64_t begin = 0; begin < *rows; begin += batch) {
            const std::int64_t end = std::min(begin + batch, *rows);
            const std::vector<Input> slice = detail::slice_inputs(inputs, begin, end);
            std::vector<Array> result = run_once_(slice, outputs);
            for (std::size_t i = 0; i < result.size(); ++i) {
                parts[i].push_back(std::move(result[i]));
            }
        }

        std::vector<Array> merged;
        merged.reserve(parts.size());
        for (const auto& p : parts) {
            merged.push_back(Array::concat_rows(p));
        }
        return merged;
    }
};

using TransformerContainer = Container<TaskMode::Transformer>;
using RegressorContainer = Container<TaskMode::Regressor>;
using ClassifierContainer = Container<TaskMode::Classifier>;
using AnomalyDetectorContainer = Container<TaskMode::AnomalyDetector>;

/// A container whose mode is chosen at run time.
using AnyContainer = std::variant<
    TransformerContainer,
    RegressorContainer,
    ClassifierContainer,
    AnomalyDetectorContainer>;

[[nodiscard]] inline AnyContainer make_container(
    TaskMode mode,
    std::unique_ptr<Backend> backend,
    ExecutionResourceConfig resources = {},
    ExtraConfig extra = {})
{
    switch (mode) {
        case TaskMode::Transformer:
            return TransformerContainer(std::move(backend), std::move(resources), std::move(extra));
        case TaskMode::Regressor:
            return RegressorContainer(std::move(backend), std::move(resources), std::move(extra));
        case TaskMode::Classifier:
            return ClassifierContainer(std::move(backend), std::move(resources), std::move(extra));
        case TaskMode::AnomalyDetector:
            return AnomalyDetectorContainer(std::move(backend), std::move(resources), std::move(extra));
    }
    throw Error::Wrapper(ErrorCode::InvalidConstruction, "make_container", "unknown task mode");
}

[[nodiscard]] inline AnyContainer make_container(
    TaskMode mode,
    const ModelArtifact& artifact,
    ExecutionResourceConfig resources = {},
    ExtraConfig extra = {})
{
    std::unique_ptr<Backend> backend = make_backend(artifact, resources);
    return make_container(mode, std::move(backend), std::move(resources), std::move(extra));
}

} // namespace sk_wrap
