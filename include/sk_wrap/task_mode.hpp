// sk_wrap/task_mode.hpp
// Semantic role of a converted model

#pragma once

#include <cstddef>

#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"

namespace sk_wrap {

enum class TaskMode {
    Transformer,
    Regressor,
    Classifier,
    AnomalyDetector,
};

[[nodiscard]] constexpr const char* task_mode_name(TaskMode mode) noexcept {
    switch (mode) {
        case TaskMode::Transformer:     return "Transformer";
        case TaskMode::Regressor:       return "Regressor";
        case TaskMode::Classifier:      return "Classifier";
        case TaskMode::AnomalyDetector: return "AnomalyDetector";
    }
    return "unknown";
}

/// Number of outputs the backend must declare for `mode`.
[[nodiscard]] constexpr std::size_t required_outputs(TaskMode mode) noexcept {
    switch (mode) {
        case TaskMode::Transformer:     return 1;
        case TaskMode::Regressor:       return 1;
        case TaskMode::Classifier:      return 2;
        case TaskMode::AnomalyDetector: return 2;
    }
    return 0;
}

/// Throws InvalidConstruction unless `declared` matches required_outputs(mode).
inline void check_output_count(TaskMode mode, std::size_t declared) {
    if (declared != required_outputs(mode)) {
        throw Error::Wrapper(ErrorCode::InvalidConstruction, "check_output_count",
            detail::format("{} requires exactly {} backend outputs, model declares {}",
                task_mode_name(mode), required_outputs(mode), declared),
            task_mode_name(mode));
    }
}

/// Map the two-flag description (regression / anomaly detection) to a mode.
/// Both flags set is a construction error; neither means Classifier.
[[nodiscard]] inline TaskMode task_mode_from_flags(bool is_regression, bool is_anomaly_detection) {
    if (is_regression && is_anomaly_detection) {
        throw Error::Wrapper(ErrorCode::InvalidConstruction, "task_mode_from_flags",
            "regression and anomaly detection are mutually exclusive");
    }
    if (is_regression) return TaskMode::Regressor;
    if (is_anomaly_detection) return TaskMode::AnomalyDetector;
    return TaskMode::Classifier;
}

} // namespace sk_wrap
