// sk_wrap/post_process.hpp
// Reshaping of raw backend outputs into caller-facing results
//
// Each function receives the host array of the output its operation selects.

#pragma once

#include <cstddef>

#include "sk_wrap/array.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/logging.hpp"

namespace sk_wrap::post {

// Output positions, by operation
inline constexpr std::size_t kLabels = 0;
inline constexpr std::size_t kProbabilities = 1;
inline constexpr std::size_t kScores = 1;

[[nodiscard]] inline Array transform(Array out) { return out; }

[[nodiscard]] inline Array regression(const Array& out) { return out.flatten(); }

[[nodiscard]] inline Array class_labels(Array labels) { return labels; }

[[nodiscard]] inline Array probabilities(Array proba) { return proba; }

/// Anomaly labels (conventionally -1 / 1), flattened.
[[nodiscard]] inline Array anomaly_labels(const Array& labels) { return labels.flatten(); }

/// Flattened scores, shifted by iforest_threshold only when that key is set.
/// The shift restores the older upstream scoring convention.
[[nodiscard]] inline Array decision_scores(const Array& scores, const ExtraConfig& extra) {
    Array flat = scores.flatten();
    if (const auto shift = extra.number_if(keys::kIForestThreshold)) {
        logging::debug("decision_function: applying score shift {}", *shift);
        return flat.plus(*shift);
    }
    return flat;
}

/// decision_function scores plus the score offset.
[[nodiscard]] inline Array sample_scores(const Array& decision, double offset) {
    return decision.plus(offset);
}

} // namespace sk_wrap::post
