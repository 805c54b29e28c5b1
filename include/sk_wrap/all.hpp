// sk_wrap/all.hpp
// Umbrella header for SklearnWrap
//
// Include this single header to get the whole prediction API.

#pragma once

#include "sk_wrap/error.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/array.hpp"
#include "sk_wrap/frame.hpp"
#include "sk_wrap/config.hpp"
#include "sk_wrap/status.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/graph.hpp"
#include "sk_wrap/session.hpp"
#include "sk_wrap/input.hpp"
#include "sk_wrap/resources.hpp"
#include "sk_wrap/backend.hpp"
#include "sk_wrap/tf_backend.hpp"
#include "sk_wrap/ort_backend.hpp"
#include "sk_wrap/artifact.hpp"
#include "sk_wrap/input_adapter.hpp"
#include "sk_wrap/task_mode.hpp"
#include "sk_wrap/post_process.hpp"
#include "sk_wrap/container.hpp"

// ============================================================================
// SklearnWrap - Quick Reference
// ============================================================================
//
// CONTAINERS (one type per task mode):
// ─────────────────────────────────────────────────────────────────────────────
//   sk_wrap::TransformerContainer      - transform
//   sk_wrap::RegressorContainer        - predict
//   sk_wrap::ClassifierContainer       - predict, predict_proba
//   sk_wrap::AnomalyDetectorContainer  - predict, decision_function, score_samples
//   sk_wrap::AnyContainer              - variant of the four, from make_container()
//
// BACKENDS:
// ─────────────────────────────────────────────────────────────────────────────
//   sk_wrap::TensorFlowBackend   - in-process, TensorFlowGraphDef / TensorFlowSavedModel
//   sk_wrap::OnnxRuntimeBackend  - portable, OnnxModel
//   sk_wrap::make_backend(artifact, resources)
//
// INPUTS (positional, one per model input):
// ─────────────────────────────────────────────────────────────────────────────
//   sk_wrap::Array       - host numeric array, converted to float32
//   sk_wrap::Frame       - named columns; a lone frame becomes one input per column
//   sk_wrap::Tensor      - passed through to the in-process backend
//   Ort::Value           - passed through to the portable backend
//   sk_wrap::InputGroup  - one pre-grouped argument, unwrapped by the portable backend
//
// CONFIGURATION:
// ─────────────────────────────────────────────────────────────────────────────
//   sk_wrap::ExecutionResourceConfig{thread_count, batch_size, device}
//   sk_wrap::ExtraConfig{{"offset", 0.5}, {"iforest_threshold", -0.1}}
//   SK_WRAP_LOG_LEVEL=debug    (or sk_wrap::Logger::set_level)
//
// EXAMPLE:
// ─────────────────────────────────────────────────────────────────────────────
//   sk_wrap::OnnxModel model{read_file("iforest.onnx")};
//   sk_wrap::AnomalyDetectorContainer det(model, {.thread_count = 1},
//       sk_wrap::ExtraConfig{{"offset", -0.5}});
//
//   auto x = sk_wrap::Array::FromVector<float>({2, 4}, {...});
//   auto labels = det.predict(x);           // -1 / 1
//   auto scores = det.score_samples(x);     // decision_function + offset
//
// ERRORS:
// ─────────────────────────────────────────────────────────────────────────────
//   Everything throws sk_wrap::Error (a std::runtime_error). code() tells
//   wrapper failures apart; engine failures carry engine_status().
