// test_input_adapter.cpp
// Tests for sk_wrap::InputAdapter
//
// Framework: doctest
// Runs with: TensorFlow C library, ONNX Runtime
//
// These tests cover:
// - Conversion of host arrays to each backend's native tensor type
// - Frame splitting
// - Grouped-input unwrapping (portable only)
// - Arity checks and name keying (portable only)
// - Rejection of inputs that do not belong to the target backend

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/input_adapter.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using namespace sk_wrap;

namespace {

const std::vector<std::string> kThreeNames = {"x0", "x1", "x2"};

Array rows_of(std::int64_t rows, double value) {
    return Array::FromVector<double>(std::vector<std::int64_t>{rows, 1},
        std::vector<double>(static_cast<std::size_t>(rows), value));
}

Frame frame_of(std::int64_t rows) {
    Frame f;
    f.add_column("height", rows_of(rows, 1.0).flatten())
     .add_column("width", rows_of(rows, 2.0).flatten())
     .add_column("depth", rows_of(rows, 3.0).flatten());
    return f;
}

void check_error(ErrorCode code, auto&& fn) {
    try {
        fn();
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == code);
    }
}

} // namespace

// ============================================================================
// In-process backend
// ============================================================================

TEST_CASE("InputAdapter - in-process arrays become float32 tensors in order") {
    const auto inputs = make_inputs(rows_of(2, 1.0), rows_of(2, 2.0));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::InProcess, kThreeNames, inputs);

    const auto& tensors = std::get<std::vector<Tensor>>(adapted);
    REQUIRE(tensors.size() == 2);
    CHECK(tensors[0].dtype() == TF_FLOAT);
    CHECK(tensors[1].ToVector<float>() == std::vector<float>{2.0f, 2.0f});
}

TEST_CASE("InputAdapter - in-process count is left to the engine") {
    // The in-process engine reports feed mismatches itself
    const auto inputs = make_inputs(rows_of(1, 0.0));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::InProcess, kThreeNames, inputs);
    CHECK(std::get<std::vector<Tensor>>(adapted).size() == 1);
}

TEST_CASE("InputAdapter - shapes are not validated") {
    const auto inputs = make_inputs(Array::FromVector<float>({1, 2, 2}, {1, 2, 3, 4}));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::InProcess, kThreeNames, inputs);
    CHECK(std::get<std::vector<Tensor>>(adapted).front().rank() == 3);
}

TEST_CASE("InputAdapter - a single frame is split by column") {
    const auto inputs = make_inputs(frame_of(4));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::InProcess, kThreeNames, inputs);

    const auto& tensors = std::get<std::vector<Tensor>>(adapted);
    REQUIRE(tensors.size() == 3);
    for (const Tensor& t : tensors) {
        CHECK(t.shape() == std::vector<std::int64_t>{4, 1});
        CHECK(t.dtype() == TF_FLOAT);
    }
    CHECK(tensors[2].ToVector<float>().front() == 3.0f);
}

TEST_CASE("InputAdapter - in-process rejects portable values and groups") {
    detail::ensure_ort_api();
    const auto ort_inputs = make_inputs(detail::array_to_ort(rows_of(1, 0.0)));
    const auto grouped = make_inputs(make_group(rows_of(1, 0.0)));

    check_error(ErrorCode::UnsupportedInputType, [&] {
        (void)InputAdapter::adapt(BackendKind::InProcess, kThreeNames, ort_inputs);
    });
    check_error(ErrorCode::UnsupportedInputType, [&] {
        (void)InputAdapter::adapt(BackendKind::InProcess, kThreeNames, grouped);
    });
}

// ============================================================================
// Portable backend
// ============================================================================

TEST_CASE("InputAdapter - portable inputs are keyed by declared name") {
    const auto inputs = make_inputs(rows_of(2, 1.0), rows_of(2, 2.0), rows_of(2, 3.0));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);

    const auto& named = std::get<NamedInputSet>(adapted);
    CHECK(named.names == kThreeNames);
    REQUIRE(named.size() == 3);
    CHECK(detail::ort_to_array(named.values[2], "x2") == Array::FromVector<float>({2, 1}, {3.0f, 3.0f}));
}

TEST_CASE("InputAdapter - portable arity mismatch") {
    const auto inputs = make_inputs(rows_of(2, 1.0), rows_of(2, 2.0));
    try {
        (void)InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::InputArityMismatch);
        CHECK(e.message() == "expected 3 inputs, got 2");
    }
}

TEST_CASE("InputAdapter - portable unwraps one grouped argument") {
    const auto inputs = make_inputs(make_group(rows_of(1, 1.0), rows_of(1, 2.0), rows_of(1, 3.0)));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);

    const auto& named = std::get<NamedInputSet>(adapted);
    REQUIRE(named.size() == 3);
    CHECK(named.names[0] == "x0");
}

TEST_CASE("InputAdapter - a group of the wrong size still fails the arity check") {
    const auto inputs = make_inputs(make_group(rows_of(1, 1.0), rows_of(1, 2.0)));
    check_error(ErrorCode::InputArityMismatch, [&] {
        (void)InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);
    });
}

TEST_CASE("InputAdapter - a group is not unwrapped when the count already matches") {
    const std::vector<std::string> one = {"x"};
    const auto inputs = make_inputs(make_group(rows_of(1, 1.0)));
    try {
        (void)InputAdapter::adapt(BackendKind::Portable, one, inputs);
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::UnsupportedInputType);
        CHECK(e.subject() == "InputGroup");
    }
}

TEST_CASE("InputAdapter - a portable frame is split then keyed") {
    const auto inputs = make_inputs(frame_of(5));
    const AdaptedInputs adapted = InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);

    const auto& named = std::get<NamedInputSet>(adapted);
    REQUIRE(named.size() == 3);
    CHECK(detail::ort_to_array(named.values[1], "x1").shape() == std::vector<std::int64_t>{5, 1});
}

TEST_CASE("InputAdapter - portable rejects in-process tensors with their position") {
    const auto inputs = make_inputs(rows_of(1, 1.0), Tensor::FromVector<float>({1, 1}, {1.0f}), rows_of(1, 1.0));
    try {
        (void)InputAdapter::adapt(BackendKind::Portable, kThreeNames, inputs);
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::UnsupportedInputType);
        CHECK(e.index() == 1);
        CHECK(e.subject() == "Tensor");
    }
}
