// test_ort_backend.cpp
// Portable backend tests with the real ONNX Runtime library
//
// Framework: doctest
// Runs with: ONNX Runtime
//
// Small ONNX models are serialized here with a minimal protobuf writer
// (ir_version 7, default opset 13), so no model files are needed.
//
// These tests cover:
// - Runtime binding and Ort::Value <-> Array conversion
// - OnnxRuntimeBackend construction errors, declared names and run()
// - Containers end to end: naming, grouping, frames, pass-through values

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/all.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace sk_wrap;

namespace {

// ============================================================================
// ONNX model writer
// ============================================================================

using Bytes = std::vector<std::uint8_t>;

void put_varint(Bytes& out, std::uint64_t v) {
    while (v >= 0x80) {
        out.push_back(static_cast<std::uint8_t>(v | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(v));
}

void put_int(Bytes& out, int field, std::uint64_t v) {
    put_varint(out, static_cast<std::uint64_t>(field) << 3);
    put_varint(out, v);
}

void put_bytes(Bytes& out, int field, const Bytes& payload) {
    put_varint(out, (static_cast<std::uint64_t>(field) << 3) | 2);
    put_varint(out, payload.size());
    out.insert(out.end(), payload.begin(), payload.end());
}

void put_string(Bytes& out, int field, std::string_view s) {
    put_bytes(out, field, Bytes(s.begin(), s.end()));
}

// ValueInfoProto for a float tensor of shape [N, 1]
Bytes float_column_info(std::string_view name) {
    Bytes dim_n;   put_string(dim_n, 2, "N");
    Bytes dim_1;   put_int(dim_1, 1, 1);
    Bytes shape;   put_bytes(shape, 1, dim_n); put_bytes(shape, 1, dim_1);
    Bytes tensor;  put_int(tensor, 1, 1); put_bytes(tensor, 2, shape);
    Bytes type;    put_bytes(type, 1, tensor);
    Bytes info;    put_string(info, 1, name); put_bytes(info, 2, type);
    return info;
}

struct Node {
    std::string op_type;
    std::vector<std::string> inputs;
    std::string output;
};

Bytes onnx_model(
    std::initializer_list<Node> nodes,
    std::initializer_list<std::string_view> inputs,
    std::initializer_list<std::string_view> outputs)
{
    Bytes graph;
    for (const Node& n : nodes) {
        Bytes node;
        for (const auto& in : n.inputs) put_string(node, 1, in);
        put_string(node, 2, n.output);
        put_string(node, 4, n.op_type);
        put_bytes(graph, 1, node);
    }
    put_string(graph, 2, "sk_wrap_test");
    for (auto in : inputs) put_bytes(graph, 11, float_column_info(in));
    for (auto out : outputs) put_bytes(graph, 12, float_column_info(out));

    Bytes opset;
    put_int(opset, 2, 13);

    Bytes model;
    put_int(model, 1, 7);
    put_bytes(model, 7, graph);
    put_bytes(model, 8, opset);
    return model;
}

OnnxModel identity_model() {
    return OnnxModel{onnx_model({{"Identity", {"x"}, "y"}}, {"x"}, {"y"})};
}

OnnxModel sum_model() {
    return OnnxModel{onnx_model({{"Add", {"a", "b"}, "sum"}}, {"a", "b"}, {"sum"})};
}

OnnxModel two_output_model() {
    return OnnxModel{onnx_model(
        {{"Sign", {"x"}, "labels"}, {"Neg", {"x"}, "scores"}},
        {"x"}, {"labels", "scores"})};
}

Array column(std::vector<float> values) {
    const auto n = static_cast<std::int64_t>(values.size());
    return Array::FromVector<float>(std::vector<std::int64_t>{n, 1}, std::move(values));
}

} // namespace

// ============================================================================
// Runtime glue
// ============================================================================

TEST_CASE("ensure_ort_api - binds once and is repeatable") {
    CHECK_NOTHROW(detail::ensure_ort_api());
    CHECK_NOTHROW(detail::ensure_ort_api());
}

TEST_CASE("array_to_ort - float32 copy with the array's shape") {
    const auto a = Array::FromVector<std::int64_t>({2, 2}, {1, 2, 3, 4});
    const Ort::Value v = detail::array_to_ort(a);

    const auto info = v.GetTensorTypeAndShapeInfo();
    CHECK(info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT);
    CHECK(info.GetShape() == std::vector<std::int64_t>{2, 2});
    CHECK(detail::ort_to_array(v, "v") == a.astype<float>());
}

TEST_CASE("ort_view - shares the source buffer") {
    const Ort::Value source = detail::array_to_ort(column({1, 2, 3}));
    const Ort::Value view = detail::ort_view(source);

    CHECK(view.GetTensorRawData() == source.GetTensorRawData());
    CHECK(detail::ort_to_array(view, "view") == column({1, 2, 3}));
}

// ============================================================================
// OnnxRuntimeBackend
// ============================================================================

TEST_CASE("OnnxRuntimeBackend - empty model bytes") {
    try {
        OnnxRuntimeBackend backend(OnnxModel{}, {});
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("OnnxRuntimeBackend - corrupt model is an engine error") {
    try {
        OnnxRuntimeBackend backend(OnnxModel{Bytes{0x01, 0x02, 0x03, 0xFF}}, {});
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.source() == ErrorSource::OnnxRuntime);
        CHECK(e.code() == ErrorCode::BackendFailure);
        CHECK_FALSE(e.engine_status().empty());
    }
}

TEST_CASE("OnnxRuntimeBackend - declared names in graph order") {
    OnnxRuntimeBackend backend(two_output_model(), {});

    CHECK(backend.kind() == BackendKind::Portable);
    CHECK(backend.input_names() == std::vector<std::string>{"x"});
    CHECK(backend.output_names() == std::vector<std::string>{"labels", "scores"});
}

TEST_CASE("OnnxRuntimeBackend::run - only the requested outputs are returned") {
    OnnxRuntimeBackend backend(two_output_model(), {});

    NamedInputSet named;
    named.add("x", detail::array_to_ort(column({2, -3})));
    const std::size_t wanted[] = {1};

    const auto out = backend.run(AdaptedInputs(std::move(named)), wanted);
    REQUIRE(out.size() == 1);
    CHECK(out[0] == column({-2, 3}));
}

TEST_CASE("OnnxRuntimeBackend::run - positional tensors are refused") {
    OnnxRuntimeBackend backend(identity_model(), {});
    const std::size_t wanted[] = {0};

    CHECK_THROWS_AS((void)backend.run(AdaptedInputs(std::vector<Tensor>{}), wanted), Error);
}

TEST_CASE("OnnxRuntimeBackend - unknown device is BackendUnavailable") {
    ExecutionResourceConfig cfg;
    cfg.device = "tpu";
    try {
        (void)make_backend(identity_model(), cfg);
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::BackendUnavailable);
    }
}

// ============================================================================
// Containers end to end
// ============================================================================

TEST_CASE("Container - regressor over an ONNX model") {
    ExecutionResourceConfig cfg;
    cfg.thread_count = 1;
    RegressorContainer c(identity_model(), cfg);

    CHECK(c.predict(Array::FromVector<double>({2, 1}, {0.5, -0.5})) == Array::FromVector<float>({2}, {0.5f, -0.5f}));
}

TEST_CASE("Container - positional, grouped and frame inputs agree") {
    TransformerContainer c(sum_model());

    const Array positional = c.transform(column({1, 2}), column({10, 20}));
    const Array grouped = c.transform(make_group(column({1, 2}), column({10, 20})));

    Frame f;
    f.add_column("a", column({1, 2}).flatten())
     .add_column("b", column({10, 20}).flatten());
    const Array framed = c.transform(f);

    CHECK(positional == column({11, 22}));
    CHECK(grouped == positional);
    CHECK(framed == positional);
}

TEST_CASE("Container - too few inputs for the ONNX model") {
    TransformerContainer c(sum_model());
    try {
        (void)c.transform(column({1}));
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::InputArityMismatch);
    }
}

TEST_CASE("Container - native values pass straight through") {
    TransformerContainer c(identity_model());

    std::vector<Input> inputs;
    inputs.emplace_back(detail::array_to_ort(column({4, 5})));
    CHECK(c.transform(inputs) == column({4, 5}));
}

TEST_CASE("Container - anomaly detector over an ONNX model") {
    AnomalyDetectorContainer c(two_output_model(), {}, ExtraConfig{{"offset", 0.5}});

    const Array x = column({2, -1});
    CHECK(c.predict(x) == Array::FromVector<float>({2}, {1, -1}));
    CHECK(c.decision_function(x) == Array::FromVector<float>({2}, {-2, 1}));
    CHECK(c.score_samples(x) == Array::FromVector<float>({2}, {-1.5f, 1.5f}));
}

TEST_CASE("make_container - from an ONNX artifact") {
    const ModelArtifact artifact = two_output_model();
    CHECK(backend_kind_of(artifact) == BackendKind::Portable);

    ExecutionResourceConfig cfg;
    cfg.batch_size = 1;
    AnyContainer any = make_container(TaskMode::Classifier, artifact, cfg);
    REQUIRE(std::holds_alternative<ClassifierContainer>(any));

    const auto& clf = std::get<ClassifierContainer>(any);
    CHECK(clf.predict_proba(column({1, 2, 3})) == column({-1, -2, -3}));
}
