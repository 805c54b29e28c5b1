// test_post_process.cpp
// Tests for sk_wrap::post
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/post_process.hpp"

#include <cstdint>
#include <vector>

using namespace sk_wrap;

TEST_CASE("post::regression - n x 1 predictions become a vector") {
    auto raw = Array::FromVector<float>({3, 1}, {1.5f, 2.5f, 3.5f});
    auto out = post::regression(raw);

    CHECK(out.shape() == std::vector<std::int64_t>{3});
    CHECK(out.values<float>() == raw.values<float>());
}

TEST_CASE("post::class_labels and post::probabilities - returned as produced") {
    auto labels = Array::FromVector<std::int64_t>({3}, {0, 2, 1});
    auto proba = Array::FromVector<float>({2, 2}, {0.9f, 0.1f, 0.3f, 0.7f});

    CHECK(post::class_labels(labels) == labels);
    CHECK(post::probabilities(proba) == proba);
    CHECK(post::transform(proba) == proba);
}

TEST_CASE("post::anomaly_labels - flattened") {
    auto raw = Array::FromVector<std::int64_t>({4, 1}, {1, -1, 1, 1});
    CHECK(post::anomaly_labels(raw).shape() == std::vector<std::int64_t>{4});
}

TEST_CASE("post::decision_scores - no shift without iforest_threshold") {
    auto raw = Array::FromVector<float>({2, 1}, {0.25f, -0.5f});
    auto out = post::decision_scores(raw, ExtraConfig{});

    CHECK(out == raw.flatten());
}

TEST_CASE("post::decision_scores - shift applied in the score dtype") {
    auto raw = Array::FromVector<float>({3}, {0.1f, 0.2f, -0.3f});
    auto out = post::decision_scores(raw, ExtraConfig{{"iforest_threshold", -0.1}});

    const float shift = static_cast<float>(-0.1);
    CHECK(out.values<float>() == std::vector<float>{0.1f + shift, 0.2f + shift, -0.3f + shift});
}

TEST_CASE("post::sample_scores - adds the offset") {
    auto decision = Array::FromVector<double>({2}, {0.0, -1.0});
    auto out = post::sample_scores(decision, 2.5);

    CHECK(out.values<double>() == std::vector<double>{2.5, 1.5});
}

TEST_CASE("post::sample_scores - float scores stay float") {
    auto decision = Array::FromVector<float>({2}, {0.5f, -0.5f});
    auto out = post::sample_scores(decision, 1.0);

    CHECK(out.dtype() == DType::Float32);
    CHECK(out.values<float>() == std::vector<float>{1.5f, 0.5f});
}

TEST_CASE("post - output positions") {
    CHECK(post::kLabels == 0u);
    CHECK(post::kProbabilities == 1u);
    CHECK(post::kScores == 1u);
}
