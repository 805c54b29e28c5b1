// test_task_mode.cpp
// Tests for sk_wrap::TaskMode helpers
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/task_mode.hpp"

#include <string>

using namespace sk_wrap;

TEST_CASE("task_mode_name - every mode") {
    CHECK(std::string(task_mode_name(TaskMode::Transformer)) == "Transformer");
    CHECK(std::string(task_mode_name(TaskMode::Regressor)) == "Regressor");
    CHECK(std::string(task_mode_name(TaskMode::Classifier)) == "Classifier");
    CHECK(std::string(task_mode_name(TaskMode::AnomalyDetector)) == "AnomalyDetector");
}

TEST_CASE("required_outputs - labels plus a second output where the mode has one") {
    static_assert(required_outputs(TaskMode::Transformer) == 1);
    static_assert(required_outputs(TaskMode::Regressor) == 1);
    static_assert(required_outputs(TaskMode::Classifier) == 2);
    static_assert(required_outputs(TaskMode::AnomalyDetector) == 2);
    CHECK(true);
}

TEST_CASE("check_output_count - matching count passes") {
    CHECK_NOTHROW(check_output_count(TaskMode::Classifier, 2));
    CHECK_NOTHROW(check_output_count(TaskMode::Transformer, 1));
}

TEST_CASE("check_output_count - classifier with a single output is rejected") {
    try {
        check_output_count(TaskMode::Classifier, 1);
        FAIL("expected an exception");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::InvalidConstruction);
        CHECK(e.subject() == "Classifier");
    }
}

TEST_CASE("check_output_count - anomaly detector needs scores") {
    CHECK_THROWS_AS(check_output_count(TaskMode::AnomalyDetector, 1), Error);
    CHECK_THROWS_AS(check_output_count(TaskMode::Regressor, 2), Error);
}

TEST_CASE("task_mode_from_flags - flag combinations") {
    CHECK(task_mode_from_flags(false, false) == TaskMode::Classifier);
    CHECK(task_mode_from_flags(true, false) == TaskMode::Regressor);
    CHECK(task_mode_from_flags(false, true) == TaskMode::AnomalyDetector);
    CHECK_THROWS_AS((void)task_mode_from_flags(true, true), Error);
}
