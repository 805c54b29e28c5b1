// test_frame.cpp
// Tests for sk_wrap::Frame
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace sk_wrap;

namespace {

Frame three_by_ten() {
    std::vector<float> a(10), b(10), c(10);
    for (int i = 0; i < 10; ++i) {
        a[i] = static_cast<float>(i);
        b[i] = static_cast<float>(i * 10);
        c[i] = static_cast<float>(i * 100);
    }
    Frame f;
    f.add_column("a", Array::FromVector(a))
     .add_column("b", Array::FromVector(b))
     .add_column("c", Array::FromVector(c));
    return f;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Frame - empty frame") {
    Frame f;
    CHECK(f.num_columns() == 0);
    CHECK(f.rows() == 0);
}

TEST_CASE("Frame - columns keep insertion order") {
    const Frame f = three_by_ten();

    CHECK(f.num_columns() == 3);
    CHECK(f.rows() == 10);
    CHECK(f.column_names() == std::vector<std::string>{"a", "b", "c"});
    CHECK(f.column("b").values<float>()[3] == 30.0f);
}

TEST_CASE("Frame - rejects unequal lengths") {
    Frame f;
    f.add_column("x", Array::FromVector<float>({3}, {1, 2, 3}));
    CHECK_THROWS_AS(f.add_column("y", Array::FromVector<float>({2}, {1, 2})), Error);
}

TEST_CASE("Frame - rejects duplicate names and non-vector columns") {
    Frame f;
    f.add_column("x", Array::FromVector<float>({2}, {1, 2}));

    CHECK_THROWS_AS(f.add_column("x", Array::FromVector<float>({2}, {3, 4})), Error);
    CHECK_THROWS_AS(f.add_column("m", Array::FromVector<float>({2, 1}, {3, 4})), Error);
    CHECK(f.num_columns() == 1);
}

TEST_CASE("Frame - unknown column lookup throws") {
    const Frame f = three_by_ten();
    CHECK_THROWS_AS((void)f.column("z"), Error);
}

// ============================================================================
// Split and slice
// ============================================================================

TEST_CASE("Frame::split - one rows x 1 array per column") {
    const Frame f = three_by_ten();
    const std::vector<Array> cols = f.split();

    REQUIRE(cols.size() == 3);
    for (const Array& col : cols) {
        CHECK(col.shape() == std::vector<std::int64_t>{10, 1});
    }
    CHECK(cols[2].values<float>()[9] == 900.0f);
}

TEST_CASE("Frame::split - keeps column dtype") {
    Frame f;
    f.add_column("ids", Array::FromVector(std::vector<std::int64_t>{4, 5}));

    const auto cols = f.split();
    CHECK(cols[0].dtype() == DType::Int64);
}

TEST_CASE("Frame::slice_rows - slices every column") {
    const Frame f = three_by_ten();
    const Frame s = f.slice_rows(8, 10);

    CHECK(s.rows() == 2);
    CHECK(s.column_names() == f.column_names());
    CHECK(s.column("a").values<float>() == std::vector<float>{8.0f, 9.0f});
}
