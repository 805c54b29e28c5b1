// compile_fail_array_bool.cpp
// This file should FAIL to compile.
// Tests that Array rejects element types outside float32/float64/int32/int64.
//
// Expected error: constraints not satisfied for ArrayScalar

#include "sk_wrap/array.hpp"

#include <vector>

int main() {
    auto a = sk_wrap::Array::FromVector<bool>(std::vector<bool>{true, false});
    (void)a;
    return 0;
}
