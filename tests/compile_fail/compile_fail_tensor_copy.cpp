// compile_fail_tensor_copy.cpp
// This file should FAIL to compile.
// Tests that Tensor is non-copyable (deleted copy constructor).
//
// Expected error: use of deleted function / copy constructor is deleted

#include "sk_wrap/tensor.hpp"

int main() {
    auto t1 = sk_wrap::Tensor::FromVector<float>({1}, {1.0f});

    // Tensor is move-only - this should fail to compile
    sk_wrap::Tensor t2 = t1;
    (void)t2;
    return 0;
}
