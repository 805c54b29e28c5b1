// compile_fail_decision_function_transformer.cpp
// This file should FAIL to compile.
// Tests that decision_function is only declared for anomaly detectors.
//
// Expected error: no matching member function / constraints not satisfied

#include "sk_wrap/container.hpp"

#include <memory>

int main() {
    sk_wrap::TransformerContainer c(std::unique_ptr<sk_wrap::Backend>{});
    auto x = sk_wrap::Array::FromVector<float>({1, 1}, {1.0f});

    auto out = c.decision_function(x);
    (void)out;
    return 0;
}
