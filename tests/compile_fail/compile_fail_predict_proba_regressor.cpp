// compile_fail_predict_proba_regressor.cpp
// This file should FAIL to compile.
// Tests that predict_proba is not declared for regressors.
//
// Expected error: no matching member function / constraints not satisfied

#include "sk_wrap/container.hpp"

#include <memory>

int main() {
    sk_wrap::RegressorContainer c(std::unique_ptr<sk_wrap::Backend>{});
    auto x = sk_wrap::Array::FromVector<float>({1, 1}, {1.0f});

    auto out = c.predict_proba(x);
    (void)out;
    return 0;
}
