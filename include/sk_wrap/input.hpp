// sk_wrap/input.hpp
// One positional caller input
//
// An Input holds exactly one of: a host Array, a tabular Frame, an
// in-process native Tensor, a portable native Ort::Value, or an InputGroup
// (a pre-grouped collection of inputs passed as one positional argument).

#pragma once

#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "sk_wrap/array.hpp"
#include "sk_wrap/frame.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/detail/ort.hpp"

namespace sk_wrap {

struct InputGroup;

class Input {
public:
    using Value = std::variant<Array, Frame, Tensor, Ort::Value, std::shared_ptr<const InputGroup>>;

    Input(Array a) : value_(std::move(a)) {}
    Input(Frame f) : value_(std::move(f)) {}
    Input(Tensor t) : value_(std::move(t)) {}
    Input(Ort::Value v) : value_(std::move(v)) {}
    Input(InputGroup g);

    template<class T>
    [[nodiscard]] bool is() const noexcept {
        if constexpr (std::is_same_v<T, InputGroup>) {
            return std::holds_alternative<std::shared_ptr<const InputGroup>>(value_);
        } else {
            return std::holds_alternative<T>(value_);
        }
    }

    template<class T>
    [[nodiscard]] const T* get_if() const noexcept {
        if constexpr (std::is_same_v<T, InputGroup>) {
            const auto* g = std::get_if<std::shared_ptr<const InputGroup>>(&value_);
            return g ? g->get() : nullptr;
        } else {
            return std::get_if<T>(&value_);
        }
    }

    /// Name of the held kind, used in diagnostics.
    [[nodiscard]] const char* type_name() const noexcept {
        switch (value_.index()) {
            case 0: return "Array";
            case 1: return "Frame";
            case 2: return "Tensor";
            case 3: return "Ort::Value";
            case 4: return "InputGroup";
        }
        return "unknown";
    }

    [[nodiscard]] const Value& value() const noexcept { return value_; }

private:
    Value value_;
};

struct InputGroup {
    std::vector<Input> items;
};

inline Input::Input(InputGroup g)
    : value_(std::make_shared<const InputGroup>(std::move(g))) {}

/// Build a positional input list from move-only values.
template<class... Args>
[[nodiscard]] std::vector<Input> make_inputs(Args&&... args) {
    std::vector<Input> inputs;
    inputs.reserve(sizeof...(Args));
    (inputs.emplace_back(std::forward<Args>(args)), ...);
    return inputs;
}

template<class... Args>
[[nodiscard]] InputGroup make_group(Args&&... args) {
    return InputGroup{make_inputs(std::forward<Args>(args)...)};
}

} // namespace sk_wrap
