// sk_wrap/input_adapter.hpp
// Normalizes positional caller inputs into the form a backend consumes
//
// Steps, in order:
//   1. Portable backend only: fewer inputs than declared names means the
//      caller passed one pre-grouped collection; it is unwrapped one level.
//   2. A single Frame is split into one rows x 1 array per column.
//   3. Arrays become float32 native tensors; native tensors of the target
//      backend pass through; anything else is UnsupportedInputType.
//   4. Portable backend only: the count must equal the declared names, and
//      each input is keyed by the name at its position.
//
// No shape, rank or dtype validation happens here; the engine rejects
// malformed tensors. Device placement is owned by the engine session (see
// TensorFlowBackend and apply_resources), so converted tensors stay on host.

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "sk_wrap/array.hpp"
#include "sk_wrap/backend.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/frame.hpp"
#include "sk_wrap/input.hpp"
#include "sk_wrap/logging.hpp"
#include "sk_wrap/tensor.hpp"
#include "sk_wrap/detail/ort.hpp"

namespace sk_wrap {

class InputAdapter {
public:
    [[nodiscard]] static AdaptedInputs adapt(
        BackendKind kind,
        std::span<const std::string> declared_names,
        std::span<const Input> inputs)
    {
        if (kind == BackendKind::Portable) {
            inputs = unwrap_(declared_names, inputs);
        }

        std::vector<Array> frame_columns;
        const bool split = inputs.size() == 1 && inputs.front().is<Frame>();
        if (split) {
            frame_columns = inputs.front().get_if<Frame>()->split();
            logging::debug("split frame into {} column inputs", frame_columns.size());
        }
        const std::size_t count = split ? frame_columns.size() : inputs.size();

        if (kind == BackendKind::InProcess) {
            std::vector<Tensor> tensors;
            tensors.reserve(count);
            if (split) {
                for (const Array& col : frame_columns) tensors.push_back(Tensor::FromArray(col));
            } else {
                for (std::size_t i = 0; i < inputs.size(); ++i) {
                    tensors.push_back(to_tensor_(inputs[i], i));
                }
            }
            return AdaptedInputs(std::move(tensors));
        }

        if (count != declared_names.size()) {
            throw Error::InputArityMismatch(declared_names.size(), count, "InputAdapter::adapt");
        }

        NamedInputSet named;
        named.names.reserve(count);
        named.values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            named.add(declared_names[i], split
                ? detail::array_to_ort(frame_columns[i])
                : to_ort_(inputs[i], i));
        }
        return AdaptedInputs(std::move(named));
    }

private:
    [[nodiscard]] static std::span<const Input> unwrap_(
        std::span<const std::string> declared_names,
        std::span<const Input> inputs)
    {
        if (inputs.size() >= declared_names.size() || inputs.empty()) return inputs;

        const InputGroup* group = inputs.front().get_if<InputGroup>();
        if (!group) return inputs;

        logging::debug("unwrapped grouped input of {} items", group->items.size());
        return std::span<const Input>(group->items);
    }

    [[nodiscard]] static Tensor to_tensor_(const Input& input, std::size_t index) {
        if (const Array* a = input.get_if<Array>()) return Tensor::FromArray(*a);
        if (const Tensor* t = input.get_if<Tensor>()) return t->Clone();
        throw Error::UnsupportedInputType(index, input.type_name(), "InputAdapter::adapt");
    }

    [[nodiscard]] static Ort::Value to_ort_(const Input& input, std::size_t index) {
        if (const Array* a = input.get_if<Array>()) return detail::array_to_ort(*a);
        if (const Ort::Value* v = input.get_if<Ort::Value>()) return detail::ort_view(*v);
        throw Error::UnsupportedInputType(index, input.type_name(), "InputAdapter::adapt");
    }
};

} // namespace sk_wrap
