// sk_wrap/tensor_name.hpp
// Parsing of graph endpoint names ("op" or "op:index").
//
// - Surrounding ASCII whitespace is ignored.
// - A trailing ":<digits>" selects the output index; any other ':' belongs
//   to the operation name.
// - A bare operation name means output 0.

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"

namespace sk_wrap::detail {

struct EndpointName {
    std::string op;
    int index{0};
    bool had_explicit_index{false};
};

/// Throws Error (InvalidArgument) on malformed names.
[[nodiscard]] inline EndpointName parse_endpoint_name(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);

    if (s.empty()) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "parse_endpoint_name", "empty endpoint name");
    }

    EndpointName result;
    const auto colon = s.rfind(':');

    if (colon == std::string_view::npos) {
        result.op = std::string(s);
        return result;
    }
    if (colon == 0) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "parse_endpoint_name",
            "empty operation name", s);
    }
    if (colon == s.size() - 1) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "parse_endpoint_name",
            "missing index after colon", s);
    }

    const std::string_view suffix = s.substr(colon + 1);
    const bool all_digits = std::all_of(suffix.begin(), suffix.end(),
        [](unsigned char c) { return std::isdigit(c); });

    if (!all_digits) {
        // "scope/op:name" style: the colon is part of the op name
        result.op = std::string(s);
        return result;
    }

    int idx = 0;
    const auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), idx);
    if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
        throw Error::Wrapper(ErrorCode::InvalidArgument, "parse_endpoint_name",
            detail::format("invalid output index '{}'", suffix), s);
    }

    result.op = std::string(s.substr(0, colon));
    result.index = idx;
    result.had_explicit_index = true;
    return result;
}

} // namespace sk_wrap::detail
