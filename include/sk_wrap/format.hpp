// sk_wrap/format.hpp
// std::format shim used for diagnostics and log lines.
//
// - Uses std::format when the standard library ships it.
// - Otherwise substitutes "{}" placeholders left to right and appends any
//   surplus arguments after a " |" marker, so no diagnostic is ever lost.
//
// Only plain "{}" placeholders are used inside this library.

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(__cpp_lib_format) && (__cpp_lib_format >= 201907L)
    #include <format>
    #define SK_WRAP_HAS_STD_FORMAT 1
#else
    #define SK_WRAP_HAS_STD_FORMAT 0
#endif

namespace sk_wrap::detail {

#if SK_WRAP_HAS_STD_FORMAT

/// Format-string parameter type for functions that forward to format().
template<class... Args>
using format_string = std::format_string<Args...>;

template<class... Args>
[[nodiscard]] inline std::string format(std::format_string<Args...> fmt, Args&&... args)
{
    return std::format(fmt, std::forward<Args>(args)...);
}

#else

template<class...>
using format_string = std::string_view;

namespace format_impl {

template<class T>
[[nodiscard]] inline std::string stringify(const T& v)
{
    std::ostringstream os;
    os << v;
    return os.str();
}

[[nodiscard]] inline std::string stringify(const char* s)
{
    return s ? std::string(s) : std::string();
}

[[nodiscard]] inline std::string substitute(std::string_view fmt, const std::vector<std::string>& args)
{
    std::string out;
    out.reserve(fmt.size());

    std::size_t next = 0;
    for (std::size_t i = 0; i < fmt.size(); ++i) {
        const char c = fmt[i];
        const bool has_next = (i + 1) < fmt.size();

        if (c == '{' && has_next && fmt[i + 1] == '{') { out += '{'; ++i; continue; }
        if (c == '}' && has_next && fmt[i + 1] == '}') { out += '}'; ++i; continue; }

        if (c == '{' && has_next && fmt[i + 1] == '}') {
            out += next < args.size() ? args[next++] : std::string("{}");
            ++i;
            continue;
        }
        out += c;
    }

    if (next < args.size()) {
        out += " |";
        for (; next < args.size(); ++next) {
            out += ' ';
            out += args[next];
        }
    }
    return out;
}

} // namespace format_impl

template<class... Args>
[[nodiscard]] inline std::string format(std::string_view fmt, Args&&... args)
{
    std::vector<std::string> strs;
    strs.reserve(sizeof...(Args));
    (strs.push_back(format_impl::stringify(args)), ...);
    return format_impl::substitute(fmt, strs);
}

#endif

} // namespace sk_wrap::detail
