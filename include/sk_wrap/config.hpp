// sk_wrap/config.hpp
// Container configuration: execution resources and the opaque extra-config map

#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"

namespace sk_wrap {

/// Well-known ExtraConfig keys.
namespace keys {
    /// Score shift added by decision_function when present.
    inline constexpr std::string_view kIForestThreshold = "iforest_threshold";
    /// Score offset added by score_samples; required there.
    inline constexpr std::string_view kOffset = "offset";
    inline constexpr std::string_view kThreads = "n_threads";
    inline constexpr std::string_view kBatchSize = "batch_size";
    inline constexpr std::string_view kDevice = "device";
}

// ============================================================================
// ExtraConfig
// ============================================================================

using ConfigValue = std::variant<bool, std::int64_t, double, std::string>;

class ExtraConfig {
public:
    ExtraConfig() = default;
    ExtraConfig(std::initializer_list<std::pair<const std::string, ConfigValue>> init)
        : values_(init) {}

    ExtraConfig& set(std::string key, ConfigValue value) {
        values_.insert_or_assign(std::move(key), std::move(value));
        return *this;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        return values_.find(key) != values_.end();
    }

    [[nodiscard]] const ConfigValue* find(std::string_view key) const {
        const auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    /// Throws MissingConfigKey if absent.
    [[nodiscard]] const ConfigValue& at(std::string_view key) const {
        if (const ConfigValue* v = find(key)) return *v;
        throw Error::MissingConfigKey(key, "ExtraConfig::at");
    }

    /// Numeric value of `key` as double; integers are widened.
    [[nodiscard]] double number(std::string_view key) const {
        const ConfigValue& v = at(key);
        if (const auto* d = std::get_if<double>(&v)) return *d;
        if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
        throw Error::Wrapper(ErrorCode::InvalidArgument, "ExtraConfig::number",
            "value is not numeric", key);
    }

    [[nodiscard]] std::optional<double> number_if(std::string_view key) const {
        if (!contains(key)) return std::nullopt;
        return number(key);
    }

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return values_.begin(); }
    [[nodiscard]] auto end() const noexcept { return values_.end(); }

private:
    std::map<std::string, ConfigValue, std::less<>> values_;
};

// ============================================================================
// ExecutionResourceConfig
// ============================================================================

struct ExecutionResourceConfig {
    /// Intra-op threads; unset means the engine default (all cores).
    std::optional<int> thread_count{};
    /// Rows per scoring partition; unset means score all rows at once.
    std::optional<std::int64_t> batch_size{};
    /// Empty or "cpu" means the default device.
    std::string device{};

    [[nodiscard]] bool default_device() const noexcept {
        return device.empty() || device == "cpu" || device == "CPU";
    }

    /// GPU ordinal named by "cuda" (0) or "cuda:<N>"; nullopt for the default
    /// device. Any other device is BackendUnavailable, a malformed ordinal
    /// InvalidArgument.
    [[nodiscard]] std::optional<int> cuda_ordinal(std::string_view context) const {
        if (default_device()) return std::nullopt;

        const std::string_view d = device;
        if (!d.starts_with("cuda")) {
            throw Error::Wrapper(ErrorCode::BackendUnavailable, context,
                "unsupported device", device);
        }
        int ordinal = 0;
        if (d.size() > 4) {
            const char* first = d.data() + 5;
            const char* last = d.data() + d.size();
            const auto [ptr, ec] = std::from_chars(first, last, ordinal);
            if (d[4] != ':' || first == last || ec != std::errc{} || ptr != last || ordinal < 0) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, context,
                    "device must be \"cuda\" or \"cuda:<ordinal>\"", device);
            }
        }
        return ordinal;
    }

    /// Throws InvalidArgument for a thread count or batch size below 1.
    void validate() const {
        if (thread_count && *thread_count < 1) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "ExecutionResourceConfig",
                detail::format("thread_count must be >= 1, got {}", *thread_count),
                keys::kThreads);
        }
        if (batch_size && *batch_size < 1) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "ExecutionResourceConfig",
                detail::format("batch_size must be >= 1, got {}", *batch_size),
                keys::kBatchSize);
        }
    }

    /// Read n_threads, batch_size and device from `extra`; absent keys stay unset.
    [[nodiscard]] static ExecutionResourceConfig from_extra_config(const ExtraConfig& extra) {
        ExecutionResourceConfig cfg;
        if (const ConfigValue* v = extra.find(keys::kThreads)) {
            const std::int64_t n = integer_(*v, keys::kThreads);
            if (n > std::numeric_limits<int>::max() || n < std::numeric_limits<int>::min()) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "ExecutionResourceConfig",
                    detail::format("n_threads {} is out of range", n), keys::kThreads);
            }
            cfg.thread_count = static_cast<int>(n);
        }
        if (const ConfigValue* v = extra.find(keys::kBatchSize)) {
            cfg.batch_size = integer_(*v, keys::kBatchSize);
        }
        if (const ConfigValue* v = extra.find(keys::kDevice)) {
            const auto* s = std::get_if<std::string>(v);
            if (!s) {
                throw Error::Wrapper(ErrorCode::InvalidArgument, "ExecutionResourceConfig",
                    "device must be a string", keys::kDevice);
            }
            cfg.device = *s;
        }
        cfg.validate();
        return cfg;
    }

private:
    [[nodiscard]] static std::int64_t integer_(const ConfigValue& v, std::string_view key) {
        if (const auto* i = std::get_if<std::int64_t>(&v)) return *i;
        throw Error::Wrapper(ErrorCode::InvalidArgument, "ExecutionResourceConfig",
            "value must be an integer", key);
    }
};

} // namespace sk_wrap
