// sk_wrap/frame.hpp
// Tabular input: named one-dimensional columns of equal length, in insertion order

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sk_wrap/array.hpp"
#include "sk_wrap/error.hpp"
#include "sk_wrap/format.hpp"

namespace sk_wrap {

class Frame {
public:
    struct Column {
        std::string name;
        Array values;
    };

    Frame() = default;

    /// Append a column. Throws InvalidArgument if the column is not
    /// one-dimensional, its length differs from the existing columns, or
    /// the name is already used.
    Frame& add_column(std::string name, Array values) {
        if (values.rank() != 1) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Frame::add_column",
                detail::format("column must be one-dimensional, got rank {}", values.rank()), name);
        }
        if (!columns_.empty() && values.rows() != rows()) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Frame::add_column",
                detail::format("column has {} rows, frame has {}", values.rows(), rows()), name);
        }
        if (find_(name) != nullptr) {
            throw Error::Wrapper(ErrorCode::InvalidArgument, "Frame::add_column",
                "duplicate column name", name);
        }
        columns_.push_back(Column{std::move(name), std::move(values)});
        return *this;
    }

    [[nodiscard]] std::size_t num_columns() const noexcept { return columns_.size(); }
    [[nodiscard]] std::int64_t rows() const noexcept {
        return columns_.empty() ? 0 : columns_.front().values.rows();
    }

    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }

    [[nodiscard]] std::vector<std::string> column_names() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto& c : columns_) names.push_back(c.name);
        return names;
    }

    [[nodiscard]] const Array& column(std::string_view name) const {
        if (const Column* c = find_(name)) return c->values;
        throw Error::Wrapper(ErrorCode::InvalidArgument, "Frame::column", "no such column", name);
    }

    /// One `rows x 1` array per column, in column order.
    [[nodiscard]] std::vector<Array> split() const {
        std::vector<Array> out;
        out.reserve(columns_.size());
        for (const auto& c : columns_) {
            out.push_back(c.values.reshape({-1, 1}));
        }
        return out;
    }

    [[nodiscard]] Frame slice_rows(std::int64_t begin, std::int64_t end) const {
        Frame f;
        f.columns_.reserve(columns_.size());
        for (const auto& c : columns_) {
            f.columns_.push_back(Column{c.name, c.values.slice_rows(begin, end)});
        }
        return f;
    }

private:
    std::vector<Column> columns_;

    [[nodiscard]] const Column* find_(std::string_view name) const noexcept {
        for (const auto& c : columns_) {
            if (c.name == name) return &c;
        }
        return nullptr;
    }
};

} // namespace sk_wrap
