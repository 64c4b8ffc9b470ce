#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace effluent {

/// Column data types
enum class ColumnType {
    FLOAT64,    ///< 64-bit floating point (all measurements and scores)
    BOOL,       ///< Flag column, stored as uint8_t (0/1)
    STRING      ///< Labels (fail_type, fail_source) and non-numeric CSV fields
};

/// "Float64", "Bool", "String"
std::string column_type_to_string(ColumnType type);

/// Abstract column interface
class IColumn {
public:
    virtual ~IColumn() = default;

    /// Get column type
    virtual ColumnType type() const = 0;

    /// Get number of elements
    virtual size_t size() const = 0;

    /// Get column name
    virtual std::string name() const = 0;
};

/// Typed column implementation
/// Stores data in contiguous memory; immutable once constructed so that
/// several tables can share it.
template<typename T>
class TypedColumn : public IColumn {
private:
    std::string name_;
    std::vector<T> data_;
    ColumnType type_;

public:
    TypedColumn(std::string name, std::vector<T> data, ColumnType type)
        : name_(std::move(name))
        , data_(std::move(data))
        , type_(type)
    {}

    /// Get read-only view of data (zero-copy)
    std::span<const T> view() const {
        return std::span<const T>(data_.data(), data_.size());
    }

    /// Get raw pointer (for Python bindings)
    const T* data_ptr() const { return data_.data(); }

    /// IColumn interface implementation
    ColumnType type() const override { return type_; }
    size_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }
};

/// Type aliases for common columns
using Float64Column = TypedColumn<double>;
using BoolColumn = TypedColumn<uint8_t>;
using StringColumn = TypedColumn<std::string>;

/// Column factories
std::shared_ptr<Float64Column> make_float64_column(std::string name, std::vector<double> values);
std::shared_ptr<BoolColumn> make_bool_column(std::string name, std::vector<uint8_t> values);
std::shared_ptr<StringColumn> make_string_column(std::string name, std::vector<std::string> values);

} // namespace effluent
