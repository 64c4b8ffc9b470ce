#pragma once

#include "effluent/data/column.hpp"
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace effluent {

// Forward declarations
struct CsvOptions;

/// Column-oriented table
///
/// Columns are immutable and held by shared_ptr, so clone() is cheap and
/// never aliases mutable state: each pipeline stage clones its input and
/// appends the columns it derives.
class DataFrame {
private:
    /// Column storage (name -> column)
    std::unordered_map<std::string, std::shared_ptr<const IColumn>> columns_;

    /// Row count
    size_t row_count_ = 0;

    /// Column names (preserves insertion order)
    std::vector<std::string> column_names_;

public:
    /// Default constructor (empty DataFrame)
    DataFrame() = default;

    /// No implicit copy, use clone()
    DataFrame(const DataFrame&) = delete;
    DataFrame& operator=(const DataFrame&) = delete;

    /// Move semantics
    DataFrame(DataFrame&&) = default;
    DataFrame& operator=(DataFrame&&) = default;

    // ===== FACTORY METHODS =====

    /// Load CSV file
    static DataFrame load_csv(const std::string& path, const CsvOptions& opts);

    /// New table sharing every column of this one
    DataFrame clone() const;

    // ===== COLUMN ACCESS =====

    /// Get column as typed span (zero-copy, const)
    template<typename T>
    std::span<const T> get_column(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw std::runtime_error("Column not found: " + name);
        }

        auto* typed_col = dynamic_cast<const TypedColumn<T>*>(it->second.get());
        if (!typed_col) {
            throw std::runtime_error("Type mismatch for column: " + name);
        }

        return typed_col->view();
    }

    /// Float64 column view
    std::span<const double> get_f64(const std::string& name) const {
        return get_column<double>(name);
    }

    /// Bool column view (0/1 bytes)
    std::span<const uint8_t> get_bool(const std::string& name) const {
        return get_column<uint8_t>(name);
    }

    /// String column view
    std::span<const std::string> get_string(const std::string& name) const {
        return get_column<std::string>(name);
    }

    /// Get column pointer for Python bindings (Float64 only)
    const double* get_column_ptr_f64(const std::string& name) const;

    /// Check if column exists
    bool has_column(const std::string& name) const {
        return columns_.find(name) != columns_.end();
    }

    // ===== METADATA =====

    /// Get number of rows
    size_t row_count() const { return row_count_; }

    /// Get number of columns
    size_t column_count() const { return columns_.size(); }

    /// Get column names (insertion order)
    const std::vector<std::string>& column_names() const { return column_names_; }

    /// Get column type
    ColumnType column_type(const std::string& name) const;

    // ===== BUILDERS =====

    /// Add column; throws on duplicate name or row count mismatch
    void add_column(std::string name, std::shared_ptr<const IColumn> column);

    void add_f64(std::string name, std::vector<double> values);
    void add_bool(std::string name, std::vector<uint8_t> values);
    void add_string(std::string name, std::vector<std::string> values);
};

/// CSV loading options
struct CsvOptions {
    char delimiter = ',';           ///< Field delimiter
    bool has_header = true;         ///< First row is header
    int skip_rows = 0;              ///< Rows to skip before header

    bool auto_detect_types = true;  ///< Auto-detect numeric vs string columns
    int infer_schema_rows = 1000;   ///< Rows to scan for type inference
};

} // namespace effluent
