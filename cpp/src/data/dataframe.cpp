#include "effluent/data/dataframe.hpp"
#include "effluent/data/csv_loader.hpp"
#include <stdexcept>

namespace effluent {

// ===== Column Access =====

const double* DataFrame::get_column_ptr_f64(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw std::runtime_error("Column not found: " + name);
    }

    auto* typed_col = dynamic_cast<const Float64Column*>(it->second.get());
    if (!typed_col) {
        throw std::runtime_error("Column is not Float64: " + name);
    }

    return typed_col->data_ptr();
}

ColumnType DataFrame::column_type(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw std::runtime_error("Column not found: " + name);
    }
    return it->second->type();
}

// ===== Builders =====

void DataFrame::add_column(std::string name, std::shared_ptr<const IColumn> column) {
    if (!column) {
        throw std::runtime_error("Null column: " + name);
    }
    if (has_column(name)) {
        throw std::runtime_error("Duplicate column: " + name);
    }

    // Validate row count consistency
    if (!column_names_.empty() && column->size() != row_count_) {
        throw std::runtime_error("Column size mismatch: " + name);
    }

    if (column_names_.empty()) {
        row_count_ = column->size();
    }

    column_names_.push_back(name);
    columns_.emplace(std::move(name), std::move(column));
}

void DataFrame::add_f64(std::string name, std::vector<double> values) {
    auto column = make_float64_column(name, std::move(values));
    add_column(std::move(name), std::move(column));
}

void DataFrame::add_bool(std::string name, std::vector<uint8_t> values) {
    auto column = make_bool_column(name, std::move(values));
    add_column(std::move(name), std::move(column));
}

void DataFrame::add_string(std::string name, std::vector<std::string> values) {
    auto column = make_string_column(name, std::move(values));
    add_column(std::move(name), std::move(column));
}

// ===== Factory Methods =====

DataFrame DataFrame::load_csv(const std::string& path, const CsvOptions& opts) {
    return CsvLoader::load(path, opts);
}

DataFrame DataFrame::clone() const {
    DataFrame copy;
    copy.columns_ = columns_;
    copy.column_names_ = column_names_;
    copy.row_count_ = row_count_;
    return copy;
}

} // namespace effluent
