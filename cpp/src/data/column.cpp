#include "effluent/data/column.hpp"

namespace effluent {

// Explicit template instantiations for the column types the engine stores
template class TypedColumn<double>;
template class TypedColumn<uint8_t>;
template class TypedColumn<std::string>;

std::string column_type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::FLOAT64: return "Float64";
        case ColumnType::BOOL: return "Bool";
        case ColumnType::STRING: return "String";
        default: return "Unknown";
    }
}

std::shared_ptr<Float64Column> make_float64_column(std::string name, std::vector<double> values) {
    return std::make_shared<Float64Column>(std::move(name), std::move(values), ColumnType::FLOAT64);
}

std::shared_ptr<BoolColumn> make_bool_column(std::string name, std::vector<uint8_t> values) {
    return std::make_shared<BoolColumn>(std::move(name), std::move(values), ColumnType::BOOL);
}

std::shared_ptr<StringColumn> make_string_column(std::string name, std::vector<std::string> values) {
    return std::make_shared<StringColumn>(std::move(name), std::move(values), ColumnType::STRING);
}

} // namespace effluent
