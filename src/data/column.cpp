#include "tabstream/data/column.hpp"
#include <charconv>
#include <cmath>

namespace tabstream {

// Explicit template instantiations for common types
// This ensures the compiler generates these versions
template class TypedColumn<double>;
template class TypedColumn<int64_t>;
template class TypedColumn<std::string>;

// Helper function for type to string conversion
std::string column_type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::FLOAT64: return "Float64";
        case ColumnType::INT64: return "Int64";
        case ColumnType::STRING: return "String";
        default: return "Unknown";
    }
}

std::string format_double(double value) {
    if (std::isnan(value)) {
        return "";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        throw std::runtime_error("Failed to format double value");
    }
    std::string text(buf, end);

    // Keep integral doubles distinguishable from Int64 when re-read
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

ColumnType common_type(ColumnType a, ColumnType b) {
    if (a == b) {
        return a;
    }
    if (a == ColumnType::STRING || b == ColumnType::STRING) {
        return ColumnType::STRING;
    }
    return ColumnType::FLOAT64;
}

} // namespace tabstream
