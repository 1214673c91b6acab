#include "tabstream/data/arrow_utils.hpp"
#include <cmath>
#include <limits>
#include <vector>

namespace tabstream {
namespace arrow_utils {

arrow::Result<std::shared_ptr<arrow::Array>> column_to_arrow(const IColumn& column) {
    std::shared_ptr<arrow::Array> array;

    switch (column.type()) {
        case ColumnType::INT64: {
            const auto& typed = dynamic_cast<const Int64Column&>(column);
            arrow::Int64Builder builder;
            ARROW_RETURN_NOT_OK(builder.AppendValues(typed.data_ptr(),
                                                     static_cast<int64_t>(typed.size())));
            ARROW_RETURN_NOT_OK(builder.Finish(&array));
            break;
        }
        case ColumnType::FLOAT64: {
            const auto& typed = dynamic_cast<const Float64Column&>(column);
            arrow::DoubleBuilder builder;
            ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(typed.size())));
            for (double value : typed.view()) {
                if (std::isnan(value)) {
                    builder.UnsafeAppendNull();
                } else {
                    builder.UnsafeAppend(value);
                }
            }
            ARROW_RETURN_NOT_OK(builder.Finish(&array));
            break;
        }
        case ColumnType::STRING: {
            const auto& typed = dynamic_cast<const StringColumn&>(column);
            arrow::StringBuilder builder;
            ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(typed.size())));
            for (const auto& value : typed.view()) {
                ARROW_RETURN_NOT_OK(builder.Append(value));
            }
            ARROW_RETURN_NOT_OK(builder.Finish(&array));
            break;
        }
        default:
            return arrow::Status::NotImplemented("Unsupported column type: ",
                                                 column_type_to_string(column.type()));
    }

    return array;
}

arrow::Result<std::shared_ptr<arrow::Table>> to_arrow_table(
    const DataFrame& df,
    const ArrowConvertOptions& opts
) {
    arrow::FieldVector fields;
    arrow::ArrayVector arrays;

    for (const auto& name : df.column_names()) {
        ARROW_ASSIGN_OR_RAISE(auto array, column_to_arrow(df.column(name)));
        fields.push_back(arrow::field(name, array->type()));
        arrays.push_back(std::move(array));
    }

    if (opts.include_index) {
        const auto labels = df.index();
        arrow::Int64Builder builder;
        ARROW_RETURN_NOT_OK(builder.AppendValues(labels));
        std::shared_ptr<arrow::Array> array;
        ARROW_RETURN_NOT_OK(builder.Finish(&array));
        fields.push_back(arrow::field(opts.index_name, arrow::int64()));
        arrays.push_back(std::move(array));
    }

    return arrow::Table::Make(arrow::schema(fields), arrays,
                              static_cast<int64_t>(df.row_count()));
}

DataFrame from_arrow_table(const arrow::Table& table, const ArrowConvertOptions& opts) {
    DataFrame df;
    std::vector<int64_t> labels;
    bool has_index = false;

    for (int c = 0; c < table.num_columns(); ++c) {
        const auto& field = table.schema()->field(c);
        const auto& chunked = table.column(c);
        const std::string name = field->name();

        switch (field->type()->id()) {
            case arrow::Type::INT64: {
                std::vector<int64_t> values;
                std::vector<double> widened;
                bool has_nulls = chunked->null_count() > 0;
                for (const auto& chunk : chunked->chunks()) {
                    auto typed = std::static_pointer_cast<arrow::Int64Array>(chunk);
                    for (int64_t i = 0; i < typed->length(); ++i) {
                        if (has_nulls) {
                            widened.push_back(typed->IsNull(i)
                                ? std::numeric_limits<double>::quiet_NaN()
                                : static_cast<double>(typed->Value(i)));
                        } else {
                            values.push_back(typed->Value(i));
                        }
                    }
                }
                if (opts.include_index && name == opts.index_name && !has_nulls) {
                    labels = std::move(values);
                    has_index = true;
                } else if (has_nulls) {
                    df.add_column(name, std::make_shared<Float64Column>(
                        name, std::move(widened), ColumnType::FLOAT64));
                } else {
                    df.add_column(name, std::make_shared<Int64Column>(
                        name, std::move(values), ColumnType::INT64));
                }
                break;
            }
            case arrow::Type::DOUBLE: {
                std::vector<double> values;
                for (const auto& chunk : chunked->chunks()) {
                    auto typed = std::static_pointer_cast<arrow::DoubleArray>(chunk);
                    for (int64_t i = 0; i < typed->length(); ++i) {
                        values.push_back(typed->IsNull(i)
                            ? std::numeric_limits<double>::quiet_NaN()
                            : typed->Value(i));
                    }
                }
                df.add_column(name, std::make_shared<Float64Column>(
                    name, std::move(values), ColumnType::FLOAT64));
                break;
            }
            case arrow::Type::STRING: {
                std::vector<std::string> values;
                for (const auto& chunk : chunked->chunks()) {
                    auto typed = std::static_pointer_cast<arrow::StringArray>(chunk);
                    for (int64_t i = 0; i < typed->length(); ++i) {
                        values.push_back(typed->IsNull(i) ? std::string() : typed->GetString(i));
                    }
                }
                df.add_column(name, std::make_shared<StringColumn>(
                    name, std::move(values), ColumnType::STRING));
                break;
            }
            default:
                throw SchemaMismatchError("Unsupported Arrow type for column " + name + ": " +
                                          field->type()->ToString());
        }
    }

    if (has_index) {
        df.set_index(std::move(labels));
    }
    return df;
}

}  // namespace arrow_utils
}  // namespace tabstream
