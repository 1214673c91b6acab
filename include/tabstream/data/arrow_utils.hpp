/**
 * Arrow Utilities - DataFrame <-> Arrow table conversion
 *
 * Used by the Parquet sink to hand the accumulated DataFrame to the
 * columnar writer, and by readers of the written files.
 */

#pragma once

#include "tabstream/data/dataframe.hpp"
#include <memory>
#include <string>

#include <arrow/api.h>

namespace tabstream {
namespace arrow_utils {

/// Conversion options
struct ArrowConvertOptions {
    bool include_index = false;                   ///< Store row labels as an extra column
    std::string index_name = "__index_level_0__"; ///< Name of that column
};

/**
 * Convert one column to an Arrow array (copy)
 *
 * Int64 -> int64, Float64 -> float64 (NaN becomes null), String -> utf8
 */
arrow::Result<std::shared_ptr<arrow::Array>> column_to_arrow(const IColumn& column);

/**
 * Convert a DataFrame to an Arrow table, preserving column order
 */
arrow::Result<std::shared_ptr<arrow::Table>> to_arrow_table(
    const DataFrame& df,
    const ArrowConvertOptions& opts = {}
);

/**
 * Convert an Arrow table back to a DataFrame
 *
 * int64 -> Int64 (a column with nulls becomes Float64), float64 -> Float64,
 * utf8 -> String. A column named opts.index_name becomes the row index.
 * Throws SchemaMismatchError for unsupported Arrow types.
 */
DataFrame from_arrow_table(
    const arrow::Table& table,
    const ArrowConvertOptions& opts = {}
);

}  // namespace arrow_utils
}  // namespace tabstream
