#pragma once

#include "tabstream/data/dataframe.hpp"
#include <ostream>
#include <string>

namespace tabstream {

/// CSV writing options
struct CsvWriteOptions {
    char delimiter = ',';                 ///< Field delimiter
    char quote = '"';                     ///< Quote character
    bool header = true;                   ///< Emit the header line
    bool write_index = false;             ///< Emit row labels as the first field
    std::string line_terminator = "\n";   ///< Appended to every line
};

/// CSV Writer - DataFrame to delimited text
class CsvWriter {
public:
    CsvWriter() = delete;  // Static class, no instances

    /// Write df to out; the header line is emitted only if include_header
    static void write(const DataFrame& df, std::ostream& out,
                      const CsvWriteOptions& opts, bool include_header);

    /// Same as write() into a string
    static std::string render(const DataFrame& df, const CsvWriteOptions& opts,
                              bool include_header);

    /// Quote a field when it holds the delimiter, the quote or a line break
    static std::string escape_field(const std::string& field, const CsvWriteOptions& opts);
};

} // namespace tabstream
