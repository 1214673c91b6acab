#include "tabstream/data/csv_writer.hpp"
#include <sstream>
#include <vector>

namespace tabstream {

void CsvWriter::write(const DataFrame& df, std::ostream& out,
                      const CsvWriteOptions& opts, bool include_header) {
    const auto& names = df.column_names();

    if (include_header) {
        bool first = true;
        if (opts.write_index) {
            first = false;  // unnamed index: empty header cell
        }
        for (const auto& name : names) {
            if (!first) {
                out << opts.delimiter;
            }
            out << escape_field(name, opts);
            first = false;
        }
        out << opts.line_terminator;
    }

    std::vector<const IColumn*> columns;
    columns.reserve(names.size());
    for (const auto& name : names) {
        columns.push_back(&df.column(name));
    }

    for (size_t row = 0; row < df.row_count(); ++row) {
        bool first = true;
        if (opts.write_index) {
            out << df.index_at(row);
            first = false;
        }
        for (const auto* column : columns) {
            if (!first) {
                out << opts.delimiter;
            }
            const std::string field = column->format(row);
            if (field.empty() && columns.size() == 1 && !opts.write_index) {
                // A lone empty field would read back as a blank line
                out << opts.quote << opts.quote;
            } else {
                out << escape_field(field, opts);
            }
            first = false;
        }
        out << opts.line_terminator;
    }
}

std::string CsvWriter::render(const DataFrame& df, const CsvWriteOptions& opts,
                              bool include_header) {
    std::ostringstream out;
    write(df, out, opts, include_header);
    return out.str();
}

std::string CsvWriter::escape_field(const std::string& field, const CsvWriteOptions& opts) {
    const bool needs_quotes =
        field.find(opts.delimiter) != std::string::npos ||
        field.find(opts.quote) != std::string::npos ||
        field.find_first_of("\r\n") != std::string::npos;
    if (!needs_quotes) {
        return field;
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted += opts.quote;
    for (char c : field) {
        if (c == opts.quote) {
            quoted += opts.quote;
        }
        quoted += c;
    }
    quoted += opts.quote;
    return quoted;
}

} // namespace tabstream
