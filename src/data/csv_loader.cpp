#include "tabstream/data/csv_loader.hpp"
#include "tabstream/data/column.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace tabstream {

// ============================================================================
// CsvRecordReader
// ============================================================================

CsvRecordReader::CsvRecordReader(std::istream& in, char delimiter, char quote,
                                 bool skip_blank_lines)
    : in_(in)
    , delimiter_(delimiter)
    , quote_(quote)
    , skip_blank_lines_(skip_blank_lines)
{}

bool CsvRecordReader::next(std::vector<std::string>& fields) {
    fields.clear();

    while (true) {
        if (!std::getline(in_, line_)) {
            return false;
        }
        ++lines_read_;
        if (!line_.empty() && line_.back() == '\r') {
            line_.pop_back();
        }
        if (line_.empty() && skip_blank_lines_) {
            continue;
        }
        break;
    }
    record_line_ = lines_read_;

    std::string field;
    bool in_quotes = false;
    size_t i = 0;

    while (true) {
        for (; i < line_.size(); ++i) {
            const char c = line_[i];
            if (in_quotes) {
                if (c == quote_) {
                    if (i + 1 < line_.size() && line_[i + 1] == quote_) {
                        field += quote_;
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == quote_ && field.empty()) {
                in_quotes = true;
            } else if (c == delimiter_) {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field += c;
            }
        }

        if (!in_quotes) {
            break;
        }

        // Quoted field continues on the next physical line
        if (!std::getline(in_, line_)) {
            throw DecodeError("Unterminated quoted field", record_line_);
        }
        ++lines_read_;
        if (!line_.empty() && line_.back() == '\r') {
            line_.pop_back();
        }
        field += '\n';
        i = 0;
    }

    fields.push_back(std::move(field));
    return true;
}

// ============================================================================
// CsvChunkDecoder
// ============================================================================

CsvChunkDecoder::CsvChunkDecoder(std::istream& in, CsvOptions opts)
    : opts_(std::move(opts))
    , reader_(in, opts_.delimiter, opts_.quote, opts_.skip_blank_lines)
{
    CsvLoader::validate(opts_);
}

void CsvChunkDecoder::read_header() {
    header_done_ = true;
    std::vector<std::string> record;

    if (opts_.header_row != CsvOptions::kNoHeader) {
        bool found = true;
        for (int r = 0; r <= opts_.header_row; ++r) {
            if (!reader_.next(record)) {
                found = false;
                break;
            }
        }
        header_lines_ = reader_.lines_read();

        if (!opts_.names.empty()) {
            names_ = opts_.names;
            fixed_schema_ = true;
        } else if (found) {
            names_ = record;
        }
    } else if (!opts_.names.empty()) {
        names_ = opts_.names;
        fixed_schema_ = true;
    } else if (reader_.next(record)) {
        // No header: name columns after the width of the first record
        for (size_t i = 0; i < record.size(); ++i) {
            names_.push_back("column_" + std::to_string(i));
        }
        pending_line_ = reader_.record_line();
        pending_row_ = std::move(record);
    }

    std::set<std::string> seen;
    for (const auto& name : names_) {
        if (!seen.insert(name).second) {
            throw DecodeError("Duplicate column name in header: " + name, header_lines_);
        }
    }

    if (opts_.index_col && !names_.empty() && !seen.count(*opts_.index_col)) {
        throw ConfigurationError("Index column not found: " + *opts_.index_col);
    }
}

const std::vector<std::string>& CsvChunkDecoder::names() {
    if (!header_done_) {
        read_header();
    }
    return names_;
}

std::optional<DataFrame> CsvChunkDecoder::next_chunk(size_t max_rows) {
    if (!header_done_) {
        read_header();
    }

    std::vector<std::vector<std::string>> rows;
    auto accept = [&](std::vector<std::string>& record, size_t line) {
        if (record.size() != names_.size()) {
            const std::string message = "Expected " + std::to_string(names_.size()) +
                                        " fields, got " + std::to_string(record.size());
            if (fixed_schema_) {
                throw SchemaMismatchError(message + " (line " + std::to_string(line) + ")");
            }
            throw DecodeError(message, line);
        }
        rows.push_back(std::move(record));
    };

    if (pending_row_) {
        accept(*pending_row_, pending_line_);
        pending_row_.reset();
    }

    std::vector<std::string> record;
    while (max_rows == 0 || rows.size() < max_rows) {
        if (!reader_.next(record)) {
            break;
        }
        accept(record, reader_.record_line());
    }

    if (rows.empty()) {
        return std::nullopt;
    }

    DataFrame df = CsvLoader::build_frame(names_, rows, opts_);

    if (opts_.index_col) {
        auto index_column = df.take_column(*opts_.index_col);
        auto* labels = dynamic_cast<Int64Column*>(index_column.get());
        if (!labels || labels->type() != ColumnType::INT64) {
            throw DecodeError("Index column is not integral: " + *opts_.index_col,
                              reader_.record_line());
        }
        auto view = labels->view();
        df.set_index(std::vector<int64_t>(view.begin(), view.end()));
    } else {
        df.reset_index(static_cast<int64_t>(rows_decoded_));
    }

    rows_decoded_ += rows.size();
    return df;
}

DataFrame CsvChunkDecoder::empty_frame() {
    if (!header_done_) {
        read_header();
    }
    DataFrame df;
    for (const auto& name : names_) {
        if (opts_.index_col && name == *opts_.index_col) {
            continue;
        }
        df.add_column(name, std::make_shared<StringColumn>(
            name, std::vector<std::string>{}, ColumnType::STRING));
    }
    return df;
}

// ============================================================================
// CsvLoader - Public API
// ============================================================================

DataFrame CsvLoader::load(const std::string& path, const CsvOptions& opts) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open file: " + path);
    }

    CsvChunkDecoder decoder(file, opts);
    auto df = decoder.next_chunk(0);
    return df ? std::move(*df) : decoder.empty_frame();
}

DataFrame CsvLoader::decode(std::string_view text, const CsvOptions& opts) {
    std::istringstream stream{std::string(text)};
    CsvChunkDecoder decoder(stream, opts);
    auto df = decoder.next_chunk(0);
    return df ? std::move(*df) : decoder.empty_frame();
}

void CsvLoader::validate(const CsvOptions& opts) {
    if (opts.delimiter == opts.quote) {
        throw ConfigurationError("Delimiter and quote character must differ");
    }
    if (opts.delimiter == '\n' || opts.delimiter == '\r' ||
        opts.quote == '\n' || opts.quote == '\r') {
        throw ConfigurationError("Delimiter and quote character cannot be line breaks");
    }
    if (opts.header_row < CsvOptions::kNoHeader) {
        throw ConfigurationError("Invalid header row: " + std::to_string(opts.header_row));
    }
    if (opts.infer_schema_rows < 0) {
        throw ConfigurationError("infer_schema_rows must be >= 0");
    }
    std::set<std::string> seen;
    for (const auto& name : opts.names) {
        if (!seen.insert(name).second) {
            throw ConfigurationError("Duplicate name in column names: " + name);
        }
    }
    if (opts.index_col && opts.index_col->empty()) {
        throw ConfigurationError("Index column name is empty");
    }
}

DataFrame CsvLoader::build_frame(
    const std::vector<std::string>& names,
    const std::vector<std::vector<std::string>>& rows,
    const CsvOptions& opts
) {
    DataFrame df;

    const size_t sample_size = opts.infer_schema_rows == 0
        ? rows.size()
        : std::min(static_cast<size_t>(opts.infer_schema_rows), rows.size());

    for (size_t col_idx = 0; col_idx < names.size(); ++col_idx) {
        ColumnType type = ColumnType::STRING;
        if (opts.dtype) {
            type = *opts.dtype;
        } else if (opts.auto_detect_types) {
            type = detect_type(rows, col_idx, sample_size);
        }

        auto column = make_column(names[col_idx], rows, col_idx, type);
        if (!column && opts.dtype) {
            throw DecodeError("Column " + names[col_idx] + " does not fit type " +
                              column_type_to_string(type));
        }

        // Values past the inference sample may need a wider type
        while (!column) {
            type = type == ColumnType::INT64 ? ColumnType::FLOAT64 : ColumnType::STRING;
            column = make_column(names[col_idx], rows, col_idx, type);
        }

        df.add_column(names[col_idx], std::move(column));
    }

    return df;
}

bool CsvLoader::try_parse_double(std::string_view str, double& out) {
    if (str.empty()) {
        return false;
    }
    const char* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, out);
    return ec == std::errc() && ptr == end;
}

bool CsvLoader::try_parse_int64(std::string_view str, int64_t& out) {
    if (str.empty()) {
        return false;
    }
    const char* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, out);
    return ec == std::errc() && ptr == end;
}

// ============================================================================
// CsvLoader - Internal Methods
// ============================================================================

ColumnType CsvLoader::detect_type(
    const std::vector<std::vector<std::string>>& rows,
    size_t col_idx,
    size_t sample_size
) {
    if (rows.empty()) {
        return ColumnType::STRING;
    }

    bool all_int = true;
    bool all_float = true;
    bool any_empty = false;
    size_t seen = 0;

    for (size_t row_idx = 0; row_idx < sample_size; ++row_idx) {
        const auto& value = rows[row_idx][col_idx];

        if (value.empty()) {
            any_empty = true;
            continue;
        }
        ++seen;

        int64_t int_val;
        if (!try_parse_int64(value, int_val)) {
            all_int = false;
        }

        double float_val;
        if (!try_parse_double(value, float_val)) {
            all_float = false;
            break;
        }
    }

    // An all-missing sample is numeric with NaN
    if (seen == 0) {
        return ColumnType::FLOAT64;
    }
    if (all_int) {
        return any_empty ? ColumnType::FLOAT64 : ColumnType::INT64;
    }
    if (all_float) {
        return ColumnType::FLOAT64;
    }
    return ColumnType::STRING;
}

std::shared_ptr<IColumn> CsvLoader::make_column(
    const std::string& name,
    const std::vector<std::vector<std::string>>& rows,
    size_t col_idx,
    ColumnType type
) {
    switch (type) {
        case ColumnType::INT64: {
            std::vector<int64_t> values;
            values.reserve(rows.size());
            for (const auto& row : rows) {
                int64_t value;
                if (!try_parse_int64(row[col_idx], value)) {
                    return nullptr;
                }
                values.push_back(value);
            }
            return std::make_shared<Int64Column>(name, std::move(values), ColumnType::INT64);
        }
        case ColumnType::FLOAT64: {
            std::vector<double> values;
            values.reserve(rows.size());
            for (const auto& row : rows) {
                const auto& text = row[col_idx];
                double value = std::numeric_limits<double>::quiet_NaN();
                if (!text.empty() && !try_parse_double(text, value)) {
                    return nullptr;
                }
                values.push_back(value);
            }
            return std::make_shared<Float64Column>(name, std::move(values), ColumnType::FLOAT64);
        }
        case ColumnType::STRING:
        default: {
            std::vector<std::string> values;
            values.reserve(rows.size());
            for (const auto& row : rows) {
                values.push_back(row[col_idx]);
            }
            return std::make_shared<StringColumn>(name, std::move(values), ColumnType::STRING);
        }
    }
}

} // namespace tabstream
