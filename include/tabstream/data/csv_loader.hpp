#pragma once

#include "tabstream/data/dataframe.hpp"
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabstream {

/// CSV reading options
struct CsvOptions {
    static constexpr int kNoHeader = -1;

    char delimiter = ',';           ///< Field delimiter
    char quote = '"';               ///< Quote character
    int header_row = 0;             ///< Record holding the header; earlier records are skipped
    std::vector<std::string> names; ///< Fixed column names (replace the header line if any)
    std::optional<std::string> index_col; ///< Column used as row index
    bool skip_blank_lines = true;   ///< Ignore empty physical lines

    // Typing
    std::optional<ColumnType> dtype; ///< Force one type for every column
    bool auto_detect_types = true;  ///< Auto-detect column types (else String)
    int infer_schema_rows = 1000;   ///< Rows to scan for type inference (0 = whole chunk)
};

/// Pulls delimited records from a stream, one logical record at a time.
/// Quoted fields may span physical lines.
class CsvRecordReader {
public:
    CsvRecordReader(std::istream& in, char delimiter, char quote, bool skip_blank_lines = true);

    /// Read the next record into fields; false at end of input.
    /// Throws DecodeError on an unterminated quote.
    bool next(std::vector<std::string>& fields);

    /// Physical lines consumed so far
    size_t lines_read() const { return lines_read_; }

    /// 1-based physical line on which the last record started
    size_t record_line() const { return record_line_; }

private:
    std::istream& in_;
    char delimiter_;
    char quote_;
    bool skip_blank_lines_;
    size_t lines_read_ = 0;
    size_t record_line_ = 0;
    std::string line_;
};

/// Incremental decoder turning records into DataFrame chunks.
/// Handles the header row, fixed names, type inference and the row index.
class CsvChunkDecoder {
public:
    CsvChunkDecoder(std::istream& in, CsvOptions opts);

    /// Decode up to max_rows records (0 = all remaining).
    /// Returns nullopt once no data rows remain.
    std::optional<DataFrame> next_chunk(size_t max_rows);

    /// Zero-row frame carrying the known column names
    DataFrame empty_frame();

    /// Column names as decoded (after header or names resolution)
    const std::vector<std::string>& names();

    /// Data rows produced so far
    size_t rows_decoded() const { return rows_decoded_; }

    /// Physical lines consumed by the header, including skipped leading records
    size_t header_lines() const { return header_lines_; }

private:
    void read_header();

    CsvOptions opts_;
    CsvRecordReader reader_;
    std::vector<std::string> names_;
    bool header_done_ = false;
    bool fixed_schema_ = false;
    std::optional<std::vector<std::string>> pending_row_;
    size_t pending_line_ = 0;
    size_t rows_decoded_ = 0;
    size_t header_lines_ = 0;
};

/// CSV Loader - delimited text to DataFrame
class CsvLoader {
public:
    CsvLoader() = delete;  // Static class, no instances

    /// Load a whole CSV file into one DataFrame
    static DataFrame load(const std::string& path, const CsvOptions& opts);

    /// Decode one block of delimited text
    static DataFrame decode(std::string_view text, const CsvOptions& opts);

    /// Throw ConfigurationError for contradictory options
    static void validate(const CsvOptions& opts);

    /// Build typed columns from raw rows.
    /// Every row must already have names.size() fields.
    static DataFrame build_frame(
        const std::vector<std::string>& names,
        const std::vector<std::vector<std::string>>& rows,
        const CsvOptions& opts
    );

    /// Parse a single value
    static bool try_parse_double(std::string_view str, double& out);
    static bool try_parse_int64(std::string_view str, int64_t& out);

private:
    /// Detect the type of one column from sample data
    static ColumnType detect_type(
        const std::vector<std::vector<std::string>>& rows,
        size_t col_idx,
        size_t sample_size
    );

    /// Build one column; nullptr if a value does not fit the type
    static std::shared_ptr<IColumn> make_column(
        const std::string& name,
        const std::vector<std::vector<std::string>>& rows,
        size_t col_idx,
        ColumnType type
    );
};

} // namespace tabstream
