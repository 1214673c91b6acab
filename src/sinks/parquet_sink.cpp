#include "tabstream/sinks/parquet_sink.hpp"
#include "tabstream/core/errors.hpp"
#include "tabstream/data/arrow_utils.hpp"
#include <iostream>

#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

namespace tabstream {

namespace {

const char* const kCreatedBy = "tabstream " TABSTREAM_VERSION;

void check_status(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw ResourceError(context + ": " + status.ToString());
    }
}

} // namespace

ParquetSink::ParquetSink(std::filesystem::path path, ParquetOptions opts)
    : path_(std::move(path))
    , opts_(opts)
{}

void ParquetSink::do_open() {
    accumulator_.open();
}

void ParquetSink::do_write(DataFrame&& chunk) {
    accumulator_.write(std::move(chunk));
}

std::optional<DataFrame> ParquetSink::do_close() {
    auto result = accumulator_.close();
    if (!result || result->column_count() == 0) {
        std::cerr << "[ParquetSink] No columns received, nothing written to "
                  << path_.string() << std::endl;
        return result;
    }

    write_file(*result);
    std::cout << "[ParquetSink] Finalized: " << path_.string() << " ("
              << result->row_count() << " rows, " << result->column_count()
              << " columns)" << std::endl;
    return result;
}

void ParquetSink::do_abort() {
    accumulator_.abort();
}

void ParquetSink::write_file(const DataFrame& df) const {
    arrow_utils::ArrowConvertOptions convert;
    convert.include_index = opts_.write_index;

    auto table = arrow_utils::to_arrow_table(df, convert);
    check_status(table.status(), "Arrow conversion failed");

    auto output = arrow::io::FileOutputStream::Open(path_.string());
    check_status(output.status(), "Failed to open file for writing: " + path_.string());

    parquet::WriterProperties::Builder builder;
    builder.compression(opts_.compression);
    builder.created_by(kCreatedBy);

    check_status(
        parquet::arrow::WriteTable(**table, arrow::default_memory_pool(), *output,
                                   opts_.row_group_size, builder.build()),
        "Parquet write failed: " + path_.string());
    check_status((*output)->Close(), "Failed to close " + path_.string());
}

} // namespace tabstream
