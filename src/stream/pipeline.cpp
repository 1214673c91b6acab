#include "tabstream/stream/pipeline.hpp"
#include "tabstream/core/errors.hpp"
#include "tabstream/sinks/csv_sink.hpp"
#include "tabstream/sinks/table_sink.hpp"
#include "tabstream/sources/csv_file_source.hpp"
#include "tabstream/sources/table_source.hpp"
#include "tabstream/stream/line_projector.hpp"
#include "tabstream/stream/reassembly_buffer.hpp"
#include <iostream>

namespace tabstream {

Pipeline::Pipeline(size_t chunksize)
    : chunksize_(chunksize)
{
    if (chunksize_ == 0) {
        throw ConfigurationError("chunksize must be at least 1");
    }
}

// ============================================================================
// Input
// ============================================================================

Pipeline& Pipeline::from_csv(const std::filesystem::path& path, CsvOptions opts) {
    // Fields pass through as text unless the caller asks for typed columns
    if (!opts.dtype) {
        opts.dtype = ColumnType::STRING;
    }
    input_dtype_ = opts.dtype;
    auto source = std::make_unique<CsvFileChunkSource>(path, std::move(opts), chunksize_);
    input_file_ = source->path();
    source_ = std::move(source);
    return *this;
}

Pipeline& Pipeline::from_file(const std::filesystem::path& path, CsvOptions opts) {
    return from_csv(path, std::move(opts));
}

Pipeline& Pipeline::from_table(DataFrame table) {
    source_ = std::make_unique<TableChunkSource>(std::move(table), chunksize_);
    input_file_.reset();
    input_dtype_.reset();
    return *this;
}

Pipeline& Pipeline::from_source(std::unique_ptr<ChunkSource> source) {
    if (!source) {
        throw ConfigurationError("from_source requires a source");
    }
    source_ = std::move(source);
    input_file_.reset();
    input_dtype_.reset();
    return *this;
}

// ============================================================================
// Output
// ============================================================================

Pipeline& Pipeline::to_csv(const std::filesystem::path& path, CsvWriteOptions opts) {
    output_file_ = std::filesystem::absolute(path);
    sink_ = std::make_unique<CsvSink>(path, std::move(opts));
    return *this;
}

Pipeline& Pipeline::to_file(const std::filesystem::path& path) {
    return to_csv(path);
}

Pipeline& Pipeline::to_parquet(const std::filesystem::path& path, ParquetOptions opts) {
    output_file_ = std::filesystem::absolute(path);
    sink_ = std::make_unique<ParquetSink>(path, opts);
    return *this;
}

Pipeline& Pipeline::to_table() {
    output_file_.reset();
    sink_ = std::make_unique<TableSink>();
    return *this;
}

Pipeline& Pipeline::to_sink(std::unique_ptr<ChunkSink> sink) {
    if (!sink) {
        throw ConfigurationError("to_sink requires a sink");
    }
    output_file_.reset();
    sink_ = std::move(sink);
    return *this;
}

// ============================================================================
// Execution
// ============================================================================

Pipeline& Pipeline::transform(Transform fn) {
    transform_ = std::move(fn);
    return *this;
}

void Pipeline::require_configured() const {
    if (!source_) {
        throw ConfigurationError("Pipeline has no source");
    }
    if (!sink_) {
        throw ConfigurationError("Pipeline has no sink");
    }
}

std::optional<DataFrame> Pipeline::run() {
    require_configured();

    ScopedSink sink(std::move(sink_));
    while (auto chunk = source_->next()) {
        if (transform_) {
            chunk = transform_(std::move(*chunk));
        }
        sink->write(std::move(*chunk));
    }

    std::cout << "[Pipeline] Wrote " << sink->blocks_written() << " chunks ("
              << source_->get_source_type() << " source)" << std::endl;
    return sink.close();
}

std::optional<DataFrame> Pipeline::run_lines(size_t capacity, CsvWriteOptions line_format) {
    require_configured();
    if (line_format.write_index) {
        throw ConfigurationError("run_lines does not carry the row index through lines");
    }

    CsvOptions decode_opts;
    decode_opts.delimiter = line_format.delimiter;
    decode_opts.quote = line_format.quote;
    decode_opts.header_row = line_format.header ? 0 : CsvOptions::kNoHeader;
    decode_opts.dtype = input_dtype_;

    // The buffer aborts the sink if the run leaves this scope without close()
    LineProjector projector(*source_, line_format);
    ReassemblyBuffer buffer(std::move(sink_), capacity, decode_opts);
    if (transform_) {
        buffer.set_pipe(transform_);
    }

    std::string line;
    while (projector.next(line)) {
        buffer.write(std::move(line));
    }

    std::cout << "[Pipeline] Reassembled " << projector.lines_emitted() << " lines into "
              << buffer.state().flushes + (buffer.state().in_buffer > 0 ? 1 : 0)
              << " chunks" << std::endl;
    return buffer.close();
}

} // namespace tabstream
