#pragma once

/**
 * @file pipeline.hpp
 * @brief Source -> transform -> sink runner
 *
 * Usage:
 * @code
 *   auto scored = Pipeline(10000)
 *       .from_csv("input.csv", csv_opts)
 *       .transform(model)
 *       .to_table()
 *       .run();
 * @endcode
 *
 * run() moves chunks straight from the source to the sink. run_lines()
 * renders them to delimited-text lines and rebuilds chunks through a
 * ReassemblyBuffer, decoupling the line granularity from the sink's
 * chunk granularity.
 */

#include "tabstream/core/chunk_sink.hpp"
#include "tabstream/core/chunk_source.hpp"
#include "tabstream/data/csv_loader.hpp"
#include "tabstream/data/csv_writer.hpp"
#include "tabstream/sinks/parquet_sink.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

namespace tabstream {

class Pipeline {
public:
    static constexpr size_t kDefaultChunksize = 100;

    /// Opaque per-chunk transform (e.g. a scoring model)
    using Transform = std::function<DataFrame(DataFrame)>;

    explicit Pipeline(size_t chunksize = kDefaultChunksize);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = default;
    Pipeline& operator=(Pipeline&&) = default;

    // ========================================================================
    // Input
    // ========================================================================

    /**
     * @brief Read a delimited file; fails fast on a bad path
     *
     * Every column is read as String unless opts.dtype is set, so a
     * CSV to CSV run keeps the field text unchanged. For per-column type
     * inference pass a CsvFileChunkSource to from_source().
     */
    Pipeline& from_csv(const std::filesystem::path& path, CsvOptions opts = {});
    Pipeline& from_file(const std::filesystem::path& path, CsvOptions opts = {});
    Pipeline& from_table(DataFrame table);
    Pipeline& from_source(std::unique_ptr<ChunkSource> source);

    // ========================================================================
    // Output
    // ========================================================================

    Pipeline& to_csv(const std::filesystem::path& path, CsvWriteOptions opts = {});
    Pipeline& to_file(const std::filesystem::path& path);
    Pipeline& to_parquet(const std::filesystem::path& path, ParquetOptions opts = {});
    Pipeline& to_table();
    Pipeline& to_sink(std::unique_ptr<ChunkSink> sink);

    // ========================================================================
    // Execution
    // ========================================================================

    Pipeline& transform(Transform fn);

    /**
     * @brief Stream every chunk through the transform into the sink
     * @return The sink's result (in-memory and Parquet sinks), else nullopt
     * @throws ConfigurationError without a source or a sink
     */
    std::optional<DataFrame> run();

    /**
     * @brief Stream through line projection and reassembly
     * @param capacity Lines per reassembled chunk
     * @param line_format Line rendering; write_index is not supported here
     */
    std::optional<DataFrame> run_lines(size_t capacity, CsvWriteOptions line_format = {});

    // ========================================================================
    // Information
    // ========================================================================

    size_t chunksize() const { return chunksize_; }
    ChunkSource* source() { return source_.get(); }

    /// Resolved input path when reading from a file
    const std::optional<std::filesystem::path>& input_file() const { return input_file_; }

    /// Output path when writing to a file
    const std::optional<std::filesystem::path>& output_file() const { return output_file_; }

private:
    void require_configured() const;

    size_t chunksize_;
    std::unique_ptr<ChunkSource> source_;
    std::unique_ptr<ChunkSink> sink_;
    Transform transform_;
    std::optional<std::filesystem::path> input_file_;
    std::optional<ColumnType> input_dtype_;
    std::optional<std::filesystem::path> output_file_;
};

} // namespace tabstream
