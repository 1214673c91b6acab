/**
 * Parquet Sink - columnar file output
 *
 * Not incremental: chunks are accumulated in memory by an inner
 * TableSink and the concatenated table is written in one shot on close.
 * Memory use grows with the total dataset size. Files are stamped
 * created_by "tabstream <version>".
 */

#pragma once

#include "tabstream/core/chunk_sink.hpp"
#include "tabstream/sinks/table_sink.hpp"
#include <cstdint>
#include <filesystem>

#include <arrow/util/compression.h>

namespace tabstream {

struct ParquetOptions {
    arrow::Compression::type compression = arrow::Compression::SNAPPY;
    bool write_index = false;               ///< Store row labels as __index_level_0__
    int64_t row_group_size = 1024 * 1024;   ///< Max rows per row group
};

class ParquetSink : public ChunkSink {
public:
    explicit ParquetSink(std::filesystem::path path, ParquetOptions opts = {});

    const std::filesystem::path& path() const { return path_; }

protected:
    void do_open() override;
    void do_write(DataFrame&& chunk) override;
    std::optional<DataFrame> do_close() override;
    void do_abort() override;

private:
    void write_file(const DataFrame& df) const;

    std::filesystem::path path_;
    ParquetOptions opts_;
    TableSink accumulator_;
};

} // namespace tabstream
