#pragma once

/**
 * @file table_source.hpp
 * @brief Chunk source over an in-memory DataFrame
 *
 * Chunk boundaries come from SliceGenerator(row_count, chunksize). Each
 * chunk is a copy of its rows and keeps the table's row labels.
 */

#include "tabstream/core/chunk_source.hpp"
#include "tabstream/core/slice.hpp"
#include <memory>

namespace tabstream {

class TableChunkSource : public ChunkSource {
public:
    TableChunkSource(DataFrame table, size_t chunksize);
    TableChunkSource(std::shared_ptr<const DataFrame> table, size_t chunksize);

    std::optional<uint64_t> total_rows() const override { return table_->row_count(); }
    std::string get_source_type() const override { return "table"; }

    const DataFrame& table() const { return *table_; }

protected:
    std::unique_ptr<ChunkGenerator> make_generator() override;

private:
    std::shared_ptr<const DataFrame> table_;
};

} // namespace tabstream
