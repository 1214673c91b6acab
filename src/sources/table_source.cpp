#include "tabstream/sources/table_source.hpp"

namespace tabstream {

namespace {

class TableChunkGenerator : public ChunkGenerator {
public:
    TableChunkGenerator(std::shared_ptr<const DataFrame> table, size_t chunksize)
        : table_(std::move(table))
        , slices_(table_->row_count(), chunksize)
    {}

    std::optional<DataFrame> next() override {
        RowRange range;
        if (!slices_.next(range)) {
            return std::nullopt;
        }
        return table_->slice(range.begin, range.end);
    }

private:
    std::shared_ptr<const DataFrame> table_;
    SliceGenerator slices_;
};

} // namespace

TableChunkSource::TableChunkSource(DataFrame table, size_t chunksize)
    : TableChunkSource(std::make_shared<const DataFrame>(std::move(table)), chunksize)
{}

TableChunkSource::TableChunkSource(std::shared_ptr<const DataFrame> table, size_t chunksize)
    : ChunkSource(chunksize)
    , table_(std::move(table))
{
    if (!table_) {
        throw ConfigurationError("TableChunkSource requires a table");
    }
}

std::unique_ptr<ChunkGenerator> TableChunkSource::make_generator() {
    return std::make_unique<TableChunkGenerator>(table_, chunksize());
}

} // namespace tabstream
