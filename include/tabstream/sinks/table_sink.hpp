#pragma once

#include "tabstream/core/chunk_sink.hpp"
#include <vector>

namespace tabstream {

/// In-memory sink. Keeps every chunk in arrival order and returns their
/// concatenation from close(); no deduplication, no reordering.
class TableSink : public ChunkSink {
public:
    TableSink() = default;

    /// Chunks held so far
    size_t pending_chunks() const { return chunks_.size(); }

protected:
    void do_open() override;
    void do_write(DataFrame&& chunk) override;
    std::optional<DataFrame> do_close() override;
    void do_abort() override;

private:
    std::vector<DataFrame> chunks_;
};

} // namespace tabstream
