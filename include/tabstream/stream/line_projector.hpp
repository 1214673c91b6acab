#pragma once

#include "tabstream/core/chunk_source.hpp"
#include "tabstream/data/csv_writer.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace tabstream {

/// Renders the chunks of a source as delimited-text lines.
/// The header line (if enabled) appears once, ahead of the first chunk's
/// rows; later chunks contribute data lines only. Every line keeps its
/// terminator.
class LineProjector {
public:
    using Transform = std::function<std::string(std::string)>;

    /// The source must outlive the projector
    explicit LineProjector(ChunkSource& source, CsvWriteOptions opts = {});

    /// Pull the next line; false when the source is exhausted
    bool next(std::string& line);

    /// Restart from the top of the source, header included
    void reset();

    /// Hook applied to every emitted line
    void set_pipe(Transform pipe) { pipe_ = std::move(pipe); }

    uint64_t chunks_rendered() const { return chunk_index_; }
    uint64_t lines_emitted() const { return lines_emitted_; }

private:
    void render(const DataFrame& chunk);

    ChunkSource& source_;
    CsvWriteOptions opts_;
    Transform pipe_;
    std::deque<std::string> pending_;
    uint64_t chunk_index_ = 0;
    uint64_t lines_emitted_ = 0;
};

} // namespace tabstream
