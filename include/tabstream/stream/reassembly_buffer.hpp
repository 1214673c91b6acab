#pragma once

/**
 * @file reassembly_buffer.hpp
 * @brief Line buffer that rebuilds structured chunks for a ChunkSink
 *
 * Lines (each one formatted record plus its terminator) are buffered and,
 * on flush, concatenated and decoded back into a DataFrame:
 *
 * - The first flush must contain the header. Its column names become the
 *   fixed names for every later flush and header decoding is switched off.
 * - Lines consumed as header = lines in the first flush - rows decoded.
 * - Unless CsvOptions::index_col is set, each rebuilt chunk is relabelled
 *   to start at (lines written so far - header lines), so consecutive
 *   chunks share one continuous index.
 */

#include "tabstream/core/chunk_sink.hpp"
#include "tabstream/data/csv_loader.hpp"
#include "tabstream/stream/object_buffer.hpp"
#include <functional>
#include <optional>
#include <string>

namespace tabstream {

class ReassemblyBuffer
    : public ObjectBuffer<std::string, DataFrame, std::optional<DataFrame>> {
public:
    using Transform = std::function<DataFrame(DataFrame)>;

    ReassemblyBuffer(std::unique_ptr<ChunkSink> sink, size_t capacity, CsvOptions opts = {});

    /// Hook applied to every rebuilt chunk before it reaches the sink
    void set_pipe(Transform pipe) { pipe_ = std::move(pipe); }

    /// Lines consumed as header by the first flush
    size_t header_lines() const { return header_lines_; }

    /// Decoding options, including the names recovered from the header
    const CsvOptions& options() const { return opts_; }

protected:
    DataFrame assemble(std::vector<std::string>& lines, const BufferState& state) override;

private:
    CsvOptions opts_;
    Transform pipe_;
    size_t header_lines_ = 0;
};

} // namespace tabstream
