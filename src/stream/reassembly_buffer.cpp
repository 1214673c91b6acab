#include "tabstream/stream/reassembly_buffer.hpp"
#include <sstream>

namespace tabstream {

ReassemblyBuffer::ReassemblyBuffer(std::unique_ptr<ChunkSink> sink, size_t capacity,
                                   CsvOptions opts)
    : ObjectBuffer(std::move(sink), capacity)
    , opts_(std::move(opts))
{
    CsvLoader::validate(opts_);
}

DataFrame ReassemblyBuffer::assemble(std::vector<std::string>& lines, const BufferState& state) {
    size_t total_size = 0;
    for (const auto& line : lines) {
        total_size += line.size();
    }
    std::string block;
    block.reserve(total_size);
    for (const auto& line : lines) {
        block += line;
    }

    std::istringstream stream(std::move(block));
    CsvChunkDecoder decoder(stream, opts_);
    auto chunk = decoder.next_chunk(0);
    DataFrame df = chunk ? std::move(*chunk) : decoder.empty_frame();

    if (!opts_.index_col) {
        const int64_t start = static_cast<int64_t>(state.total_written) -
                              static_cast<int64_t>(header_lines_);
        df.reset_index(start);
    }

    if (state.flushes == 0) {
        if (decoder.names().empty()) {
            throw DecodeError("First flush holds no header line");
        }
        if (state.in_buffer < df.row_count()) {
            throw DecodeError("Cannot determine header length: " +
                              std::to_string(state.in_buffer) + " lines decoded into " +
                              std::to_string(df.row_count()) + " rows");
        }
        header_lines_ = state.in_buffer - df.row_count();
        opts_.names = decoder.names();
        opts_.header_row = CsvOptions::kNoHeader;
    }

    if (pipe_) {
        df = pipe_(std::move(df));
    }
    return df;
}

} // namespace tabstream
