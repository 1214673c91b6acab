#include "tabstream/stream/line_projector.hpp"

namespace tabstream {

LineProjector::LineProjector(ChunkSource& source, CsvWriteOptions opts)
    : source_(source)
    , opts_(std::move(opts))
{}

bool LineProjector::next(std::string& line) {
    while (pending_.empty()) {
        auto chunk = source_.next();
        if (!chunk) {
            return false;
        }
        render(*chunk);
    }

    line = std::move(pending_.front());
    pending_.pop_front();
    if (pipe_) {
        line = pipe_(std::move(line));
    }
    ++lines_emitted_;
    return true;
}

void LineProjector::reset() {
    source_.reset();
    pending_.clear();
    chunk_index_ = 0;
    lines_emitted_ = 0;
}

void LineProjector::render(const DataFrame& chunk) {
    const bool include_header = opts_.header && chunk_index_ == 0;
    const std::string text = CsvWriter::render(chunk, opts_, include_header);
    ++chunk_index_;

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        end = end == std::string::npos ? text.size() : end + 1;
        pending_.push_back(text.substr(start, end - start));
        start = end;
    }
}

} // namespace tabstream
