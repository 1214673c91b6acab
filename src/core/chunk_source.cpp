#include "tabstream/core/chunk_source.hpp"
#include "tabstream/core/errors.hpp"

namespace tabstream {

ChunkSource::ChunkSource(size_t chunksize)
    : chunksize_(chunksize)
{
    if (chunksize_ == 0) {
        throw ConfigurationError("chunksize must be at least 1");
    }
}

std::optional<DataFrame> ChunkSource::next() {
    if (head_pending_) {
        head_pending_ = false;
        ++chunks_yielded_;
        DataFrame chunk = std::move(*head_);
        head_.reset();
        return chunk;
    }

    if (!generator_) {
        generator_ = make_generator();
    }
    auto chunk = generator_->next();
    if (!chunk) {
        return std::nullopt;
    }
    ++chunks_yielded_;
    return pipe(std::move(*chunk));
}

void ChunkSource::reset() {
    generator_.reset();
    head_.reset();
    head_pending_ = false;
    chunks_yielded_ = 0;
}

const DataFrame* ChunkSource::peek() {
    if (head_) {
        return &*head_;
    }

    std::optional<DataFrame> chunk;
    if (chunks_yielded_ == 0) {
        if (!generator_) {
            generator_ = make_generator();
        }
        chunk = generator_->next();
        head_pending_ = chunk.has_value();
    } else {
        auto fresh = make_generator();
        chunk = fresh->next();
    }

    if (!chunk) {
        return nullptr;
    }
    head_ = pipe(std::move(*chunk));
    return &*head_;
}

std::vector<std::string> ChunkSource::columns() {
    const DataFrame* head = peek();
    return head ? head->column_names() : std::vector<std::string>{};
}

DataFrame ChunkSource::pipe(DataFrame chunk) const {
    if (!pipe_) {
        return chunk;
    }
    return pipe_(std::move(chunk));
}

} // namespace tabstream
