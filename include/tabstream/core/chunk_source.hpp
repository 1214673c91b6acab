#pragma once

/**
 * @file chunk_source.hpp
 * @brief Abstract chunk source interface for tabstream
 *
 * A chunk source produces a table as a sequence of DataFrame chunks of at
 * most chunksize() rows, in original row order. Iteration is pull-based:
 * nothing is decoded until next() asks for it. A source is not rewindable;
 * reset() rebuilds the underlying generator from scratch.
 *
 * Example usage:
 * @code
 *   TableChunkSource source(std::move(df), 1000);
 *   while (auto chunk = source.next()) {
 *       sink.write(std::move(*chunk));
 *   }
 * @endcode
 */

#include "tabstream/data/dataframe.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabstream {

/// One pass over the underlying data. Returns nullopt once exhausted,
/// and keeps returning nullopt afterwards.
class ChunkGenerator {
public:
    virtual ~ChunkGenerator() = default;

    virtual std::optional<DataFrame> next() = 0;
};

/**
 * @brief Base class for all chunk sources
 *
 * Subclasses only provide make_generator(); the base class owns the
 * generator, applies the pipe transform and implements side-effect free
 * peeking.
 */
class ChunkSource {
public:
    /// Per-chunk hook; an empty function is the identity
    using Transform = std::function<DataFrame(DataFrame)>;

    /// Throws ConfigurationError if chunksize == 0
    explicit ChunkSource(size_t chunksize);

    virtual ~ChunkSource() = default;

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    // ========================================================================
    // Iteration
    // ========================================================================

    /**
     * @brief Pull the next chunk, after the pipe transform
     * @return The chunk, or nullopt when the source is exhausted
     */
    std::optional<DataFrame> next();

    /**
     * @brief Drop the current generator; the next pull starts from row 0
     */
    void reset();

    /**
     * @brief First chunk of the stream, without disturbing iteration
     *
     * Before iteration starts the first chunk is materialized and handed
     * out again by the next call to next(). Once iteration is past the
     * first chunk it is re-read from a fresh generator, which only ever
     * decodes that one chunk.
     *
     * @return Pointer to the held chunk, nullptr for an empty source
     */
    const DataFrame* peek();

    /// Column names of the first chunk (empty for an empty source)
    std::vector<std::string> columns();

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Install the per-chunk hook applied to every chunk as it is yielded
    void set_pipe(Transform pipe) { pipe_ = std::move(pipe); }

    /// Maximum rows per chunk
    size_t chunksize() const { return chunksize_; }

    /// Chunks handed out by next() since construction or reset()
    uint64_t chunks_yielded() const { return chunks_yielded_; }

    /// Total rows when known up front (table sources)
    virtual std::optional<uint64_t> total_rows() const { return std::nullopt; }

    /// "table" or "file"
    virtual std::string get_source_type() const = 0;

protected:
    /// Build a fresh pass over the underlying data
    virtual std::unique_ptr<ChunkGenerator> make_generator() = 0;

private:
    DataFrame pipe(DataFrame chunk) const;

    size_t chunksize_;
    Transform pipe_;
    std::unique_ptr<ChunkGenerator> generator_;

    /// Materialized first chunk
    std::optional<DataFrame> head_;
    /// head_ came from generator_ and has not been yielded yet
    bool head_pending_ = false;

    uint64_t chunks_yielded_ = 0;
};

} // namespace tabstream
