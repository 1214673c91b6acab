#pragma once

/**
 * @file chunk_sink.hpp
 * @brief Lifecycle-scoped destination for DataFrame chunks
 *
 * A sink is Unopened until its first write() (or an explicit open()),
 * Open while it accepts chunks and Closed after close(). The underlying
 * resource is acquired lazily, so a sink can be configured and handed
 * around before it starts consuming.
 *
 * Callers must reach close(); ScopedSink aborts a sink left unclosed at
 * scope exit.
 */

#include "tabstream/core/batch_writer.hpp"
#include "tabstream/data/dataframe.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tabstream {

enum class SinkState {
    UNOPENED,
    OPEN,
    CLOSED
};

std::string sink_state_to_string(SinkState state);

class ChunkSink : public BatchWriter<DataFrame, std::optional<DataFrame>> {
public:
    /// Per-chunk hook applied before the format-specific writer
    using Transform = std::function<DataFrame(DataFrame)>;

    ChunkSink() = default;
    ~ChunkSink() override = default;

    ChunkSink(const ChunkSink&) = delete;
    ChunkSink& operator=(const ChunkSink&) = delete;

    /**
     * @brief Acquire the underlying resource
     *
     * No-op when already open.
     * @throws ResourceError if the sink is closed or the resource cannot be acquired
     */
    void open();

    /**
     * @brief Pipe the chunk and hand it to the format-specific writer
     *
     * Opens the sink on first use.
     * @throws ResourceError after close()
     */
    void write(DataFrame chunk) override;

    /**
     * @brief Release the resource and return the final result
     *
     * The sink is Closed afterwards even if finalization throws. Closing an
     * unopened sink is a no-op returning nullopt.
     *
     * @return Concatenated table for in-memory and columnar sinks, else nullopt
     * @throws ResourceError if already closed
     */
    std::optional<DataFrame> close() override;

    /**
     * @brief Release the resource without finalizing
     *
     * Used when a run fails part way: files are closed as they are, the
     * in-memory result is dropped and no columnar file is written.
     * No-op when already closed.
     */
    void abort() override;

    void set_pipe(Transform pipe) { pipe_ = std::move(pipe); }

    SinkState state() const { return state_; }
    bool is_open() const { return state_ == SinkState::OPEN; }

    /// Chunks written so far
    uint64_t blocks_written() const { return blocks_written_; }

protected:
    virtual void do_open() = 0;
    virtual void do_write(DataFrame&& chunk) = 0;
    virtual std::optional<DataFrame> do_close() = 0;
    virtual void do_abort() = 0;

private:
    SinkState state_ = SinkState::UNOPENED;
    Transform pipe_;
    uint64_t blocks_written_ = 0;
};

/**
 * @brief Owning guard that closes a sink on scope exit
 *
 * @code
 *   ScopedSink sink(std::make_unique<CsvSink>("out.csv"));
 *   while (auto chunk = source.next()) sink->write(std::move(*chunk));
 *   sink.close();
 * @endcode
 *
 * If the guard is destroyed before close() (an exception is unwinding),
 * it aborts the sink: the resource is released, nothing is finalized.
 */
class ScopedSink {
public:
    explicit ScopedSink(std::unique_ptr<ChunkSink> sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

    ChunkSink* operator->() { return sink_.get(); }
    ChunkSink& operator*() { return *sink_; }

    /// Close the sink and return its result
    std::optional<DataFrame> close();

    /// Give up ownership without closing
    std::unique_ptr<ChunkSink> release() { return std::move(sink_); }

private:
    std::unique_ptr<ChunkSink> sink_;
};

} // namespace tabstream
