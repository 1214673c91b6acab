#pragma once

/**
 * @file object_buffer.hpp
 * @brief Bounded buffer flushing batches into a downstream writer
 *
 * write() checks capacity before appending: a write that finds the buffer
 * full flushes it first, so after any completed write the buffer holds at
 * most capacity() items.
 */

#include "tabstream/core/batch_writer.hpp"
#include "tabstream/core/errors.hpp"
#include <cstdint>
#include <memory>
#include <type_traits>
#include <vector>

namespace tabstream {

/// Counters owned by a buffer
struct BufferState {
    size_t in_buffer = 0;       ///< Items currently held
    uint64_t total_written = 0; ///< Items handed downstream by completed flushes
    uint64_t flushes = 0;       ///< Completed flushes
};

template<typename Item, typename Batch = std::vector<Item>, typename Result = void>
class ObjectBuffer {
public:
    using Writer = BatchWriter<Batch, Result>;

    /// Throws ConfigurationError for a null writer or zero capacity
    ObjectBuffer(std::unique_ptr<Writer> writer, size_t capacity)
        : writer_(std::move(writer))
        , capacity_(capacity)
    {
        if (!writer_) {
            throw ConfigurationError("ObjectBuffer requires a downstream writer");
        }
        if (capacity_ == 0) {
            throw ConfigurationError("Buffer capacity must be at least 1");
        }
        items_.reserve(capacity_);
    }

    /// A buffer dropped without close() aborts its downstream writer
    virtual ~ObjectBuffer() {
        abort();
    }

    ObjectBuffer(const ObjectBuffer&) = delete;
    ObjectBuffer& operator=(const ObjectBuffer&) = delete;

    /// Append one item, flushing first if the buffer is full
    void write(Item item) {
        if (closed_) {
            throw ResourceError("Write to a closed buffer");
        }
        if (state_.in_buffer >= capacity_) {
            flush();
        }
        items_.push_back(std::move(item));
        ++state_.in_buffer;
    }

    /// Hand the held items downstream as one batch; no-op when empty
    void flush() {
        if (items_.empty()) {
            return;
        }

        Batch batch = assemble(items_, state_);
        const size_t count = state_.in_buffer;
        items_.clear();
        state_.in_buffer = 0;

        // Only delivered items count as written
        writer_->write(std::move(batch));
        state_.total_written += count;
        ++state_.flushes;
    }

    /// Flush the remainder, then close the downstream writer and return its result
    Result close() {
        if (closed_) {
            throw ResourceError("Buffer already closed");
        }

        try {
            flush();
        } catch (...) {
            abort();
            throw;
        }
        closed_ = true;
        return writer_->close();
    }

    /// Drop held items and release the downstream writer without a result.
    /// No-op once closed.
    void abort() {
        if (closed_) {
            return;
        }
        closed_ = true;
        items_.clear();
        state_.in_buffer = 0;
        writer_->abort();
    }

    bool closed() const { return closed_; }

    const BufferState& state() const { return state_; }
    size_t capacity() const { return capacity_; }
    Writer& writer() { return *writer_; }

protected:
    /**
     * @brief Turn the held items into the batch handed downstream
     *
     * Called by flush() before any counter changes, so state describes the
     * buffer as it was when the flush started. The default passes the items
     * through unchanged.
     */
    virtual Batch assemble(std::vector<Item>& items, const BufferState& state) {
        (void)state;
        if constexpr (std::is_same_v<Batch, std::vector<Item>>) {
            return std::move(items);
        } else {
            throw ConfigurationError("ObjectBuffer: no batch assembly for this item type");
        }
    }

private:
    std::unique_ptr<Writer> writer_;
    size_t capacity_;
    std::vector<Item> items_;
    BufferState state_;
    bool closed_ = false;
};

} // namespace tabstream
