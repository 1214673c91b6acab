#include "tabstream/core/chunk_sink.hpp"
#include "tabstream/core/errors.hpp"
#include <iostream>

namespace tabstream {

std::string sink_state_to_string(SinkState state) {
    switch (state) {
        case SinkState::UNOPENED: return "unopened";
        case SinkState::OPEN: return "open";
        case SinkState::CLOSED: return "closed";
        default: return "unknown";
    }
}

// ============================================================================
// ChunkSink
// ============================================================================

void ChunkSink::open() {
    if (state_ == SinkState::OPEN) {
        return;
    }
    if (state_ == SinkState::CLOSED) {
        throw ResourceError("Cannot open a closed sink");
    }
    do_open();
    state_ = SinkState::OPEN;
}

void ChunkSink::write(DataFrame chunk) {
    if (state_ == SinkState::CLOSED) {
        throw ResourceError("Write after close");
    }
    if (state_ == SinkState::UNOPENED) {
        open();
    }

    if (pipe_) {
        chunk = pipe_(std::move(chunk));
    }
    do_write(std::move(chunk));
    ++blocks_written_;
}

std::optional<DataFrame> ChunkSink::close() {
    if (state_ == SinkState::CLOSED) {
        throw ResourceError("Sink already closed");
    }
    const bool was_open = state_ == SinkState::OPEN;
    state_ = SinkState::CLOSED;

    if (!was_open) {
        return std::nullopt;
    }
    return do_close();
}

void ChunkSink::abort() {
    if (state_ == SinkState::CLOSED) {
        return;
    }
    const bool was_open = state_ == SinkState::OPEN;
    state_ = SinkState::CLOSED;
    if (was_open) {
        std::cerr << "[Sink] Aborted after " << blocks_written_
                  << " chunks, output discarded" << std::endl;
        do_abort();
    }
}

// ============================================================================
// ScopedSink
// ============================================================================

ScopedSink::ScopedSink(std::unique_ptr<ChunkSink> sink)
    : sink_(std::move(sink))
{
    if (!sink_) {
        throw ConfigurationError("ScopedSink requires a sink");
    }
}

ScopedSink::~ScopedSink() {
    if (sink_) {
        sink_->abort();
    }
}

std::optional<DataFrame> ScopedSink::close() {
    return sink_->close();
}

} // namespace tabstream
