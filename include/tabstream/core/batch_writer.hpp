#pragma once

namespace tabstream {

/**
 * @brief Downstream consumer of batches
 *
 * Receives one batch per write() and returns its final result from
 * close(). abort() releases it without a result when the producer
 * fails. Buffers hold one of these and flush into it.
 */
template<typename Batch, typename Result = void>
class BatchWriter {
public:
    virtual ~BatchWriter() = default;

    virtual void write(Batch batch) = 0;

    virtual Result close() = 0;

    virtual void abort() = 0;
};

} // namespace tabstream
