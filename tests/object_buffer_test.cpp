#include <gtest/gtest.h>

#include "tabstream/core/errors.hpp"
#include "tabstream/stream/object_buffer.hpp"

#include <stdexcept>

namespace tabstream {
namespace {

struct WriterLog {
    std::vector<std::vector<int>> batches;
    bool closed = false;
    bool aborted = false;
    int failing_writes = 0;  ///< Number of upcoming writes that throw
};

class RecordingWriter : public BatchWriter<std::vector<int>, size_t> {
public:
    explicit RecordingWriter(WriterLog* log)
        : log_(log)
    {}

    void write(std::vector<int> batch) override {
        if (log_->failing_writes > 0) {
            --log_->failing_writes;
            throw std::runtime_error("downstream write failed");
        }
        log_->batches.push_back(std::move(batch));
    }

    size_t close() override {
        log_->closed = true;
        return log_->batches.size();
    }

    void abort() override {
        log_->aborted = true;
    }

private:
    WriterLog* const log_;
};

using IntBuffer = ObjectBuffer<int, std::vector<int>, size_t>;

////////////////////////////////////////////////////////////////////////////////

TEST(TObjectBufferTest, FlushesWhenFull)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 3);

    for (int i = 0; i < 4; ++i) {
        buffer.write(i);
    }

    ASSERT_EQ(1u, log.batches.size());
    EXPECT_EQ((std::vector<int>{0, 1, 2}), log.batches[0]);
    EXPECT_EQ(1u, buffer.state().in_buffer);
    EXPECT_EQ(3u, buffer.state().total_written);
    EXPECT_EQ(1u, buffer.state().flushes);
}

TEST(TObjectBufferTest, HoldsUntilCapacityExceeded)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 3);

    for (int i = 0; i < 3; ++i) {
        buffer.write(i);
    }
    EXPECT_TRUE(log.batches.empty());
    EXPECT_EQ(3u, buffer.state().in_buffer);
}

TEST(TObjectBufferTest, CloseFlushesRemainder)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 2);
    for (int i = 0; i < 5; ++i) {
        buffer.write(i);
    }

    EXPECT_EQ(3u, buffer.close());
    EXPECT_TRUE(log.closed);
    ASSERT_EQ(3u, log.batches.size());
    EXPECT_EQ((std::vector<int>{4}), log.batches[2]);
    EXPECT_EQ(5u, buffer.state().total_written);
    EXPECT_EQ(0u, buffer.state().in_buffer);
}

TEST(TObjectBufferTest, ExplicitFlush)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 10);

    buffer.flush();
    EXPECT_TRUE(log.batches.empty());
    EXPECT_EQ(0u, buffer.state().flushes);

    buffer.write(1);
    buffer.flush();
    ASSERT_EQ(1u, log.batches.size());
    EXPECT_EQ(1u, buffer.state().total_written);
}

TEST(TObjectBufferTest, ClosedBufferRejectsWrites)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 2);
    buffer.close();

    EXPECT_THROW(buffer.write(1), ResourceError);
    EXPECT_THROW(buffer.close(), ResourceError);
}

TEST(TObjectBufferTest, FailedFlushKeepsCountersConsistent)
{
    WriterLog log;
    log.failing_writes = 1;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 2);

    buffer.write(1);
    buffer.write(2);
    EXPECT_THROW(buffer.write(3), std::runtime_error);
    EXPECT_EQ(0u, buffer.state().in_buffer);
    EXPECT_EQ(0u, buffer.state().total_written);
    EXPECT_EQ(0u, buffer.state().flushes);

    for (int i = 4; i < 8; ++i) {
        buffer.write(i);
        EXPECT_LE(buffer.state().in_buffer, buffer.capacity());
    }
    ASSERT_EQ(1u, log.batches.size());
    EXPECT_EQ((std::vector<int>{4, 5}), log.batches[0]);
    EXPECT_EQ(2u, buffer.state().total_written);
}

TEST(TObjectBufferTest, FailedCloseAbortsWriter)
{
    WriterLog log;
    IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 4);
    buffer.write(1);
    log.failing_writes = 1;

    EXPECT_THROW(buffer.close(), std::runtime_error);
    EXPECT_TRUE(log.aborted);
    EXPECT_FALSE(log.closed);
    EXPECT_TRUE(buffer.closed());
    EXPECT_THROW(buffer.write(2), ResourceError);
}

TEST(TObjectBufferTest, DroppedBufferAbortsWriter)
{
    WriterLog log;
    {
        IntBuffer buffer(std::make_unique<RecordingWriter>(&log), 4);
        buffer.write(1);
    }
    EXPECT_TRUE(log.aborted);
    EXPECT_TRUE(log.batches.empty());

    WriterLog closed_log;
    {
        IntBuffer buffer(std::make_unique<RecordingWriter>(&closed_log), 4);
        buffer.write(1);
        buffer.close();
    }
    EXPECT_TRUE(closed_log.closed);
    EXPECT_FALSE(closed_log.aborted);
}

TEST(TObjectBufferTest, InvalidConstruction)
{
    WriterLog log;
    EXPECT_THROW(IntBuffer(std::make_unique<RecordingWriter>(&log), 0), ConfigurationError);
    EXPECT_THROW(IntBuffer(nullptr, 2), ConfigurationError);
}

////////////////////////////////////////////////////////////////////////////////

} // namespace
} // namespace tabstream
