#pragma once

#include "tabstream/core/chunk_sink.hpp"
#include "tabstream/data/csv_writer.hpp"
#include <filesystem>
#include <fstream>
#include <ostream>

namespace tabstream {

/// Delimited-text sink. The header line is written with the first chunk
/// only; rows follow in arrival order. Never rewinds.
class CsvSink : public ChunkSink {
public:
    /// Write to a file, created (truncated) on first write
    explicit CsvSink(std::filesystem::path path, CsvWriteOptions opts = {});

    /// Write to a caller-owned stream, which must outlive the sink
    explicit CsvSink(std::ostream& out, CsvWriteOptions opts = {});

    const std::filesystem::path& path() const { return path_; }

protected:
    void do_open() override;
    void do_write(DataFrame&& chunk) override;
    std::optional<DataFrame> do_close() override;
    void do_abort() override;

private:
    std::filesystem::path path_;
    CsvWriteOptions opts_;
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    std::ostream* external_ = nullptr;
};

} // namespace tabstream
