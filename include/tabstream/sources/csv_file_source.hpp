#pragma once

/**
 * @file csv_file_source.hpp
 * @brief Chunk source decoding a delimited text file lazily
 *
 * The path is validated at construction, so a bad path fails before any
 * chunk is produced. Every pass (construction, reset(), a peek after
 * iteration started) reopens the file and decodes it from the top.
 * Chunks carry a continuous row index across the file unless
 * CsvOptions::index_col names a label column.
 */

#include "tabstream/core/chunk_source.hpp"
#include "tabstream/data/csv_loader.hpp"
#include <filesystem>

namespace tabstream {

class CsvFileChunkSource : public ChunkSource {
public:
    /// Throws ConfigurationError for a missing path, a directory or bad options
    CsvFileChunkSource(const std::filesystem::path& path, CsvOptions opts, size_t chunksize);

    std::string get_source_type() const override { return "file"; }

    /// Absolute, resolved input path
    const std::filesystem::path& path() const { return path_; }

    const CsvOptions& options() const { return opts_; }

protected:
    std::unique_ptr<ChunkGenerator> make_generator() override;

private:
    std::filesystem::path path_;
    CsvOptions opts_;
};

/// Resolve a path and make sure it names an existing regular file
std::filesystem::path validate_path(const std::filesystem::path& path);

} // namespace tabstream
