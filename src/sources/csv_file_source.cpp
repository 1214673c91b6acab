#include "tabstream/sources/csv_file_source.hpp"
#include <fstream>
#include <iostream>

namespace tabstream {

namespace {

class CsvFileChunkGenerator : public ChunkGenerator {
public:
    CsvFileChunkGenerator(const std::filesystem::path& path, const CsvOptions& opts,
                          size_t chunksize)
        : file_(path, std::ios::binary)
        , decoder_(file_, opts)
        , chunksize_(chunksize)
    {
        if (!file_.is_open()) {
            throw ConfigurationError("Cannot open file: " + path.string());
        }
    }

    std::optional<DataFrame> next() override {
        return decoder_.next_chunk(chunksize_);
    }

private:
    std::ifstream file_;
    CsvChunkDecoder decoder_;
    size_t chunksize_;
};

} // namespace

std::filesystem::path validate_path(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path), ec);
    if (ec) {
        resolved = path;
    }
    if (!std::filesystem::exists(resolved, ec)) {
        throw ConfigurationError("File does not exist: " + resolved.string());
    }
    if (std::filesystem::is_directory(resolved, ec)) {
        throw ConfigurationError("Path is a directory: " + resolved.string());
    }
    return resolved;
}

CsvFileChunkSource::CsvFileChunkSource(const std::filesystem::path& path, CsvOptions opts,
                                       size_t chunksize)
    : ChunkSource(chunksize)
    , path_(validate_path(path))
    , opts_(std::move(opts))
{
    CsvLoader::validate(opts_);
}

std::unique_ptr<ChunkGenerator> CsvFileChunkSource::make_generator() {
    std::cout << "[CsvFileSource] Opened: " << path_.string()
              << " (chunksize=" << chunksize() << ")" << std::endl;
    return std::make_unique<CsvFileChunkGenerator>(path_, opts_, chunksize());
}

} // namespace tabstream
