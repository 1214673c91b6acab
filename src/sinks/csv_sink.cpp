#include "tabstream/sinks/csv_sink.hpp"
#include "tabstream/core/errors.hpp"

namespace tabstream {

CsvSink::CsvSink(std::filesystem::path path, CsvWriteOptions opts)
    : path_(std::move(path))
    , opts_(std::move(opts))
{}

CsvSink::CsvSink(std::ostream& out, CsvWriteOptions opts)
    : opts_(std::move(opts))
    , external_(&out)
{}

void CsvSink::do_open() {
    if (external_) {
        out_ = external_;
        return;
    }

    file_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw ResourceError("Failed to open file for writing: " + path_.string());
    }
    out_ = &file_;
}

void CsvSink::do_write(DataFrame&& chunk) {
    const bool include_header = opts_.header && blocks_written() == 0;
    CsvWriter::write(chunk, *out_, opts_, include_header);
    if (!*out_) {
        throw ResourceError("Write failed" + (path_.empty() ? std::string() : ": " + path_.string()));
    }
}

std::optional<DataFrame> CsvSink::do_close() {
    out_->flush();
    const bool ok = static_cast<bool>(*out_);
    if (file_.is_open()) {
        file_.close();
    }
    out_ = nullptr;

    if (!ok) {
        throw ResourceError("Flush failed" + (path_.empty() ? std::string() : ": " + path_.string()));
    }
    return std::nullopt;
}

void CsvSink::do_abort() {
    if (file_.is_open()) {
        file_.close();
    }
    out_ = nullptr;
}

} // namespace tabstream
