#include "tabstream/sinks/table_sink.hpp"

namespace tabstream {

void TableSink::do_open() {
    chunks_.clear();
}

void TableSink::do_write(DataFrame&& chunk) {
    chunks_.push_back(std::move(chunk));
}

std::optional<DataFrame> TableSink::do_close() {
    DataFrame result = DataFrame::concat(chunks_);
    chunks_.clear();
    return result;
}

void TableSink::do_abort() {
    chunks_.clear();
}

} // namespace tabstream
