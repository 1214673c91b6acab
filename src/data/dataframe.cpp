#include "tabstream/data/dataframe.hpp"
#include <algorithm>
#include <numeric>
#include <optional>

namespace tabstream {

// ===== Column Access =====

const IColumn& DataFrame::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw std::out_of_range("Column not found: " + name);
    }
    return *it->second;
}

ColumnType DataFrame::column_type(const std::string& name) const {
    return column(name).type();
}

// ===== Index =====

std::vector<int64_t> DataFrame::index() const {
    if (!index_.empty()) {
        return index_;
    }
    std::vector<int64_t> labels(row_count_);
    std::iota(labels.begin(), labels.end(), int64_t{0});
    return labels;
}

void DataFrame::set_index(std::vector<int64_t> labels) {
    if (labels.size() != row_count_) {
        throw SchemaMismatchError("Index length " + std::to_string(labels.size()) +
                                  " does not match row count " + std::to_string(row_count_));
    }
    index_ = std::move(labels);
}

void DataFrame::reset_index(int64_t start) {
    if (start == 0) {
        index_.clear();
        return;
    }
    index_.resize(row_count_);
    std::iota(index_.begin(), index_.end(), start);
}

// ===== Rows =====

DataFrame DataFrame::slice(size_t begin, size_t end) const {
    if (begin > end || end > row_count_) {
        throw std::out_of_range("Row slice [" + std::to_string(begin) + ", " +
                                std::to_string(end) + ") out of range");
    }

    DataFrame out;
    for (const auto& name : column_names_) {
        out.add_column(name, columns_.at(name)->slice(begin, end));
    }
    out.row_count_ = end - begin;

    std::vector<int64_t> labels(end - begin);
    for (size_t i = begin; i < end; ++i) {
        labels[i - begin] = index_at(i);
    }
    // Keep the compact form for a frame that starts at row 0
    if (begin == 0 && index_.empty()) {
        labels.clear();
    }
    out.index_ = std::move(labels);
    return out;
}

DataFrame DataFrame::clone() const {
    DataFrame out;
    for (const auto& name : column_names_) {
        out.add_column(name, columns_.at(name)->clone());
    }
    out.row_count_ = row_count_;
    out.index_ = index_;
    return out;
}

bool DataFrame::equals(const DataFrame& other) const {
    if (column_names_ != other.column_names_ || row_count_ != other.row_count_) {
        return false;
    }
    for (size_t i = 0; i < row_count_; ++i) {
        if (index_at(i) != other.index_at(i)) {
            return false;
        }
    }
    for (const auto& name : column_names_) {
        if (!columns_.at(name)->equals(*other.columns_.at(name))) {
            return false;
        }
    }
    return true;
}

DataFrame DataFrame::concat(std::vector<DataFrame>& frames) {
    DataFrame out;
    if (frames.empty()) {
        return out;
    }

    const auto& names = frames.front().column_names_;
    size_t total_rows = 0;
    for (const auto& frame : frames) {
        if (frame.column_names_ != names) {
            throw SchemaMismatchError("Cannot concatenate frames with different columns");
        }
        total_rows += frame.row_count_;
    }

    // Zero-row frames carry no type information unless every frame is empty
    std::vector<ColumnType> types;
    for (size_t c = 0; c < names.size(); ++c) {
        std::optional<ColumnType> type;
        for (const auto& frame : frames) {
            if (frame.row_count_ == 0 && total_rows > 0) {
                continue;
            }
            const ColumnType part = frame.column_type(names[c]);
            type = type ? common_type(*type, part) : part;
        }
        types.push_back(type.value_or(ColumnType::STRING));
    }

    // Seed from a frame whose types took part in the widening
    const DataFrame* seed = &frames.front();
    for (const auto& frame : frames) {
        if (frame.row_count_ > 0) {
            seed = &frame;
            break;
        }
    }

    for (size_t c = 0; c < names.size(); ++c) {
        std::shared_ptr<IColumn> merged = seed->columns_.at(names[c])->slice(0, 0)->cast(types[c]);
        for (const auto& frame : frames) {
            if (frame.row_count_ == 0) {
                continue;
            }
            const auto& part = frame.columns_.at(names[c]);
            if (part->type() == types[c]) {
                merged->append(*part);
            } else {
                merged->append(*part->cast(types[c]));
            }
        }
        out.add_column(names[c], std::move(merged));
    }
    out.row_count_ = total_rows;

    std::vector<int64_t> labels;
    labels.reserve(total_rows);
    for (const auto& frame : frames) {
        for (size_t i = 0; i < frame.row_count_; ++i) {
            labels.push_back(frame.index_at(i));
        }
    }
    out.set_index(std::move(labels));
    return out;
}

// ===== Builders =====

void DataFrame::add_column(std::string name, std::shared_ptr<IColumn> column) {
    if (has_column(name)) {
        throw SchemaMismatchError("Duplicate column name: " + name);
    }

    // Validate row count consistency
    if (column_count() > 0 && column->size() != row_count_) {
        throw SchemaMismatchError("Column size mismatch for " + name + ": " +
                                  std::to_string(column->size()) + " != " +
                                  std::to_string(row_count_));
    }
    
    // Update row count
    if (column_count() == 0) {
        row_count_ = column->size();
        if (!index_.empty() && index_.size() != row_count_) {
            index_.clear();
        }
    }

    // Add column
    columns_[name] = std::move(column);
    column_names_.push_back(std::move(name));
}

std::shared_ptr<IColumn> DataFrame::take_column(const std::string& name) {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw std::out_of_range("Column not found: " + name);
    }
    auto column = std::move(it->second);
    columns_.erase(it);
    column_names_.erase(std::find(column_names_.begin(), column_names_.end(), name));
    return column;
}

} // namespace tabstream
