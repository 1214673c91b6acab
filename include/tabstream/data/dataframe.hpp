#pragma once

#include "tabstream/data/column.hpp"
#include "tabstream/core/errors.hpp"
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>
#include <span>
#include <cstdint>

namespace tabstream {

/// Main DataFrame class
/// Column-oriented storage with an integer row index.
/// A chunk moving through the pipeline is a DataFrame holding a slice of rows.
class DataFrame {
private:
    /// Column storage (name -> column)
    std::unordered_map<std::string, std::shared_ptr<IColumn>> columns_;
    
    /// Row count
    size_t row_count_ = 0;
    
    /// Column names (preserves insertion order)
    std::vector<std::string> column_names_;

    /// Row labels; empty means the default range [0, row_count_)
    std::vector<int64_t> index_;
    
public:
    /// Default constructor (empty DataFrame)
    DataFrame() = default;
    
    /// No copy (expensive operation), use clone()
    DataFrame(const DataFrame&) = delete;
    DataFrame& operator=(const DataFrame&) = delete;
    
    /// Move semantics (efficient)
    DataFrame(DataFrame&&) = default;
    DataFrame& operator=(DataFrame&&) = default;

    /// Concatenate frames in order. Column names must match exactly;
    /// element types are widened to the common type.
    static DataFrame concat(std::vector<DataFrame>& frames);
    
    // ===== COLUMN ACCESS =====
    
    /// Get column as typed span (zero-copy, const)
    template<typename T>
    std::span<const T> get_column(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            throw std::out_of_range("Column not found: " + name);
        }
        
        auto* typed_col = dynamic_cast<TypedColumn<T>*>(it->second.get());
        if (!typed_col) {
            throw std::invalid_argument("Type mismatch for column: " + name);
        }
        
        return typed_col->view();
    }

    /// Untyped column handle
    const IColumn& column(const std::string& name) const;
    
    /// Check if column exists
    bool has_column(const std::string& name) const {
        return columns_.find(name) != columns_.end();
    }
    
    // ===== METADATA =====
    
    /// Get number of rows
    size_t row_count() const { return row_count_; }
    
    /// Get number of columns
    size_t column_count() const { return column_names_.size(); }
    
    /// Get column names
    const std::vector<std::string>& column_names() const { return column_names_; }
    
    /// Get column type
    ColumnType column_type(const std::string& name) const;

    // ===== INDEX =====

    /// Row label of row i
    int64_t index_at(size_t i) const {
        return index_.empty() ? static_cast<int64_t>(i) : index_[i];
    }

    /// All row labels
    std::vector<int64_t> index() const;

    /// Replace the row labels (size must equal row_count())
    void set_index(std::vector<int64_t> labels);

    /// Relabel rows as the contiguous range [start, start + row_count())
    void reset_index(int64_t start = 0);

    // ===== ROWS =====

    /// Copy of rows [begin, end); row labels are preserved
    DataFrame slice(size_t begin, size_t end) const;

    /// Deep copy
    DataFrame clone() const;

    /// Same columns, types, values and row labels
    bool equals(const DataFrame& other) const;
    
    // ===== BUILDERS =====
    
    /// Add column; throws SchemaMismatchError on duplicate name or length mismatch
    void add_column(std::string name, std::shared_ptr<IColumn> column);

    /// Remove a column and return it
    std::shared_ptr<IColumn> take_column(const std::string& name);
};

} // namespace tabstream
