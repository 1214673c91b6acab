#pragma once

#include <string>
#include <vector>
#include <memory>
#include <span>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace tabstream {

/// Column data types
enum class ColumnType {
    FLOAT64,    ///< 64-bit floating point, NaN marks a missing value
    INT64,      ///< 64-bit integer
    STRING      ///< UTF-8 text
};

/// Human readable type name ("Float64", "Int64", "String")
std::string column_type_to_string(ColumnType type);

/// Render a double the way the delimited-text writer does:
/// shortest round-trip digits, ".0" suffix for integral values, "" for NaN
std::string format_double(double value);

/// Abstract column interface
class IColumn {
public:
    virtual ~IColumn() = default;
    
    /// Get column type
    virtual ColumnType type() const = 0;
    
    /// Get number of elements
    virtual size_t size() const = 0;
    
    /// Get column name
    virtual std::string name() const = 0;

    /// Text form of element i (used by the delimited-text writer)
    virtual std::string format(size_t i) const = 0;

    /// Copy of rows [begin, end)
    virtual std::shared_ptr<IColumn> slice(size_t begin, size_t end) const = 0;

    /// Deep copy
    virtual std::shared_ptr<IColumn> clone() const = 0;

    /// Copy converted to a wider type (INT64 -> FLOAT64, anything -> STRING)
    virtual std::shared_ptr<IColumn> cast(ColumnType target) const = 0;

    /// Append all elements of another column of the same type
    virtual void append(const IColumn& other) = 0;

    /// Element-wise equality; NaN compares equal to NaN
    virtual bool equals(const IColumn& other) const = 0;
};

/// Typed column implementation
/// Stores data in contiguous memory for cache efficiency
template<typename T>
class TypedColumn : public IColumn {
private:
    std::string name_;
    std::vector<T> data_;
    ColumnType type_;
    
public:
    /// Constructor
    TypedColumn(std::string name, std::vector<T> data, ColumnType type)
        : name_(std::move(name))
        , data_(std::move(data))
        , type_(type)
    {}
    
    /// Get read-only view of data (zero-copy)
    std::span<const T> view() const { 
        return std::span<const T>(data_.data(), data_.size()); 
    }
    
    /// Get mutable view of data
    std::span<T> view_mut() { 
        return std::span<T>(data_.data(), data_.size()); 
    }
    
    /// Get raw pointer
    const T* data_ptr() const { return data_.data(); }

    const T& operator[](size_t i) const { return data_[i]; }
    
    /// IColumn interface implementation
    ColumnType type() const override { return type_; }
    size_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }

    std::string format(size_t i) const override {
        if constexpr (std::is_same_v<T, double>) {
            return format_double(data_[i]);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return data_[i];
        } else {
            return std::to_string(data_[i]);
        }
    }

    std::shared_ptr<IColumn> slice(size_t begin, size_t end) const override {
        if (begin > end || end > data_.size()) {
            throw std::out_of_range("Column slice out of range: " + name_);
        }
        std::vector<T> part(data_.begin() + begin, data_.begin() + end);
        return std::make_shared<TypedColumn<T>>(name_, std::move(part), type_);
    }

    std::shared_ptr<IColumn> clone() const override {
        return std::make_shared<TypedColumn<T>>(name_, data_, type_);
    }

    std::shared_ptr<IColumn> cast(ColumnType target) const override;

    void append(const IColumn& other) override {
        auto* typed = dynamic_cast<const TypedColumn<T>*>(&other);
        if (!typed) {
            throw std::invalid_argument("Type mismatch appending to column: " + name_);
        }
        data_.insert(data_.end(), typed->data_.begin(), typed->data_.end());
    }

    bool equals(const IColumn& other) const override {
        auto* typed = dynamic_cast<const TypedColumn<T>*>(&other);
        if (!typed || typed->type_ != type_ || typed->data_.size() != data_.size()) {
            return false;
        }
        for (size_t i = 0; i < data_.size(); ++i) {
            if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(data_[i]) && std::isnan(typed->data_[i])) {
                    continue;
                }
            }
            if (!(data_[i] == typed->data_[i])) {
                return false;
            }
        }
        return true;
    }
};

/// Type aliases for common columns
using Float64Column = TypedColumn<double>;
using Int64Column = TypedColumn<int64_t>;
using StringColumn = TypedColumn<std::string>;

template<typename T>
std::shared_ptr<IColumn> TypedColumn<T>::cast(ColumnType target) const {
    if (target == type_) {
        return clone();
    }
    if (target == ColumnType::STRING) {
        std::vector<std::string> values;
        values.reserve(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            values.push_back(format(i));
        }
        return std::make_shared<StringColumn>(name_, std::move(values), ColumnType::STRING);
    }
    if constexpr (std::is_same_v<T, int64_t>) {
        if (target == ColumnType::FLOAT64) {
            std::vector<double> values(data_.begin(), data_.end());
            return std::make_shared<Float64Column>(name_, std::move(values), ColumnType::FLOAT64);
        }
    }
    throw std::invalid_argument("Cannot narrow column " + name_ + " from " +
                                column_type_to_string(type_) + " to " +
                                column_type_to_string(target));
}

/// Widest of two column types (INT64 < FLOAT64 < STRING)
ColumnType common_type(ColumnType a, ColumnType b);

} // namespace tabstream
