#pragma once

/**
 * @file errors.hpp
 * @brief Exception types thrown by the streaming pipeline
 *
 * All pipeline failures derive from TabstreamError so callers can abort
 * a run with a single catch site and still tell the categories apart.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tabstream {

/// Base class for every error raised by tabstream
class TabstreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bad or missing input path, invalid option combination.
/// Raised before any chunk is produced.
class ConfigurationError : public TabstreamError {
public:
    using TabstreamError::TabstreamError;
};

/// Malformed delimited text (unterminated quote, ragged row, bad index value)
class DecodeError : public TabstreamError {
public:
    DecodeError(const std::string& message, size_t line = 0)
        : TabstreamError(line > 0 ? message + " (line " + std::to_string(line) + ")" : message)
        , line_(line)
    {}

    /// 1-based line number of the offending record, 0 if unknown
    size_t line() const { return line_; }

private:
    size_t line_;
};

/// Sink or buffer used outside its lifecycle (write after close, double close),
/// or the underlying file could not be acquired
class ResourceError : public TabstreamError {
public:
    using TabstreamError::TabstreamError;
};

/// Column layout disagrees with an already established schema
class SchemaMismatchError : public TabstreamError {
public:
    using TabstreamError::TabstreamError;
};

} // namespace tabstream
