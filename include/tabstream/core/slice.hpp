#pragma once

#include <cstddef>
#include <vector>

namespace tabstream {

/// Half-open row range [begin, end)
struct RowRange {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }

    bool operator==(const RowRange& other) const {
        return begin == other.begin && end == other.end;
    }
};

/**
 * @brief Lazily partitions [0, length) into consecutive ranges of n rows
 *
 * Every range except possibly the last has exactly n rows.
 * n >= length yields a single range; length == 0 yields none.
 *
 * Example usage:
 * @code
 *   SliceGenerator slices(5, 2);
 *   RowRange range;
 *   while (slices.next(range)) { ... }   // [0,2) [2,4) [4,5)
 * @endcode
 */
class SliceGenerator {
public:
    /// Throws ConfigurationError if n == 0
    SliceGenerator(size_t length, size_t n);

    /// Produce the next range; false when [0, length) is covered
    bool next(RowRange& out);

    /// Start over from row 0
    void reset() { position_ = 0; }

private:
    size_t length_;
    size_t n_;
    size_t position_ = 0;
};

/// All ranges of SliceGenerator(length, n) at once
std::vector<RowRange> slice_ranges(size_t length, size_t n);

} // namespace tabstream
