#include "tabstream/core/slice.hpp"
#include "tabstream/core/errors.hpp"
#include <algorithm>

namespace tabstream {

SliceGenerator::SliceGenerator(size_t length, size_t n)
    : length_(length)
    , n_(n)
{
    if (n_ == 0) {
        throw ConfigurationError("Slice size must be at least 1");
    }
}

bool SliceGenerator::next(RowRange& out) {
    if (position_ >= length_) {
        return false;
    }
    out.begin = position_;
    out.end = std::min(position_ + n_, length_);
    position_ = out.end;
    return true;
}

std::vector<RowRange> slice_ranges(size_t length, size_t n) {
    SliceGenerator slices(length, n);
    std::vector<RowRange> ranges;
    ranges.reserve(length / n + 1);

    RowRange range;
    while (slices.next(range)) {
        ranges.push_back(range);
    }
    return ranges;
}

} // namespace tabstream
