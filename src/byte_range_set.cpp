#include "byte_range_set.h"

#include <algorithm>
#include <iterator>
#include <limits>

namespace whisp {

uint64_t ByteRangeSet::add(uint64_t offset, uint64_t length) {
    if (length == 0) {
        return 0;
    }

    uint64_t start = offset;
    uint64_t end = (length > std::numeric_limits<uint64_t>::max() - offset)
                       ? std::numeric_limits<uint64_t>::max()
                       : offset + length;

    // First range that could touch [start, end): the one starting at or before start
    auto it = ranges_.upper_bound(start);
    if (it != ranges_.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= start) {
            it = prev;
        }
    }

    uint64_t absorbed = 0;
    while (it != ranges_.end() && it->first <= end) {
        start = std::min(start, it->first);
        end = std::max(end, it->second);
        absorbed += it->second - it->first;
        it = ranges_.erase(it);
    }

    ranges_.emplace(start, end);

    uint64_t added = (end - start) - absorbed;
    covered_ += added;
    return added;
}

bool ByteRangeSet::contains(uint64_t offset, uint64_t length) const {
    if (length == 0) {
        return true;
    }
    auto it = ranges_.upper_bound(offset);
    if (it == ranges_.begin()) {
        return false;
    }
    --it;
    return it->second > offset && it->second - offset >= length;
}

uint64_t ByteRangeSet::contiguous_prefix() const {
    if (ranges_.empty() || ranges_.begin()->first != 0) {
        return 0;
    }
    return ranges_.begin()->second;
}

void ByteRangeSet::clear() {
    ranges_.clear();
    covered_ = 0;
}

} // namespace whisp
