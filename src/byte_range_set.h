#pragma once

/**
 * @file byte_range_set.h
 * @brief Set of half-open byte ranges for transfer accounting
 *
 * Tracks which bytes of a file have been serviced so that retransmitted or
 * out-of-order chunks are never counted twice.
 */

#include <map>
#include <cstdint>
#include <cstddef>

namespace whisp {

class ByteRangeSet {
public:
    ByteRangeSet() = default;

    /**
     * @brief Mark [offset, offset + length) as covered
     * @return Number of bytes that were not covered before
     */
    uint64_t add(uint64_t offset, uint64_t length);

    /**
     * @brief Check whether every byte of [offset, offset + length) is covered
     */
    bool contains(uint64_t offset, uint64_t length) const;

    /** Total number of distinct bytes covered */
    uint64_t covered() const { return covered_; }

    /** Length of the covered run starting at offset 0 */
    uint64_t contiguous_prefix() const;

    size_t range_count() const { return ranges_.size(); }
    bool empty() const { return ranges_.empty(); }

    void clear();

private:
    std::map<uint64_t, uint64_t> ranges_;   // start -> end (exclusive), disjoint and non-adjacent
    uint64_t covered_ = 0;
};

} // namespace whisp
