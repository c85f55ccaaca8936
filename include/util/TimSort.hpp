#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace lyre::util {

/**
 * timsort: stable natural mergesort for track lists.
 *
 * Track::compare treats a field missing on either side as equal, so the
 * "less than" it induces is not transitive. std::sort and std::stable_sort
 * may read out of bounds with such a comparator; this sort never does. Every
 * loop is bounded by iterator ranges, not by the comparator, and equal
 * elements keep their input order.
 *
 * Tag-sorted album directories are usually already sorted or reversed,
 * which the natural-run pass handles in O(n).
 */
namespace detail {

struct Run {
    size_t base;
    size_t length;
};

// Smallest run worth merging, between 16 and 32, such that n / minrun is
// close to a power of two
constexpr size_t min_run_length(size_t n) {
    size_t low_bits = 0;
    while (n >= 32) {
        low_bits |= (n & 1);
        n >>= 1;
    }
    return n + low_bits;
}

// Insert [sorted_end, last) into the sorted prefix [first, sorted_end)
template<typename RandomIt, typename Compare>
void insertion_extend(RandomIt first, RandomIt sorted_end, RandomIt last, Compare& comp) {
    for (auto it = sorted_end; it != last; ++it) {
        auto value = std::move(*it);

        // Rightmost slot where value is not less than its left neighbour
        auto lo = first;
        auto hi = it;
        while (lo < hi) {
            auto mid = lo + (hi - lo) / 2;
            if (comp(value, *mid)) {
                hi = mid;
            } else {
                lo = mid + 1;
            }
        }

        std::move_backward(lo, it, it + 1);
        *lo = std::move(value);
    }
}

// Length of the run starting at first. Strictly descending runs are reversed
// in place; requiring strictness keeps equal elements in order.
template<typename RandomIt, typename Compare>
size_t take_run(RandomIt first, RandomIt last, Compare& comp) {
    auto end = first + 1;
    if (end == last) return 1;

    if (comp(*end, *first)) {
        while (end != last && comp(*end, *(end - 1))) ++end;
        std::reverse(first, end);
    } else {
        while (end != last && !comp(*end, *(end - 1))) ++end;
    }
    return static_cast<size_t>(end - first);
}

template<typename RandomIt, typename Compare>
class RunMerger {
public:
    using Value = typename std::iterator_traits<RandomIt>::value_type;

    RunMerger(RandomIt first, Compare& comp) : first_(first), comp_(comp) {}

    void push(Run run) {
        runs_.push_back(run);
        collapse();
    }

    void finish() {
        while (runs_.size() > 1) {
            size_t n = runs_.size() - 2;
            if (n > 0 && runs_[n - 1].length < runs_[n + 1].length) --n;
            merge_at(n);
        }
    }

private:
    // Keeps run lengths decreasing like a Fibonacci sequence so the stack
    // stays logarithmic in the input size
    void collapse() {
        while (runs_.size() > 1) {
            size_t n = runs_.size() - 2;
            if (n > 0 && runs_[n - 1].length <= runs_[n].length + runs_[n + 1].length) {
                if (runs_[n - 1].length < runs_[n + 1].length) --n;
                merge_at(n);
            } else if (runs_[n].length <= runs_[n + 1].length) {
                merge_at(n);
            } else {
                break;
            }
        }
    }

    void merge_at(size_t i) {
        const Run left = runs_[i];
        const Run right = runs_[i + 1];

        auto out = first_ + left.base;
        auto r = first_ + right.base;
        const auto r_end = r + right.length;

        // Left run moves into scratch; the right run is merged in place
        scratch_.clear();
        scratch_.reserve(left.length);
        std::move(out, out + left.length, std::back_inserter(scratch_));

        auto l = scratch_.begin();
        while (l != scratch_.end() && r != r_end) {
            // Take from the right only when strictly smaller: stability
            if (comp_(*r, *l)) {
                *out++ = std::move(*r++);
            } else {
                *out++ = std::move(*l++);
            }
        }
        std::move(l, scratch_.end(), out);

        runs_[i].length = left.length + right.length;
        runs_.erase(runs_.begin() + static_cast<std::ptrdiff_t>(i) + 1);
    }

    RandomIt first_;
    Compare& comp_;
    std::vector<Run> runs_;
    std::vector<Value> scratch_;
};

}  // namespace detail

template<typename RandomIt, typename Compare>
void timsort(RandomIt first, RandomIt last, Compare comp) {
    const auto total = static_cast<size_t>(std::distance(first, last));
    if (total < 2) return;

    const size_t min_run = detail::min_run_length(total);
    detail::RunMerger<RandomIt, Compare> merger(first, comp);

    size_t pos = 0;
    while (pos < total) {
        auto start = first + static_cast<std::ptrdiff_t>(pos);
        size_t len = detail::take_run(start, last, comp);

        // Short natural runs are padded out with insertion sort
        if (len < min_run) {
            size_t forced = std::min(total - pos, min_run);
            detail::insertion_extend(start, start + len, start + forced, comp);
            len = forced;
        }

        merger.push({pos, len});
        pos += len;
    }

    merger.finish();
}

template<typename Container, typename Compare>
void timsort(Container& c, Compare comp) {
    timsort(c.begin(), c.end(), comp);
}

}  // namespace lyre::util
