#include "backend/History.hpp"
#include <algorithm>

namespace lyre::backend {

void History::push(size_t index) {
    // Forward path is abandoned once a new track is chosen
    if (len_ > 0) {
        len_ = cursor_ + 1;
    }

    if (len_ > 0 && entries_[len_ - 1] == index) {
        cursor_ = len_ - 1;
        return;
    }

    if (len_ == CAPACITY) {
        std::rotate(entries_.begin(), entries_.begin() + 1, entries_.end());
        --len_;
    }

    entries_[len_++] = index;
    cursor_ = len_ - 1;
}

std::optional<size_t> History::advance() {
    if (!has_forward()) return std::nullopt;
    ++cursor_;
    return entries_[cursor_];
}

std::optional<size_t> History::retreat() {
    if (len_ == 0 || cursor_ == 0) return std::nullopt;
    --cursor_;
    return entries_[cursor_];
}

std::optional<size_t> History::peek_forward() const {
    if (!has_forward()) return std::nullopt;
    return entries_[cursor_ + 1];
}

std::optional<size_t> History::peek_back() const {
    if (len_ == 0 || cursor_ == 0) return std::nullopt;
    return entries_[cursor_ - 1];
}

void History::clear() {
    len_ = 0;
    cursor_ = 0;
}

std::optional<size_t> History::current() const {
    if (len_ == 0) return std::nullopt;
    return entries_[cursor_];
}

}  // namespace lyre::backend
