#pragma once

#include <array>
#include <cstddef>
#include <optional>

namespace lyre::backend {

/// History: bounded path of previously played queue indices plus a cursor.
///
/// Behaves like browser history: retreat()/advance() walk the recorded path
/// without inventing anything new, which is what makes shuffle undoable.
/// Invariant: when not empty, cursor() is a valid index into the path.
class History {
public:
    static constexpr size_t CAPACITY = 100;

    // Records index as the newest entry. No-op if it equals the last entry.
    // Drops any forward path first; evicts the oldest entry when full.
    void push(size_t index);

    // Move the cursor forward/back and return the entry it lands on
    std::optional<size_t> advance();
    std::optional<size_t> retreat();

    // The entry advance()/retreat() would land on, without moving
    [[nodiscard]] std::optional<size_t> peek_forward() const;
    [[nodiscard]] std::optional<size_t> peek_back() const;

    void clear();

    [[nodiscard]] bool empty() const { return len_ == 0; }
    [[nodiscard]] size_t size() const { return len_; }
    [[nodiscard]] size_t cursor() const { return cursor_; }
    [[nodiscard]] bool has_forward() const { return len_ > 0 && cursor_ + 1 < len_; }
    [[nodiscard]] std::optional<size_t> current() const;
    [[nodiscard]] size_t at(size_t i) const { return entries_[i]; }

private:
    std::array<size_t, CAPACITY> entries_{};
    size_t len_ = 0;
    size_t cursor_ = 0;
};

}  // namespace lyre::backend
