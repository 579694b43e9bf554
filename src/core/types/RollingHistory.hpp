/**
 * @file RollingHistory.hpp
 * @brief Bounded FIFO buffer of recent samples.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <stdexcept>
#include <vector>

namespace nettune::core {

/**
 * @brief Bounded FIFO of the last N values.
 *
 * Values are kept in insertion order. Pushing into a full history evicts the
 * oldest value first, so the buffer never holds more than capacity() values.
 *
 * @tparam T Stored value type.
 */
template <typename T>
class RollingHistory {
public:
    /**
     * @brief Constructs an empty history.
     * @param capacity Maximum number of values kept (must be at least 1).
     * @throws std::invalid_argument if capacity is 0.
     */
    explicit RollingHistory(size_t capacity) : capacity_(checkedCapacity(capacity)) {}

    /**
     * @brief Appends a value, evicting the oldest one if the history is full.
     */
    void push(T value) {
        while (values_.size() >= capacity_) {
            values_.pop_front();
        }
        values_.push_back(std::move(value));
    }

    /**
     * @brief Changes the capacity, dropping the oldest values that no longer fit.
     * @throws std::invalid_argument if capacity is 0.
     */
    void setCapacity(size_t capacity) {
        capacity_ = checkedCapacity(capacity);
        while (values_.size() > capacity_) {
            values_.pop_front();
        }
    }

    void clear() { values_.clear(); }

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] bool full() const { return values_.size() == capacity_; }

    /**
     * @brief Most recently pushed value, if any.
     */
    [[nodiscard]] std::optional<T> latest() const {
        if (values_.empty()) {
            return std::nullopt;
        }
        return values_.back();
    }

    /**
     * @brief Values oldest to newest.
     */
    [[nodiscard]] const std::deque<T>& values() const { return values_; }

    /**
     * @brief Values newest to oldest, for reverse-chronological display.
     */
    [[nodiscard]] std::vector<T> newestFirst() const {
        return std::vector<T>(values_.rbegin(), values_.rend());
    }

    [[nodiscard]] const T& operator[](size_t index) const { return values_[index]; }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

private:
    static size_t checkedCapacity(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RollingHistory capacity must be at least 1");
        }
        return capacity;
    }

    std::deque<T> values_;
    size_t capacity_;
};

} // namespace nettune::core
