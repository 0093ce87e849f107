#pragma once
/** @file  Backoff.hpp
 *  @brief Doubling retry delay bounded by [initial, max].
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>

namespace hearo::core {

  class Backoff {
  public:
    Backoff(std::int64_t initialMs, std::int64_t maxMs);

    /// Delay to wait before the next attempt; doubles on every call up to max.
    std::int64_t next();
    void reset() { current_ = initial_; }

    std::int64_t current() const { return current_; }
    std::int64_t initial() const { return initial_; }
    std::int64_t max() const { return max_; }

  private:
    std::int64_t initial_;
    std::int64_t max_;
    std::int64_t current_;
  };

} // namespace hearo::core
