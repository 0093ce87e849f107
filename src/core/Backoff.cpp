/* @file Backoff.cpp
 * @brief exponential retry delay
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>

#include "core/Backoff.hpp"

using namespace hearo::core;

Backoff::Backoff(std::int64_t initialMs, std::int64_t maxMs)
    : initial_(initialMs), max_(maxMs), current_(initialMs) {
  if (initialMs <= 0 || maxMs < initialMs)
    throw std::invalid_argument("[Backoff] need 0 < initial <= max");
}

std::int64_t Backoff::next() {
  const auto delay = current_;
  current_ = std::min(current_ * 2, max_);
  return delay;
}
