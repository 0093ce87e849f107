/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Hearo headers
#include "core/ErrorMonitor.hpp"

using namespace hearo::core;

void ErrorMonitor::registerEscalation(Escalation cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

bool ErrorMonitor::rememberIfNew(const std::string& code) {
  lastCode_ = code;
  if (std::find(seen_.begin(), seen_.end(), code) != seen_.end())
    return false;
  seen_.push_back(code);
  return true;
}

void ErrorMonitor::notifyFailure(const std::string& code, const std::string& message,
                                 bool recovering) {
  Escalation cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!rememberIfNew(code))
      return;
    cb = escalation_;
  }
  // called unlocked: the callback may publish and log
  if (cb)
    cb(FailureReport{ code, message, recovering });
}

void ErrorMonitor::clear(const std::string& code) {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.erase(std::remove(seen_.begin(), seen_.end(), code), seen_.end());
}

void ErrorMonitor::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::string ErrorMonitor::lastErrorCode() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lastCode_;
}
