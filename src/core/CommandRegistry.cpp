/* @file CommandRegistry.cpp
 * @brief name -> handler map
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <algorithm>

#include "core/CommandRegistry.hpp"

using namespace hearo::core;

bool CommandRegistry::registerCommand(std::string_view name, Handler handler) {
  return handlers_.emplace(std::string(name), std::move(handler)).second;
}

const CommandRegistry::Handler* CommandRegistry::find(const std::string& name) const {
  auto it = handlers_.find(name);
  return it == handlers_.end() ? nullptr : &it->second;
}

std::vector<std::string> CommandRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [name, _] : handlers_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}
