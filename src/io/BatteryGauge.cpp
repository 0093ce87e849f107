/* @file BatteryGauge.cpp
 * @brief power_supply sysfs reader
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <fstream>
#include <stdexcept>

// Hearo headers
#include "io/BatteryGauge.hpp"

using namespace hearo::io;

namespace {
  std::optional<std::string> readFirstLine(const std::string& path) {
    std::ifstream in(path);
    if (!in)
      return std::nullopt;
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
      line.pop_back();
    return line;
  }
} // namespace

std::optional<BatteryReading> SysfsBatteryGauge::read() {
  auto capacity = readFirstLine(dir_ + "/capacity");
  if (!capacity) {
    lastError_ = "cannot read " + dir_ + "/capacity";
    return std::nullopt;
  }

  BatteryReading r;
  try {
    r.soc = std::clamp(std::stoi(*capacity), 0, 100);
  } catch (const std::exception&) {
    lastError_ = "bad capacity value '" + *capacity + "'";
    return std::nullopt;
  }

  if (!onlinePath_.empty()) {
    auto online = readFirstLine(onlinePath_);
    r.extPower = online && *online == "1";
  } else {
    auto status = readFirstLine(dir_ + "/status");
    r.extPower = status && (*status == "Charging" || *status == "Full");
  }
  return r;
}
