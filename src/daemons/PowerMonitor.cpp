/* @file PowerMonitor.cpp
 * @brief gauge -> battery band events
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "daemons/PowerMonitor.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

namespace {
  constexpr const char* kReadFailed = "GAUGE_READ_FAILED";
}

const char* hearo::daemons::toString(BatteryBand b) {
  switch (b) {
  case BatteryBand::Normal:
    return "BAT_NORM";
  case BatteryBand::Low:
    return "BAT_LOW";
  case BatteryBand::Critical:
    return "BAT_CRIT";
  case BatteryBand::Charging:
    return "BAT_CHG";
  }
  return "UNKNOWN";
}

PowerMonitor::PowerMonitor(core::EventPublisher& events, core::ErrorMonitor& errors,
                           io::BatteryGauge& gauge, const core::PowerConfig& cfg)
    : events_(events), errors_(errors), gauge_(gauge), cfg_(cfg) {}

BatteryBand PowerMonitor::bandFor(const io::BatteryReading& r) const {
  if (r.extPower)
    return BatteryBand::Charging;
  if (r.soc <= cfg_.critPct)
    return BatteryBand::Critical;
  if (r.soc <= cfg_.lowPct)
    return BatteryBand::Low;
  return BatteryBand::Normal;
}

void PowerMonitor::sample(std::int64_t nowMs) {
  const auto reading = gauge_.read();
  if (!reading) {
    failing_ = true;
    errors_.notifyFailure(kReadFailed, gauge_.lastError(), true);
    return;
  }
  if (failing_) {
    failing_ = false;
    errors_.clear(kReadFailed);
  }

  const auto band = bandFor(*reading);
  const bool changed = !band_ || *band_ != band;
  const bool enteredCritical = band == BatteryBand::Critical && changed;
  last_ = reading;
  band_ = band;

  if (changed || nowMs >= nextHeartbeat_)
    publishState(nowMs);
  if (enteredCritical)
    events_.publish(names::kPowdEventBatteryCritical, { { "soc", reading->soc } });
}

void PowerMonitor::publishState(std::int64_t nowMs) {
  nextHeartbeat_ = nowMs + cfg_.heartbeatMs;
  events_.publish(names::kPowdEventBatteryState, status());
}

nlohmann::json PowerMonitor::status() const {
  if (!last_)
    return { { "soc", nullptr }, { "band", nullptr }, { "ext_power", nullptr } };
  return {
    { "soc", last_->soc },
    { "band", toString(*band_) },
    { "ext_power", last_->extPower },
  };
}
