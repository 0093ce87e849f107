#pragma once
/** @file  PowerMonitor.hpp
 *  @brief Battery gauge sampling, banding and BATTERY_* events.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "io/BatteryGauge.hpp"

namespace hearo {
  namespace core {
    class EventPublisher;
    class ErrorMonitor;
  } // namespace core

  namespace daemons {

    enum class BatteryBand { Normal, Low, Critical, Charging };
    const char* toString(BatteryBand b); ///< BAT_NORM, BAT_LOW, BAT_CRIT, BAT_CHG

    /**
 * @class PowerMonitor
 * @brief One gauge read per `sample()`.
 *
 *  * BATTERY_STATE on the first reading, on every band change and every
 *    `heartbeatMs` otherwise.
 *  * BATTERY_CRITICAL once per entry into BAT_CRIT.
 *  * External power always bands as BAT_CHG.
 */
    class PowerMonitor {
    public:
      PowerMonitor(core::EventPublisher& events, core::ErrorMonitor& errors,
                   io::BatteryGauge& gauge, const core::PowerConfig& cfg);

      void sample(std::int64_t nowMs);

      BatteryBand bandFor(const io::BatteryReading& r) const;

      const std::optional<io::BatteryReading>& last() const { return last_; }
      std::optional<BatteryBand> band() const { return band_; }
      nlohmann::json status() const;

    private:
      void publishState(std::int64_t nowMs);

      core::EventPublisher& events_;
      core::ErrorMonitor& errors_;
      io::BatteryGauge& gauge_;
      const core::PowerConfig cfg_;

      std::optional<io::BatteryReading> last_{};
      std::optional<BatteryBand> band_{};
      std::int64_t nextHeartbeat_{ 0 };
      bool failing_{ false };
    };

  } // namespace daemons
} // namespace hearo
