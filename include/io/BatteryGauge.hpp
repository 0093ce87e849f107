#pragma once
/** @file  BatteryGauge.hpp
 *  @brief State-of-charge sources: Linux power_supply sysfs node or a fixed value.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <optional>
#include <string>

namespace hearo {
  namespace io {

    struct BatteryReading {
      int soc{ 0 };            ///< 0..100 %
      bool extPower{ false };  ///< charger / USB present
    };

    /**
 * @class BatteryGauge
 * @brief Abstract reader so the power daemon can run without a fuel gauge.
 */
    class BatteryGauge {
    public:
      virtual ~BatteryGauge() = default;

      /// std::nullopt when the source cannot be read; see lastError().
      virtual std::optional<BatteryReading> read() = 0;

      const std::string& lastError() const { return lastError_; }

    protected:
      std::string lastError_{};
    };

    /**
 * @class SysfsBatteryGauge
 * @brief Reads `<dir>/capacity` and `<dir>/status` (e.g. /sys/class/power_supply/BAT0).
 *
 *  * status "Charging" or "Full" counts as external power.
 *  * An optional `online_path` (AC/USB supply `online` file) overrides the status heuristic.
 */
    class SysfsBatteryGauge : public BatteryGauge {
    public:
      explicit SysfsBatteryGauge(std::string supplyDir, std::string onlinePath = {})
          : dir_(std::move(supplyDir)), onlinePath_(std::move(onlinePath)) {}

      std::optional<BatteryReading> read() override;

    private:
      std::string dir_;
      std::string onlinePath_;
    };

    /// Constant reading for hosts without a gauge.
    class FixedBatteryGauge : public BatteryGauge {
    public:
      explicit FixedBatteryGauge(BatteryReading value) : value_(value) {}

      std::optional<BatteryReading> read() override { return value_; }

    private:
      BatteryReading value_;
    };

  } // namespace io
} // namespace hearo
