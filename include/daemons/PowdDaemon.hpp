#pragma once
/** @file  PowdDaemon.hpp
 *  @brief Power daemon: battery gauge -> POWD_EVENT_BATTERY_*.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <memory>

#include "core/Config.hpp"
#include "core/Daemon.hpp"
#include "daemons/PowerMonitor.hpp"
#include "io/BatteryGauge.hpp"

namespace hearo::daemons {

  class PowdDaemon : public core::Daemon {
  public:
    PowdDaemon(core::Logger& log, const core::HearoConfig& cfg,
               std::unique_ptr<io::BatteryGauge> gauge,
               std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    /// Sysfs gauge when `power.supply_dir` is set, otherwise a fixed reading.
    static std::unique_ptr<io::BatteryGauge> makeGauge(const core::PowerConfig& cfg);

    const PowerMonitor& monitor() const { return monitor_; }

  protected:
    void tick(std::int64_t nowMs) override;
    void pingExtras(nlohmann::json& result) const override;

  private:
    std::unique_ptr<io::BatteryGauge> gauge_;
    PowerMonitor monitor_;
  };

} // namespace hearo::daemons
