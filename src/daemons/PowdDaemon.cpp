/* @file PowdDaemon.cpp
 * @brief Power daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>

#include "daemons/PowdDaemon.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

std::unique_ptr<hearo::io::BatteryGauge> PowdDaemon::makeGauge(const core::PowerConfig& cfg) {
  if (!cfg.supplyDir.empty())
    return std::make_unique<io::SysfsBatteryGauge>(cfg.supplyDir, cfg.onlinePath);
  return std::make_unique<io::FixedBatteryGauge>(io::BatteryReading{ cfg.fixedSoc, false });
}

PowdDaemon::PowdDaemon(core::Logger& log, const core::HearoConfig& cfg,
                       std::unique_ptr<io::BatteryGauge> gauge,
                       std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::POWD,
                                        cfg.ipc.endpoint(protocols::Peer::POWD),
                                        { cfg.ipc.events },
                                        {},
                                        std::chrono::milliseconds{ cfg.power.tickMs } },
                   std::move(channel)),
      gauge_(std::move(gauge)), monitor_(publisher_, *errors_, *gauge_, cfg.power) {

  addCommand(names::kPowdCmdStatus, [this](const protocols::Command&) {
    return core::CommandOutcome::done(monitor_.status());
  });
}

void PowdDaemon::tick(std::int64_t nowMs) { monitor_.sample(nowMs); }

void PowdDaemon::pingExtras(nlohmann::json& result) const {
  const auto band = monitor_.band();
  result["band"] = band ? nlohmann::json(toString(*band)) : nlohmann::json(nullptr);
}
