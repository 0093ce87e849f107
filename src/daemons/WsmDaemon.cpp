/* @file WsmDaemon.cpp
 * @brief Wi-Fi daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <cstring>

#include "core/Logger.hpp"
#include "daemons/WsmDaemon.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

WsmDaemon::WsmDaemon(core::Logger& log, const core::HearoConfig& cfg,
                     std::unique_ptr<WifiControl> control,
                     std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::WSM,
                                        cfg.ipc.endpoint(protocols::Peer::WSM),
                                        { cfg.ipc.events },
                                        {},
                                        std::chrono::milliseconds{ cfg.wifi.tickMs } },
                   std::move(channel)),
      control_(std::move(control)), fsm_(publisher_, *errors_, *control_, cfg.wifi) {

  addCommand(names::kWsmCommandStatus, [this](const protocols::Command&) {
    return core::CommandOutcome::done(fsm_.status(core::steadyMs()));
  });
}

void WsmDaemon::tick(std::int64_t nowMs) {
  fsm_.tick(nowMs);
  if (!lastState_ || std::strcmp(lastState_, fsm_.stateName()) != 0) {
    log_.info(std::string("state ") + (lastState_ ? lastState_ : "-") + " -> " + fsm_.stateName());
    lastState_ = fsm_.stateName();
  }
}

void WsmDaemon::pingExtras(nlohmann::json& result) const {
  result["state"] = fsm_.stateName();
  result["ap_active"] = fsm_.apActive();
  result["station_connected"] = fsm_.station().connected;
}
