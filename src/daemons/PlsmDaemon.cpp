/* @file PlsmDaemon.cpp
 * @brief Player daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <cstring>

#include "core/Logger.hpp"
#include "daemons/PlsmDaemon.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
using hearo::core::CommandOutcome;
using hearo::protocols::Command;
namespace names = hearo::protocols::names;

PlsmDaemon::PlsmDaemon(core::Logger& log, const core::HearoConfig& cfg,
                       std::unique_ptr<PlaybackBackend> backend, std::unique_ptr<TagStore> tags,
                       std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::PLSM,
                                        cfg.ipc.endpoint(protocols::Peer::PLSM),
                                        { cfg.ipc.events },
                                        {},
                                        std::chrono::milliseconds{ cfg.player.tickMs } },
                   std::move(channel)),
      backend_(std::move(backend)), tags_(std::move(tags)),
      fsm_(publisher_, *errors_, *backend_, *tags_, cfg.player) {

  addCommand(names::kPlsmCommandPlayTag, [this](const Command& c) {
    return fsm_.playTag(c.payload, core::steadyMs());
  });
  addCommand(names::kPlsmCommandPlay, [this](const Command& c) {
    return fsm_.play(c.payload, core::steadyMs());
  });
  addCommand(names::kPlsmCommandStop,
             [this](const Command&) { return fsm_.stop(core::steadyMs()); });
  addCommand(names::kPlsmCommandNext,
             [this](const Command&) { return fsm_.next(core::steadyMs()); });
  addCommand(names::kPlsmCommandPrevious,
             [this](const Command&) { return fsm_.previous(core::steadyMs()); });
  addCommand(names::kPlsmCommandSeek, [this](const Command& c) {
    return fsm_.seek(c.payload, core::steadyMs());
  });
  addCommand(names::kPlsmCommandStatus, [this](const Command&) {
    return CommandOutcome::done(fsm_.status(core::steadyMs()));
  });
  addCommand(names::kPlsmCommandShutdown, [this](const Command&) {
    auto outcome = fsm_.shutdown(core::steadyMs());
    requestStop("shutdown_command");
    return outcome;
  });
}

void PlsmDaemon::tick(std::int64_t nowMs) {
  fsm_.tick(nowMs);
  if (!lastState_ || std::strcmp(lastState_, fsm_.stateName()) != 0) {
    log_.info(std::string("state ") + (lastState_ ? lastState_ : "-") + " -> " + fsm_.stateName());
    lastState_ = fsm_.stateName();
  }
}

void PlsmDaemon::pingExtras(nlohmann::json& result) const {
  result["state"] = fsm_.stateName();
  result["auth"] = PlayerStateMachine::authName(fsm_.auth());
}
