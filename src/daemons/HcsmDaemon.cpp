/* @file HcsmDaemon.cpp
 * @brief Orchestrator daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <variant>

#include "core/Logger.hpp"
#include "daemons/HcsmDaemon.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

HcsmDaemon::HcsmDaemon(core::Logger& log, const core::HearoConfig& cfg,
                       std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::HCSM,
                                        cfg.ipc.events,
                                        cfg.hcsm.notify,
                                        cfg.ipc.endpoint(protocols::Peer::HCSM),
                                        std::chrono::milliseconds{ cfg.hcsm.tickMs } },
                   std::move(channel)),
      csm_(publisher_, client_, cfg.hcsm, cfg.ipc.events, log) {}

bool HcsmDaemon::setup() {
  csm_.begin();
  return true;
}

void HcsmDaemon::teardown() { csm_.shutdown(); }

void HcsmDaemon::onEvent(const protocols::Event& ev) {
  const auto before = csm_.state();
  csm_.handleEvent(ev);
  if (csm_.state() != before)
    log_.debug(ev.name + " moved " + core::toString(before) + " -> " + core::toString(csm_.state()));
}

void HcsmDaemon::onReply(const protocols::Message& msg,
                         const std::optional<core::CommandClient::InFlight>& request) {
  const auto* result = std::get_if<protocols::Result>(&msg);
  if (!result || !request)
    return;

  if (!result->ok) {
    log_.warn(request->name + " failed: " +
              (result->error ? result->error->code + " " + result->error->message : "no detail"));
    return;
  }

  if (request->name == names::kWsmCommandStatus)
    csm_.handleNetworkStatus(result->payload);
  else if (request->name == names::kPlsmCommandStatus)
    csm_.handlePlayerStatus(result->payload);
}

void HcsmDaemon::pingExtras(nlohmann::json& result) const { result["system"] = csm_.snapshot(); }
