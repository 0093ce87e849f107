/* @file NfcDaemon.cpp
 * @brief NFC daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>

#include "core/Logger.hpp"
#include "daemons/NfcDaemon.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

NfcDaemon::NfcDaemon(core::Logger& log, const core::HearoConfig& cfg,
                     std::unique_ptr<TagReader> reader,
                     std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::NFC,
                                        cfg.ipc.endpoint(protocols::Peer::NFC),
                                        { cfg.ipc.events },
                                        {},
                                        std::chrono::milliseconds{ cfg.nfc.readIntervalMs } },
                   std::move(channel)),
      reader_(std::move(reader)), fsm_(publisher_, *errors_, *reader_, cfg.nfc) {

  addCommand(names::kNfcCmdRestart, [this](const protocols::Command&) {
    log_.info("reader restart requested");
    fsm_.requestRestart();
    return core::CommandOutcome::done({ { "restarting", true } });
  });
}

void NfcDaemon::tick(std::int64_t nowMs) { fsm_.tick(nowMs); }

void NfcDaemon::teardown() { reader_->close(); }

void NfcDaemon::pingExtras(nlohmann::json& result) const {
  const auto st = fsm_.status(0);
  result["state"] = st["state"];
  result["tag"] = st["tag"];
}
