/* @file BdDaemon.cpp
 * @brief button daemon wiring
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <string>

#include "core/Logger.hpp"
#include "daemons/BdDaemon.hpp"

using namespace hearo::daemons;
using std::chrono::milliseconds;

BdDaemon::BdDaemon(core::Logger& log, const core::HearoConfig& cfg, LineFactory lines,
                   std::unique_ptr<io::DatagramChannel> channel)
    : core::Daemon(log, cfg.ipc,
                   core::DaemonOptions{ protocols::Peer::BD,
                                        cfg.ipc.endpoint(protocols::Peer::BD),
                                        { cfg.ipc.events },
                                        {},
                                        milliseconds{ cfg.buttons.pollMs } },
                   std::move(channel)),
      cfg_(cfg.buttons), makeLine_(std::move(lines)), monitor_(publisher_, *errors_) {}

hearo::io::ClassifierConfig BdDaemon::classifierFor(const core::ButtonsConfig& cfg,
                                                    const core::ButtonLineConfig& line) {
  io::ClassifierConfig c;
  c.debounce = milliseconds{ cfg.debounceMs };
  c.shortMin = milliseconds{ cfg.shortMinMs };
  c.holdTickInterval = milliseconds{ cfg.holdTickMs };

  int longMs = line.name == "RESET" ? cfg.resetLongThresholdMs : cfg.longThresholdMs;
  if (line.longThresholdMs >= 0)
    longMs = line.longThresholdMs;
  c.longThreshold = milliseconds{ longMs };
  return c;
}

bool BdDaemon::setup() {
  for (const auto& line : cfg_.lines) {
    auto gpio = makeLine_();
    if (!gpio->open(cfg_.chip, line.line, cfg_.activeLow, "hearo-bd")) {
      errors_->notifyFailure("GPIO_OPEN_FAILED",
                             line.name + " (line " + std::to_string(line.line) +
                                 "): " + gpio->lastError(),
                             false);
      return false;
    }
    monitor_.add(
        std::make_unique<io::ButtonGPIO>(line.name, std::move(gpio), classifierFor(cfg_, line)));
    log_.info("button " + line.name + " on " + cfg_.chip + ":" + std::to_string(line.line));
  }
  return true;
}

void BdDaemon::tick(std::int64_t nowMs) { monitor_.poll(milliseconds{ nowMs }); }

void BdDaemon::pingExtras(nlohmann::json& result) const {
  result["buttons"] = monitor_.names();
  result["last_button"] =
      monitor_.lastButton().empty() ? nlohmann::json(nullptr) : nlohmann::json(monitor_.lastButton());
}
