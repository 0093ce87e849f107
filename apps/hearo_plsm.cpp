/* @file hearo_plsm.cpp
 * @brief player state machine daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>

#include "DaemonMain.hpp"
#include "daemons/PlsmDaemon.hpp"
#include "io/ProcessRunner.hpp"

using namespace hearo;

int main(int argc, char** argv) {
  core::Logger log("plsm");
  io::ProcessRunner runner;
  return apps::runDaemon(argc, argv, log, [&](const core::HearoConfig& cfg) {
    auto backend = std::make_unique<daemons::ShellPlaybackBackend>(
        runner, cfg.player.helper, std::chrono::milliseconds{ cfg.player.helperTimeoutMs });
    auto tags = std::make_unique<daemons::JsonTagStore>(cfg.player.tagMap);
    return std::make_unique<daemons::PlsmDaemon>(log, cfg, std::move(backend), std::move(tags));
  });
}
