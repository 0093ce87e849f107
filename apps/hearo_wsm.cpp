/* @file hearo_wsm.cpp
 * @brief Wi-Fi state machine daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "DaemonMain.hpp"
#include "daemons/WsmDaemon.hpp"
#include "io/ProcessRunner.hpp"

using namespace hearo;

int main(int argc, char** argv) {
  core::Logger log("wsm");
  io::ProcessRunner runner; // outlives the daemon
  return apps::runDaemon(argc, argv, log, [&](const core::HearoConfig& cfg) {
    return std::make_unique<daemons::WsmDaemon>(
        log, cfg, std::make_unique<daemons::ShellWifiControl>(runner, cfg.wifi));
  });
}
