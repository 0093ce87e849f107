/* @file hearo_powd.cpp
 * @brief power daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "DaemonMain.hpp"
#include "daemons/PowdDaemon.hpp"

using namespace hearo;

int main(int argc, char** argv) {
  core::Logger log("powd");
  return apps::runDaemon(argc, argv, log, [&](const core::HearoConfig& cfg) {
    return std::make_unique<daemons::PowdDaemon>(log, cfg,
                                                 daemons::PowdDaemon::makeGauge(cfg.power));
  });
}
