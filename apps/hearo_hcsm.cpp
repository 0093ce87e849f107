/* @file hearo_hcsm.cpp
 * @brief orchestrator daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "DaemonMain.hpp"
#include "daemons/HcsmDaemon.hpp"

int main(int argc, char** argv) {
  hearo::core::Logger log("hcsm");
  return hearo::apps::runDaemon(argc, argv, log, [&](const hearo::core::HearoConfig& cfg) {
    return std::make_unique<hearo::daemons::HcsmDaemon>(log, cfg);
  });
}
