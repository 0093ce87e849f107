/* @file hearo_bd.cpp
 * @brief button daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "DaemonMain.hpp"
#include "daemons/BdDaemon.hpp"

int main(int argc, char** argv) {
  hearo::core::Logger log("bd");
  return hearo::apps::runDaemon(argc, argv, log, [&](const hearo::core::HearoConfig& cfg) {
    return std::make_unique<hearo::daemons::BdDaemon>(log, cfg);
  });
}
