/* @file hearo_nfcd.cpp
 * @brief NFC daemon entry point
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>

#include "DaemonMain.hpp"
#include "daemons/NfcDaemon.hpp"

using namespace hearo;

int main(int argc, char** argv) {
  core::Logger log("nfcd");
  return apps::runDaemon(argc, argv, log, [&](const core::HearoConfig& cfg) {
    auto reader = std::make_unique<daemons::Pn532TagReader>(
        cfg.nfc.device, cfg.nfc.address, std::chrono::milliseconds{ cfg.nfc.readTimeoutMs });
    return std::make_unique<daemons::NfcDaemon>(log, cfg, std::move(reader));
  });
}
