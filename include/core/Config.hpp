#pragma once
/** @file  Config.hpp
 *  @brief Typed view of hearo.json; every field has a built-in default.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

// Hearo headers
#include "protocols/Peer.hpp"

namespace hearo::core {

  /// Socket paths of the bus and of every daemon's command endpoint.
  struct IpcConfig {
    std::string events{ "/tmp/hearo/events.sock" };
    std::array<std::string, static_cast<std::size_t>(protocols::Peer::Count)> endpoints{
      "/tmp/hearo/nfcd.sock",     // NFC
      "/tmp/hearo/bd.sock",       // BD
      "/tmp/hearo/ledd.sock",     // LEDD
      "/tmp/hearo/wsm.sock",      // WSM
      "/tmp/hearo/psm_cmd.sock",  // PLSM
      "/tmp/hearo/powd.sock",     // POWD
      "/tmp/hearo/hcsm_cmd.sock", // HCSM
    };

    const std::string& endpoint(protocols::Peer p) const {
      return endpoints[static_cast<std::size_t>(p)];
    }
  };

  struct ButtonLineConfig {
    std::string name;
    unsigned int line{ 0 };
    int longThresholdMs{ -1 }; ///< -1: use ButtonsConfig::longThresholdMs
  };

  struct ButtonsConfig {
    std::string chip{ "/dev/gpiochip0" };
    bool activeLow{ true };
    std::vector<ButtonLineConfig> lines{
      { "NEXT", 17, -1 }, { "PREV", 22, -1 }, { "VOL_UP", 23, -1 },
      { "VOL_DOWN", 27, -1 }, { "RESET", 24, -1 },
    };
    int debounceMs{ 30 };
    int shortMinMs{ 50 };
    int longThresholdMs{ 800 };
    int resetLongThresholdMs{ 5000 }; ///< applied to the line named RESET
    int holdTickMs{ 250 };
    int pollMs{ 10 };
  };

  struct NfcConfig {
    std::string device{ "/dev/i2c-1" };
    std::uint8_t address{ 0x24 };
    int readIntervalMs{ 50 };
    int readTimeoutMs{ 30 };
    int debounceMs{ 300 };
    int missReleaseMs{ 600 };
    int heartbeatMs{ 1000 };
    int retryInitialMs{ 1000 };
    int retryMaxMs{ 30000 };
  };

  struct WifiConfig {
    std::string interface{ "wlan0" };
    std::string apSsid{ "Hearo-Setup" };
    int apChannel{ 6 };
    std::string apSecurity{ "WPA2-PSK" };
    std::vector<std::string> apStartCmd{ "systemctl", "start", "hearo-ap.target" };
    std::vector<std::string> apStopCmd{ "systemctl", "stop", "hearo-ap.target" };
    std::string probeHost{ "api.spotify.com" };
    int tickMs{ 500 };
    int stationRefreshMs{ 5000 };
    int connectivityCheckMs{ 10000 };
    int backoffInitialMs{ 5000 };
    int backoffMaxMs{ 60000 };
    int toolTimeoutMs{ 5000 };
  };

  struct PlayerConfig {
    std::vector<std::string> helper{ "/usr/lib/hearo/hearo-playctl" };
    std::string tagMap{ "/var/lib/hearo/tags.json" };
    int tickMs{ 200 };
    int progressIntervalMs{ 2000 };
    int backoffInitialMs{ 2000 };
    int backoffMaxMs{ 60000 };
    int helperTimeoutMs{ 10000 };
  };

  struct PowerConfig {
    std::string supplyDir{};   ///< e.g. /sys/class/power_supply/BAT0; empty -> fixed reading
    std::string onlinePath{};  ///< optional AC/USB `online` file
    int fixedSoc{ 80 };
    int lowPct{ 20 };
    int critPct{ 5 };
    int tickMs{ 1000 };
    int heartbeatMs{ 30000 };
  };

  struct HcsmConfig {
    std::vector<protocols::Peer> requiredPeers{
      protocols::Peer::NFC, protocols::Peer::BD,   protocols::Peer::LEDD,
      protocols::Peer::WSM, protocols::Peer::PLSM, protocols::Peer::POWD,
    };
    std::int64_t seekDeltaMs{ 15000 };
    std::vector<std::string> notify{ "/tmp/hearo/ledd.sock" };
    int tickMs{ 50 };
  };

  struct LogConfig {
    std::string level{ "info" };
    std::string file{};
    std::size_t maxBytes{ 1024 * 1024 };
    unsigned int backups{ 3 };
  };

  struct HearoConfig {
    IpcConfig ipc;
    ButtonsConfig buttons;
    NfcConfig nfc;
    WifiConfig wifi;
    PlayerConfig player;
    PowerConfig power;
    HcsmConfig hcsm;
    LogConfig log;
  };

  /**
   * @brief Overlay \p j on the defaults.
   *
   * Unknown keys are ignored; a key with the wrong JSON type, an unknown peer
   * name or a bad log level throws `std::runtime_error` naming the key.
   */
  HearoConfig parseConfig(const nlohmann::json& j);

} // namespace hearo::core
