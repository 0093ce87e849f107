#pragma once
/** @file  WifiControl.hpp
 *  @brief Wi-Fi station / access-point control seam and its OS-tool implementation.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// Hearo headers
#include "core/Config.hpp"
#include "io/ProcessRunner.hpp"

namespace hearo::daemons {

  struct StationStatus {
    bool connected{ false };
    std::string ssid{};
    std::string ip{};
    std::optional<int> rssi{};
  };

  /**
 * @class WifiControl
 * @brief Everything the Wi-Fi FSM needs from the OS; failures throw core::PeerError.
 */
  class WifiControl {
  public:
    virtual ~WifiControl() = default;

    virtual bool stackAvailable() = 0;
    virtual StationStatus station() = 0;
    virtual void reconnect() = 0;
    virtual bool internetReachable() = 0;
    virtual void startAp() = 0;
    virtual void stopAp() = 0;
  };

  /**
 * @class ShellWifiControl
 * @brief wpa_cli / iwgetid / hostname / iw / ping / systemctl through ProcessRunner.
 *
 *  * A tool that cannot be spawned is ResourceUnavailable, one that times out
 *    is Transient; a non-zero exit simply means "no" for queries.
 */
  class ShellWifiControl : public WifiControl {
  public:
    ShellWifiControl(io::ProcessRunner& runner, core::WifiConfig cfg);

    bool stackAvailable() override;
    StationStatus station() override;
    void reconnect() override;
    bool internetReachable() override;
    void startAp() override;
    void stopAp() override;

  private:
    io::ProcessResult run(const std::vector<std::string>& argv);

    io::ProcessRunner& runner_;
    core::WifiConfig cfg_;
  };

} // namespace hearo::daemons
