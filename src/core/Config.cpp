/* @file Config.cpp
 * @brief hearo.json -> HearoConfig
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/Config.hpp"
#include "core/Logger.hpp"

using namespace hearo::core;
using nlohmann::json;
using hearo::protocols::Peer;

namespace {

  // copy j[key] into out when present; wrong type -> runtime_error naming the key
  template <typename T>
  void read(const json& j, const char* section, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return;
    try {
      out = it->get<T>();
    } catch (const json::exception& e) {
      throw std::runtime_error(std::string("[Config] ") + section + "." + key + ": " + e.what());
    }
  }

  const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end())
      return empty;
    if (!it->is_object())
      throw std::runtime_error(std::string("[Config] section '") + name + "' must be an object");
    return *it;
  }

  Peer peerOrThrow(const std::string& name) {
    auto p = hearo::protocols::peerFromName(name);
    if (!p)
      throw std::runtime_error("[Config] unknown peer '" + name + "'");
    return *p;
  }

  void parseIpc(const json& s, IpcConfig& c) {
    read(s, "ipc", "events", c.events);
    for (auto p : hearo::protocols::kAllPeers) {
      read(s, "ipc", hearo::protocols::toString(p), c.endpoints[static_cast<std::size_t>(p)]);
    }
  }

  void parseButtons(const json& s, ButtonsConfig& c) {
    read(s, "buttons", "chip", c.chip);
    read(s, "buttons", "active_low", c.activeLow);
    read(s, "buttons", "debounce_ms", c.debounceMs);
    read(s, "buttons", "short_min_ms", c.shortMinMs);
    read(s, "buttons", "long_threshold_ms", c.longThresholdMs);
    read(s, "buttons", "reset_long_threshold_ms", c.resetLongThresholdMs);
    read(s, "buttons", "hold_tick_ms", c.holdTickMs);
    read(s, "buttons", "poll_ms", c.pollMs);

    auto it = s.find("lines");
    if (it == s.end())
      return;
    if (!it->is_object())
      throw std::runtime_error("[Config] buttons.lines must map name -> line number");
    c.lines.clear();
    for (const auto& [name, value] : it->items()) {
      ButtonLineConfig line;
      line.name = name;
      if (value.is_number_unsigned()) {
        line.line = value.get<unsigned int>();
      } else if (value.is_object()) {
        read(value, "buttons.lines", "line", line.line);
        read(value, "buttons.lines", "long_threshold_ms", line.longThresholdMs);
      } else {
        throw std::runtime_error("[Config] buttons.lines." + name + ": expected a line number");
      }
      c.lines.push_back(line);
    }
  }

  void parseNfc(const json& s, NfcConfig& c) {
    read(s, "nfc", "device", c.device);
    read(s, "nfc", "address", c.address);
    read(s, "nfc", "read_interval_ms", c.readIntervalMs);
    read(s, "nfc", "read_timeout_ms", c.readTimeoutMs);
    read(s, "nfc", "debounce_ms", c.debounceMs);
    read(s, "nfc", "miss_release_ms", c.missReleaseMs);
    read(s, "nfc", "heartbeat_ms", c.heartbeatMs);
    read(s, "nfc", "retry_initial_ms", c.retryInitialMs);
    read(s, "nfc", "retry_max_ms", c.retryMaxMs);
  }

  void parseWifi(const json& s, WifiConfig& c) {
    read(s, "wifi", "interface", c.interface);
    read(s, "wifi", "ap_ssid", c.apSsid);
    read(s, "wifi", "ap_channel", c.apChannel);
    read(s, "wifi", "ap_security", c.apSecurity);
    read(s, "wifi", "ap_start_cmd", c.apStartCmd);
    read(s, "wifi", "ap_stop_cmd", c.apStopCmd);
    read(s, "wifi", "probe_host", c.probeHost);
    read(s, "wifi", "tick_ms", c.tickMs);
    read(s, "wifi", "station_refresh_ms", c.stationRefreshMs);
    read(s, "wifi", "connectivity_check_ms", c.connectivityCheckMs);
    read(s, "wifi", "backoff_initial_ms", c.backoffInitialMs);
    read(s, "wifi", "backoff_max_ms", c.backoffMaxMs);
    read(s, "wifi", "tool_timeout_ms", c.toolTimeoutMs);
  }

  void parsePlayer(const json& s, PlayerConfig& c) {
    read(s, "player", "helper", c.helper);
    read(s, "player", "tag_map", c.tagMap);
    read(s, "player", "tick_ms", c.tickMs);
    read(s, "player", "progress_interval_ms", c.progressIntervalMs);
    read(s, "player", "backoff_initial_ms", c.backoffInitialMs);
    read(s, "player", "backoff_max_ms", c.backoffMaxMs);
    read(s, "player", "helper_timeout_ms", c.helperTimeoutMs);
    if (c.helper.empty())
      throw std::runtime_error("[Config] player.helper must not be empty");
  }

  void parsePower(const json& s, PowerConfig& c) {
    read(s, "power", "supply_dir", c.supplyDir);
    read(s, "power", "online_path", c.onlinePath);
    read(s, "power", "fixed_soc", c.fixedSoc);
    read(s, "power", "low_pct", c.lowPct);
    read(s, "power", "crit_pct", c.critPct);
    read(s, "power", "tick_ms", c.tickMs);
    read(s, "power", "heartbeat_ms", c.heartbeatMs);
  }

  void parseHcsm(const json& s, HcsmConfig& c) {
    std::vector<std::string> names;
    read(s, "hcsm", "required_peers", names);
    if (s.contains("required_peers")) {
      c.requiredPeers.clear();
      for (const auto& n : names)
        c.requiredPeers.push_back(peerOrThrow(n));
    }
    read(s, "hcsm", "seek_delta_ms", c.seekDeltaMs);
    read(s, "hcsm", "notify", c.notify);
    read(s, "hcsm", "tick_ms", c.tickMs);
  }

  void parseLog(const json& s, LogConfig& c) {
    read(s, "log", "level", c.level);
    read(s, "log", "file", c.file);
    read(s, "log", "max_bytes", c.maxBytes);
    read(s, "log", "backups", c.backups);
    if (!parseLevel(c.level))
      throw std::runtime_error("[Config] log.level: unknown level '" + c.level + "'");
  }

} // namespace

HearoConfig hearo::core::parseConfig(const json& j) {
  if (!j.is_object())
    throw std::runtime_error("[Config] top level must be an object");

  HearoConfig cfg;
  parseIpc(section(j, "ipc"), cfg.ipc);
  parseButtons(section(j, "buttons"), cfg.buttons);
  parseNfc(section(j, "nfc"), cfg.nfc);
  parseWifi(section(j, "wifi"), cfg.wifi);
  parsePlayer(section(j, "player"), cfg.player);
  parsePower(section(j, "power"), cfg.power);
  parseHcsm(section(j, "hcsm"), cfg.hcsm);
  parseLog(section(j, "log"), cfg.log);
  return cfg;
}
