/* @file WifiControl.cpp
 * @brief Wi-Fi status and AP control via OS network tools
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <sstream>

// Hearo headers
#include "core/PeerError.hpp"
#include "daemons/WifiControl.hpp"

using namespace hearo::daemons;
using hearo::core::FailureClass;
using hearo::core::PeerError;

namespace {
  std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

  /// value of `key=value` in wpa_cli style output, "" if absent
  std::string keyValue(const std::string& text, const std::string& key) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
      if (line.rfind(key + "=", 0) == 0)
        return trim(line.substr(key.size() + 1));
    }
    return {};
  }
} // namespace

ShellWifiControl::ShellWifiControl(io::ProcessRunner& runner, core::WifiConfig cfg)
    : runner_(runner), cfg_(std::move(cfg)) {}

hearo::io::ProcessResult ShellWifiControl::run(const std::vector<std::string>& argv) {
  auto res = runner_.run(argv, std::chrono::milliseconds{ cfg_.toolTimeoutMs });
  if (!res)
    throw PeerError(FailureClass::ResourceUnavailable, "WIFI_TOOL_UNAVAILABLE",
                    argv.front() + ": " + runner_.lastError());
  if (res->timedOut)
    throw PeerError(FailureClass::Transient, "WIFI_TOOL_TIMEOUT", argv.front() + " timed out");
  return *res;
}

bool ShellWifiControl::stackAvailable() { return run({ "which", "wpa_cli" }).exitCode == 0; }

StationStatus ShellWifiControl::station() {
  StationStatus st;

  auto res = run({ "wpa_cli", "-i", cfg_.interface, "status" });
  if (res.exitCode == 0)
    st.ssid = keyValue(res.output, "ssid");
  if (st.ssid.empty()) {
    res = run({ "iwgetid", "-r" });
    if (res.exitCode == 0)
      st.ssid = trim(res.output);
  }

  res = run({ "hostname", "-I" });
  if (res.exitCode == 0) {
    std::istringstream in(res.output);
    in >> st.ip;
  }

  res = run({ "iw", "dev", cfg_.interface, "link" });
  if (res.exitCode == 0) {
    std::istringstream in(res.output);
    std::string line;
    while (std::getline(in, line)) {
      line = trim(line);
      if (line.rfind("signal:", 0) != 0)
        continue;
      std::istringstream fields(line.substr(7));
      int dbm = 0;
      if (fields >> dbm)
        st.rssi = dbm;
    }
  }

  st.connected = !st.ssid.empty() && !st.ip.empty();
  return st;
}

void ShellWifiControl::reconnect() {
  // non-zero exit just means wpa_cli was already associated
  (void)run({ "wpa_cli", "-i", cfg_.interface, "reconnect" });
}

bool ShellWifiControl::internetReachable() {
  return run({ "ping", "-c", "1", "-W", "2", cfg_.probeHost }).exitCode == 0;
}

void ShellWifiControl::startAp() {
  if (cfg_.apStartCmd.empty())
    return;
  const auto res = run(cfg_.apStartCmd);
  if (res.exitCode != 0)
    throw PeerError(FailureClass::ResourceUnavailable, "AP_START_FAILED",
                    "exit status " + std::to_string(res.exitCode));
}

void ShellWifiControl::stopAp() {
  if (cfg_.apStopCmd.empty())
    return;
  const auto res = run(cfg_.apStopCmd);
  if (res.exitCode != 0)
    throw PeerError(FailureClass::Transient, "AP_STOP_FAILED",
                    "exit status " + std::to_string(res.exitCode));
}
