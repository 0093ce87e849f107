/* @file hearo_monitor.cpp
 * @brief bus sniffer: print every envelope that reaches an endpoint
 *
 * usage: hearo_monitor [-c config.json] [endpoint] [logfile]
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

// Linux headers
#include <signal.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/Config.hpp"
#include "core/ConfigLoader.hpp"
#include "io/DatagramChannel.hpp"
#include "io/FileLogger.hpp"
#include "protocols/Codec.hpp"

using namespace hearo;

namespace {
  volatile std::sig_atomic_t gStop = 0;
  extern "C" void onSignal(int) { gStop = 1; }
} // namespace

int main(int argc, char** argv) {
  std::string configPath = core::ConfigLoader::kDefaultPath;
  std::string path;
  std::string logPath;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-c" && i + 1 < argc)
      configPath = argv[++i];
    else if (path.empty())
      path = a;
    else
      logPath = a;
  }

  if (path.empty()) {
    try {
      path = core::parseConfig(core::ConfigLoader(configPath).load()).ipc.events;
    } catch (const std::exception& e) {
      std::cerr << "hearo_monitor: " << e.what() << '\n';
      return 1;
    }
  }

  io::FileLogger file;
  if (!logPath.empty() && !file.open(logPath)) {
    std::cerr << "hearo_monitor: cannot open " << logPath << '\n';
    return 1;
  }

  io::DatagramChannel channel;
  if (!channel.bind(path)) {
    std::cerr << "hearo_monitor: bind " << path << ": " << channel.lastError() << '\n';
    return 1;
  }

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  std::cout << "listening on " << path << std::endl;
  while (!gStop) {
    auto raw = channel.receive(std::chrono::milliseconds{ 500 });
    if (!raw)
      continue;

    std::string reason;
    std::string line;
    if (auto msg = protocols::fromWire(*raw, &reason))
      line = nlohmann::json::parse(protocols::toWire(*msg)).dump(2);
    else
      line = "INVALID (" + reason + "): " + *raw;

    std::cout << line << std::endl;
    if (!logPath.empty()) {
      file.write(line + "\n");
      if (!file.flush())
        std::cerr << "hearo_monitor: write to " << logPath << " failed\n";
    }
  }
  return 0;
}
