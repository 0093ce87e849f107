/* @file hearo_ctl.cpp
 * @brief send one command to a daemon and print its ack and result
 *
 * usage: hearo_ctl [-c config.json] <peer|socket-path> <CMD> [payload-json]
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// Linux headers
#include <unistd.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/CommandClient.hpp"
#include "core/Config.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Endpoint.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "protocols/Codec.hpp"
#include "protocols/EnvelopeFactory.hpp"
#include "protocols/Peer.hpp"

using namespace hearo;

namespace {
  constexpr std::int64_t kTimeoutMs = 3000;

  int usage(const char* self) {
    std::cerr << "usage: " << self << " [-c config.json] <peer|socket-path> <CMD> [payload-json]\n";
    return 2;
  }
} // namespace

int main(int argc, char** argv) {
  std::string configPath = core::ConfigLoader::kDefaultPath;
  std::vector<std::string> rest;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-c" && i + 1 < argc)
      configPath = argv[++i];
    else
      rest.push_back(a);
  }
  if (rest.size() < 2 || rest.size() > 3)
    return usage(argv[0]);

  core::HearoConfig cfg;
  try {
    cfg = core::parseConfig(core::ConfigLoader(configPath).load());
  } catch (const std::exception& e) {
    std::cerr << "hearo_ctl: " << e.what() << '\n';
    return 1;
  }

  nlohmann::json payload = nlohmann::json::object();
  if (rest.size() == 3) {
    payload = nlohmann::json::parse(rest[2], nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
      std::cerr << "hearo_ctl: payload must be a JSON object\n";
      return 2;
    }
  }

  std::string target = rest[0];
  if (auto peer = protocols::peerFromName(target))
    target = cfg.ipc.endpoint(*peer);

  core::Logger log("ctl", core::LogLevel::Warn);
  core::Endpoint endpoint(log);
  const std::string replyPath = "/tmp/hearo/ctl-" + std::to_string(::getpid()) + ".sock";
  if (!endpoint.bind(replyPath)) {
    std::cerr << "hearo_ctl: cannot bind " << replyPath << '\n';
    return 1;
  }

  protocols::EnvelopeFactory factory("ctl");
  core::CommandClient client(endpoint, factory, cfg.ipc, std::make_shared<core::ErrorMonitor>(), log);

  const auto id = client.sendTo(target, rest[1], payload, replyPath, kTimeoutMs);
  if (id.empty()) {
    std::cerr << "hearo_ctl: could not send to " << target << '\n';
    return 1;
  }

  int status = -1;
  const auto deadline = core::steadyMs() + kTimeoutMs;
  while (status < 0 && core::steadyMs() < deadline) {
    const auto wait = std::chrono::milliseconds{ deadline - core::steadyMs() };
    endpoint.pump(
        [&](protocols::Message&& msg) {
          const auto request = client.onReply(msg);
          if (!request || request->id != id)
            return;
          std::cout << nlohmann::json::parse(protocols::toWire(msg)).dump(2) << std::endl;
          if (const auto* ack = std::get_if<protocols::Ack>(&msg)) {
            if (!ack->ok)
              status = 1;
          } else if (const auto* res = std::get_if<protocols::Result>(&msg)) {
            status = res->ok ? 0 : 1;
          }
        },
        wait);
  }

  if (status < 0) {
    std::cerr << "hearo_ctl: no result within " << kTimeoutMs << " ms\n";
    return 3;
  }
  return status;
}
