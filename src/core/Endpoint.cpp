/* @file Endpoint.cpp
 * @brief envelope codec on top of DatagramChannel
 *
 * © 2025 Hearo — MIT-licensed.
 */

// Hearo headers
#include "core/Endpoint.hpp"
#include "core/Logger.hpp"
#include "protocols/Codec.hpp"

using namespace hearo::core;

Endpoint::Endpoint(Logger& log, std::unique_ptr<io::DatagramChannel> channel)
    : log_(log), channel_(std::move(channel)) {}

bool Endpoint::bind(const std::string& path) {
  if (!channel_->bind(path)) {
    log_.error("bind " + path + " failed: " + channel_->lastError());
    return false;
  }
  if (!channel_->lastError().empty())
    log_.warn("bound " + path + " with warning: " + channel_->lastError());
  log_.debug("bound " + path);
  return true;
}

bool Endpoint::send(const std::string& to, const protocols::Message& msg) {
  const std::string wire = protocols::toWire(msg);
  if (channel_->sendTo(to, wire)) {
    log_.debug("-> " + to + " " + wire);
    return true;
  }
  ++sendFailures_;
  log_.warn("send to " + to + " failed (" + channel_->lastError() + "), " +
            protocols::headerOf(msg).id + " lost");
  return false;
}

std::size_t Endpoint::pump(const Handler& handler, std::chrono::milliseconds wait) {
  std::size_t delivered = 0;
  auto budget = wait;

  for (std::size_t i = 0; i < kMaxDrain; ++i) {
    auto raw = channel_->receive(budget);
    if (!raw)
      break;
    budget = std::chrono::milliseconds{ 0 }; // drain without blocking

    std::string reason;
    auto msg = protocols::fromWire(*raw, &reason);
    if (!msg) {
      ++dropped_;
      log_.warn("dropping malformed datagram: " + reason);
      continue;
    }
    log_.debug("<- " + *raw);
    handler(std::move(*msg));
    ++delivered;
  }
  return delivered;
}
