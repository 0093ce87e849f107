/* @file EnvelopeFactory.cpp
 * @brief id + timestamp stamping
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>

// Hearo headers
#include "protocols/EnvelopeFactory.hpp"

using namespace hearo::protocols;

std::int64_t hearo::protocols::epochMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

EnvelopeFactory::EnvelopeFactory(std::string origin, Clock clock)
    : origin_(std::move(origin)), clock_(std::move(clock)) {}

Header EnvelopeFactory::nextHeader(const char* kindTag, std::uint64_t& counter) {
  Header h;
  h.id = std::string(kindTag) + "-" + origin_ + "-" + std::to_string(++counter);
  h.timestamp = clock_();
  return h;
}

Event EnvelopeFactory::makeEvent(std::string_view name, nlohmann::json payload) {
  Event ev;
  ev.header = nextHeader("evt", eventCounter_);
  ev.name = std::string(name);
  ev.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
  return ev;
}

Command EnvelopeFactory::makeCommand(std::string_view name, nlohmann::json payload,
                                     std::string replyEndpoint, std::int64_t timeoutMs) {
  Command cmd;
  cmd.header = nextHeader("cmd", commandCounter_);
  cmd.name = std::string(name);
  cmd.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
  cmd.replyEndpoint = std::move(replyEndpoint);
  cmd.timeoutMs = timeoutMs;
  cmd.origin = origin_;
  return cmd;
}

Ack EnvelopeFactory::makeAck(const Command& cmd, bool ok, std::optional<ErrorInfo> error) {
  Ack ack;
  ack.header = nextHeader("ack", ackCounter_);
  ack.correlatesTo = cmd.header.id;
  ack.ok = ok;
  if (!ok)
    ack.error = std::move(error);
  return ack;
}

Result EnvelopeFactory::makeResult(const Command& cmd, bool ok, nlohmann::json payload,
                                   std::optional<ErrorInfo> error) {
  Result res;
  res.header = nextHeader("res", resultCounter_);
  res.correlatesTo = cmd.header.id;
  res.ok = ok;
  res.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
  if (!ok)
    res.error = std::move(error);
  return res;
}
