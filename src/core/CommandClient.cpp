/* @file CommandClient.cpp
 * @brief sends commands to peers, tracks the ones that expect an answer
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <variant>

// Hearo headers
#include "core/CommandClient.hpp"
#include "core/Endpoint.hpp"
#include "core/Logger.hpp"
#include "protocols/EnvelopeFactory.hpp"

using namespace hearo::core;

std::int64_t hearo::core::steadyMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

CommandClient::CommandClient(Endpoint& endpoint, protocols::EnvelopeFactory& factory,
                             const IpcConfig& ipc, std::shared_ptr<ErrorMonitor> errorMonitor,
                             Logger& log)
    : endpoint_(endpoint), factory_(factory), ipc_(ipc), errorMonitor_(std::move(errorMonitor)),
      log_(log), clock_(steadyMs) {
  if (!errorMonitor_)
    throw std::invalid_argument("[CommandClient] error monitor is nullptr");
}

std::string CommandClient::send(protocols::Peer peer, std::string_view name,
                                nlohmann::json payload, std::string replyTo,
                                std::int64_t timeoutMs) {
  return sendTo(ipc_.endpoint(peer), name, std::move(payload), std::move(replyTo), timeoutMs);
}

std::string CommandClient::sendTo(const std::string& path, std::string_view name,
                                  nlohmann::json payload, std::string replyTo,
                                  std::int64_t timeoutMs) {
  const bool tracked = !replyTo.empty();
  auto cmd = factory_.makeCommand(name, std::move(payload), std::move(replyTo), timeoutMs);

  if (!endpoint_.send(path, cmd)) {
    errorMonitor_->notifyFailure("CMD_SEND_FAILED",
                                 std::string(name) + " could not be sent to " + path);
    return {};
  }

  errorMonitor_->clear("CMD_SEND_FAILED");
  log_.debug("sent " + cmd.name + " (" + cmd.header.id + ") to " + path);
  if (tracked)
    pending_.push_back(InFlight{ cmd.header.id, path, cmd.name, clock_() + timeoutMs });
  return cmd.header.id;
}

std::optional<CommandClient::InFlight> CommandClient::onReply(const protocols::Message& msg) {
  std::string corr;
  bool retire = false;

  std::visit(
      [&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocols::Ack>) {
          corr = m.correlatesTo;
          retire = !m.ok;
        } else if constexpr (std::is_same_v<T, protocols::Result>) {
          corr = m.correlatesTo;
          retire = true;
        }
      },
      msg);

  if (corr.empty())
    return std::nullopt;

  auto it = std::find_if(pending_.begin(), pending_.end(),
                         [&](const InFlight& f) { return f.id == corr; });
  if (it == pending_.end()) {
    log_.debug("reply for untracked command " + corr);
    return std::nullopt;
  }

  InFlight found = *it;
  if (retire)
    pending_.erase(it);
  return found;
}

std::size_t CommandClient::expire(std::int64_t now) {
  auto first = std::stable_partition(pending_.begin(), pending_.end(),
                                     [now](const InFlight& f) { return f.deadline > now; });
  const auto n = static_cast<std::size_t>(std::distance(first, pending_.end()));
  for (auto it = first; it != pending_.end(); ++it)
    log_.warn(it->name + " (" + it->id + ") to " + it->target + " timed out");
  pending_.erase(first, pending_.end());
  return n;
}

bool CommandClient::pending(const std::string& id) const {
  return std::any_of(pending_.begin(), pending_.end(),
                     [&](const InFlight& f) { return f.id == id; });
}
