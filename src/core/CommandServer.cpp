/* @file CommandServer.cpp
 * @brief command -> ack (+ result)
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <exception>

#include "core/CommandServer.hpp"
#include "core/Endpoint.hpp"
#include "core/Logger.hpp"
#include "protocols/EnvelopeFactory.hpp"
#include "protocols/Names.hpp"

using namespace hearo::core;
namespace names = hearo::protocols::names;

CommandServer::CommandServer(Endpoint& endpoint, protocols::EnvelopeFactory& factory,
                             const CommandRegistry& registry, Logger& log)
    : endpoint_(endpoint), factory_(factory), registry_(registry), log_(log) {}

void CommandServer::reply(const protocols::Command& cmd, const protocols::Message& msg) {
  if (cmd.replyEndpoint.empty())
    return;
  if (!endpoint_.send(cmd.replyEndpoint, msg))
    log_.warn("reply for " + cmd.header.id + " not delivered");
}

void CommandServer::handle(const protocols::Command& cmd) {
  ++handled_;
  log_.info("command " + cmd.name + " (" + cmd.header.id + ")");

  const auto* handler = registry_.find(cmd.name);
  if (!handler) {
    log_.warn("unknown command " + cmd.name);
    reply(cmd, factory_.makeAck(cmd, false,
                                protocols::ErrorInfo{ std::string(names::kErrUnknownCmd),
                                                      "unknown command " + cmd.name }));
    return;
  }

  CommandOutcome outcome;
  try {
    outcome = (*handler)(cmd);
  } catch (const std::exception& e) {
    log_.error(cmd.name + " handler threw: " + e.what());
    outcome = CommandOutcome::failed("INTERNAL_ERROR", e.what());
  }

  if (!outcome.accepted) {
    const auto err = outcome.error.value_or(
        protocols::ErrorInfo{ std::string(names::kErrBadPayload), "rejected" });
    log_.info(cmd.name + " rejected: " + err.code + " " + err.message);
    reply(cmd, factory_.makeAck(cmd, false, err));
    return;
  }

  reply(cmd, factory_.makeAck(cmd, true));
  reply(cmd, factory_.makeResult(cmd, outcome.ok, std::move(outcome.payload), outcome.error));
}
