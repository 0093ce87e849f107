#pragma once
/** @file  CommandRegistry.hpp
 *  @brief Runtime registry that maps command names to handlers.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocols/Envelope.hpp"

namespace hearo::core {

  /**
   * @brief What a handler decided about one command.
   *
   *  * `accepted == false`: refused before doing anything (unknown state,
   *    bad payload ...). Answered with a negative ack only.
   *  * `accepted == true`: ack ok, then one result carrying `ok`/`payload`/`error`.
   */
  struct CommandOutcome {
    bool accepted{ true };
    bool ok{ true };
    nlohmann::json payload = nlohmann::json::object();
    std::optional<protocols::ErrorInfo> error;

    static CommandOutcome done(nlohmann::json payload = nlohmann::json::object()) {
      return CommandOutcome{ true, true, std::move(payload), std::nullopt };
    }
    static CommandOutcome failed(std::string code, std::string message) {
      return CommandOutcome{ true, false, nlohmann::json::object(),
                             protocols::ErrorInfo{ std::move(code), std::move(message) } };
    }
    static CommandOutcome rejected(std::string code, std::string message) {
      return CommandOutcome{ false, false, nlohmann::json::object(),
                             protocols::ErrorInfo{ std::move(code), std::move(message) } };
    }
  };

  /**
 * @class CommandRegistry
 * @brief Register & look up command handlers by wire name.
 *
 *  * Keeps the daemon shell decoupled from the concrete command set.
 *  * Handlers run synchronously on the daemon loop thread.
 */
  class CommandRegistry {
  public:
    using Handler = std::function<CommandOutcome(const protocols::Command&)>;

    /// Register a handler under \p name.  Returns false on duplicate.
    bool registerCommand(std::string_view name, Handler handler);

    /// nullptr if unknown.
    const Handler* find(const std::string& name) const;

    /// Registered names, sorted (for PING / diagnostics).
    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Handler> handlers_;
  };

} // namespace hearo::core
