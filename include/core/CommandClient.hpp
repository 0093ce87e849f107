#pragma once
/** @file  CommandClient.hpp
 *  @brief Fire-and-forget command sender with optional in-flight tracking.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/Config.hpp"
#include "core/ErrorMonitor.hpp" // CommandClient reports lost commands to the error monitor
#include "protocols/Envelope.hpp"
#include "protocols/Peer.hpp"

namespace hearo {
  namespace protocols {
    class EnvelopeFactory;
  }

  namespace core {

    class Endpoint;
    class Logger;

    /**
     * @class CommandClient
     * @brief Sends commands to peer daemons; never blocks on the answer.
     *
     *  * Commands without a reply endpoint are not tracked.
     *  * Commands with one are remembered until their result (or a negative
     *    ack) arrives or `timeout_ms` passes; expiry is logged, never retried.
     */
    class CommandClient {
    public:
      struct InFlight {
        std::string id;
        std::string target;
        std::string name;
        std::int64_t deadline{ 0 }; ///< steady ms
      };

      using Clock = std::function<std::int64_t()>;

      CommandClient(Endpoint& endpoint, protocols::EnvelopeFactory& factory, const IpcConfig& ipc,
                    std::shared_ptr<ErrorMonitor> errorMonitor, Logger& log);
      virtual ~CommandClient() = default;

      //---public API------------------------------------------------------
      /// @returns the command id, or "" if it could not be handed to the socket.
      std::string send(protocols::Peer peer, std::string_view name,
                       nlohmann::json payload = nlohmann::json::object(),
                       std::string replyTo = {}, std::int64_t timeoutMs = 1000);

      virtual std::string sendTo(const std::string& path, std::string_view name,
                                 nlohmann::json payload = nlohmann::json::object(),
                                 std::string replyTo = {}, std::int64_t timeoutMs = 1000);

      /**
       * @brief Match an inbound ack/result against the in-flight table.
       *
       * A positive ack keeps the entry (the result is still due); a negative
       * ack or any result retires it. @returns the matched entry, if any.
       */
      std::optional<InFlight> onReply(const protocols::Message& msg);

      /// Drop entries whose deadline has passed. @returns number dropped.
      std::size_t expire(std::int64_t now);

      std::size_t inFlight() const { return pending_.size(); }
      bool pending(const std::string& id) const;

      void setClock(Clock clock) { clock_ = std::move(clock); }

    private:
      Endpoint& endpoint_;
      protocols::EnvelopeFactory& factory_;
      const IpcConfig& ipc_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Logger& log_;
      Clock clock_;
      std::vector<InFlight> pending_;
    };

    /// Monotonic ms (steady_clock), the time base of every tick and deadline.
    std::int64_t steadyMs();

  } // namespace core
} // namespace hearo
