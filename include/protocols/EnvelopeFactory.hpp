#pragma once
/** @file  EnvelopeFactory.hpp
 *  @brief Stamps ids and timestamps onto outgoing envelopes.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Hearo headers
#include "protocols/Envelope.hpp"

namespace hearo {
  namespace protocols {

    /// Wall clock in ms since epoch.
    std::int64_t epochMs();

    /**
     * @class EnvelopeFactory
     * @brief One per process; owns the per-kind id counters.
     *
     *  * Ids look like `<kind>-<origin>-<n>` and never repeat within a process.
     *  * The clock is injectable so tests get stable timestamps.
     */
    class EnvelopeFactory {
    public:
      using Clock = std::function<std::int64_t()>;

      explicit EnvelopeFactory(std::string origin, Clock clock = epochMs);

      Event makeEvent(std::string_view name, nlohmann::json payload = nlohmann::json::object());

      Command makeCommand(std::string_view name, nlohmann::json payload = nlohmann::json::object(),
                          std::string replyEndpoint = {}, std::int64_t timeoutMs = 1000);

      Ack makeAck(const Command& cmd, bool ok, std::optional<ErrorInfo> error = std::nullopt);

      Result makeResult(const Command& cmd, bool ok,
                        nlohmann::json payload = nlohmann::json::object(),
                        std::optional<ErrorInfo> error = std::nullopt);

      const std::string& origin() const { return origin_; }

    private:
      Header nextHeader(const char* kindTag, std::uint64_t& counter);

      std::string origin_;
      Clock clock_;
      std::uint64_t eventCounter_{ 0 };
      std::uint64_t commandCounter_{ 0 };
      std::uint64_t ackCounter_{ 0 };
      std::uint64_t resultCounter_{ 0 };
    };

  } // namespace protocols
} // namespace hearo
