#pragma once
/** @file  EventPublisher.hpp
 *  @brief Stamps and fans out this daemon's events.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace hearo {
  namespace protocols {
    class EnvelopeFactory;
  }

  namespace core {

    class Endpoint;

    /**
     * @class EventPublisher
     * @brief Sends every event to each configured sink (normally just the bus).
     *
     * Virtual so state machines can be tested against a recording fake.
     */
    class EventPublisher {
    public:
      EventPublisher(Endpoint& endpoint, protocols::EnvelopeFactory& factory,
                     std::vector<std::string> sinks);
      virtual ~EventPublisher() = default;

      virtual void publish(std::string_view name,
                           nlohmann::json payload = nlohmann::json::object());

      const std::vector<std::string>& sinks() const { return sinks_; }
      std::uint64_t lost() const { return lost_; } ///< sink deliveries that failed locally

    private:
      Endpoint& endpoint_;
      protocols::EnvelopeFactory& factory_;
      std::vector<std::string> sinks_;
      std::uint64_t lost_{ 0 };
    };

  } // namespace core
} // namespace hearo
