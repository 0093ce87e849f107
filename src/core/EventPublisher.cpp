/* @file EventPublisher.cpp
 * @brief event fan-out
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "core/EventPublisher.hpp"
#include "core/Endpoint.hpp"
#include "protocols/EnvelopeFactory.hpp"

using namespace hearo::core;

EventPublisher::EventPublisher(Endpoint& endpoint, protocols::EnvelopeFactory& factory,
                               std::vector<std::string> sinks)
    : endpoint_(endpoint), factory_(factory), sinks_(std::move(sinks)) {}

void EventPublisher::publish(std::string_view name, nlohmann::json payload) {
  const protocols::Message ev{ factory_.makeEvent(name, std::move(payload)) };
  // a failed sink is logged by the endpoint; the others still get the event
  for (const auto& sink : sinks_) {
    if (!endpoint_.send(sink, ev))
      ++lost_;
  }
}
