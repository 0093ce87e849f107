/* @file ButtonMonitor.cpp
 * @brief button interactions -> bus events
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "daemons/ButtonMonitor.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
namespace names = hearo::protocols::names;

namespace {
  constexpr const char* kReadFailed = "GPIO_READ_FAILED";
}

ButtonMonitor::ButtonMonitor(core::EventPublisher& events, core::ErrorMonitor& errors)
    : events_(events), errors_(errors) {}

void ButtonMonitor::add(std::unique_ptr<io::ButtonGPIO> button) {
  button->registerCallback([this](const std::string& name, const io::InteractionEvent& ev) {
    onInteraction(name, ev);
  });
  buttons_.push_back(std::move(button));
}

void ButtonMonitor::poll(std::chrono::milliseconds now) {
  bool anyFailed = false;
  for (auto& b : buttons_) {
    if (!b->poll(now)) {
      anyFailed = true;
      errors_.notifyFailure(kReadFailed, b->name() + ": " + b->lastError(), true);
    }
  }
  if (failing_ && !anyFailed)
    errors_.clear(kReadFailed);
  failing_ = anyFailed;
}

std::vector<std::string> ButtonMonitor::names() const {
  std::vector<std::string> out;
  for (const auto& b : buttons_)
    out.push_back(b->name());
  return out;
}

void ButtonMonitor::onInteraction(const std::string& button, const io::InteractionEvent& ev) {
  lastButton_ = button;
  events_.publish(names::kBdEventButton, {
                                             { "button", button },
                                             { "interaction", io::toString(ev.kind) },
                                             { "duration_ms", ev.duration.count() },
                                             { "sequence", ev.sequence },
                                         });
}
