#pragma once
/** @file  ButtonMonitor.hpp
 *  @brief Polls every ButtonGPIO and turns interactions into BD_EVENT_BUTTON.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Hearo headers
#include "io/ButtonGPIO.hpp"

namespace hearo {
  namespace core {
    class EventPublisher;
    class ErrorMonitor;
  } // namespace core

  namespace daemons {

    class ButtonMonitor {
    public:
      ButtonMonitor(core::EventPublisher& events, core::ErrorMonitor& errors);

      /// Takes ownership; the monitor installs its own callback on \p button.
      void add(std::unique_ptr<io::ButtonGPIO> button);

      /// Sample every line once. A failed read is reported as GPIO_READ_FAILED.
      void poll(std::chrono::milliseconds now);

      std::size_t size() const { return buttons_.size(); }
      std::vector<std::string> names() const;
      const std::string& lastButton() const { return lastButton_; }

    private:
      void onInteraction(const std::string& button, const io::InteractionEvent& ev);

      core::EventPublisher& events_;
      core::ErrorMonitor& errors_;
      std::vector<std::unique_ptr<io::ButtonGPIO>> buttons_;
      std::string lastButton_{};
      bool failing_{ false };
    };

  } // namespace daemons
} // namespace hearo
