#pragma once
/** @file ButtonGPIO.hpp
 *  @brief Debounced push-button: one GPIO line feeding an InteractionClassifier.
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "io/GPIOInput.hpp"
#include "io/InteractionClassifier.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace hearo {
  namespace io {

    /**
	 * @class ButtonGPIO
	 * @brief Owns one GPIOInput and classifies its presses.
	 *
	 *  * Emits `ShortPress`, `LongPress` and `HoldTick` with the button name.
	 *  * A failed line read counts as "released" and makes `poll()` return false.
	 *  * Pinned in memory: the classifier callback captures `this`; hold it by
	 *    unique_ptr when a container is needed.
	 */
    class ButtonGPIO {

    public:
      using Callback = std::function<void(const std::string& button, const InteractionEvent&)>;

      ButtonGPIO(std::string name, std::unique_ptr<GPIOInput> line, ClassifierConfig cfg = {});

      void registerCallback(Callback cb) { cbButton_ = std::move(cb); }

      /** Called by the owner loop every ~10 ms. @returns false if the line read failed. */
      bool poll(std::chrono::milliseconds now);

      const std::string& name() const { return name_; }
      const std::string& lastError() const { return line_->lastError(); }
      const InteractionClassifier& classifier() const { return classifier_; }

      // ─── non-copyable, non-movable ────────────────────────────────────────────
      ButtonGPIO(const ButtonGPIO&) = delete;
      ButtonGPIO& operator=(const ButtonGPIO&) = delete;

    private:
      std::string name_;
      std::unique_ptr<GPIOInput> line_; ///< owns the line handle
      InteractionClassifier classifier_;
      Callback cbButton_{};
    };

  } // namespace io
} // namespace hearo
