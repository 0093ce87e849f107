#pragma once
/** @file  InteractionClassifier.hpp
 *  @brief Debounce + short/long/hold classification of one binary input.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace hearo {
  namespace io {

    enum class Interaction { ShortPress, LongPress, HoldTick };

    /// Wire name of an interaction ("SHORT_PRESS", ...).
    const char* toString(Interaction i);

    struct ClassifierConfig {
      std::chrono::milliseconds debounce{ 30 };
      std::chrono::milliseconds shortMin{ 50 };
      std::chrono::milliseconds longThreshold{ 800 };
      std::chrono::milliseconds holdTickInterval{ 250 };
    };

    struct InteractionEvent {
      Interaction kind;
      std::chrono::milliseconds duration; ///< raw press edge -> raw release edge (or -> now for ticks)
      std::uint64_t sequence;             ///< per-instance, starts at 1
    };

    /**
     * @class InteractionClassifier
     * @brief Pure state machine: Idle -> Pressed -> LongHeld -> Idle.
     *
     *  * `update()` is called once per poll tick with the raw level and the
     *    current monotonic time; it never reads hardware itself.
     *  * A level counts only after it has been stable for `debounce`.
     *  * Durations are measured between the raw edges, so the debounce delay
     *    does not inflate them.
     *  * Presses shorter than `shortMin` are noise and produce nothing.
     *  * Optional edge callback reports debounced engage/release, used by inputs
     *    (the NFC tag slot) that care about presence as well as classification.
     */
    class InteractionClassifier {
    public:
      enum class State { Idle, Pressed, LongHeld };
      enum class Edge { Engaged, Released };

      using Callback = std::function<void(const InteractionEvent&)>;
      using EdgeCallback = std::function<void(Edge, std::chrono::milliseconds)>;

      explicit InteractionClassifier(ClassifierConfig cfg = {}) : cfg_{ cfg } {}

      void registerCallback(Callback cb) { cb_ = std::move(cb); }
      void registerEdgeCallback(EdgeCallback cb) { edgeCb_ = std::move(cb); }

      /** One poll tick. @param pressed raw level (true == asserted). */
      void update(bool pressed, std::chrono::milliseconds now);

      /** Drop any in-progress press without emitting; level reads as released. */
      void reset(std::chrono::milliseconds now);

      /** Takes effect on the next evaluation, including mid-hold. */
      void setLongThreshold(std::chrono::milliseconds t) { cfg_.longThreshold = t; }

      State state() const { return state_; }
      std::uint64_t sequence() const { return sequence_; }
      const ClassifierConfig& config() const { return cfg_; }

    private:
      void emit(Interaction kind, std::chrono::milliseconds duration);
      void emitEdge(Edge e, std::chrono::milliseconds now) {
        if (edgeCb_)
          edgeCb_(e, now);
      }
      void finishPress(std::chrono::milliseconds now);

      ClassifierConfig cfg_;
      Callback cb_{};
      EdgeCallback edgeCb_{};

      State state_{ State::Idle };
      bool lastLevel_{ false };
      std::chrono::milliseconds lastChange_{ 0 };   ///< "stable since"
      std::chrono::milliseconds pressStart_{ 0 };   ///< raw edge that started the press
      std::chrono::milliseconds lastHoldTick_{ 0 }; ///< schedule anchor for HoldTick
      std::uint64_t sequence_{ 0 };
    };

  } // namespace io
} // namespace hearo
