#pragma once
/** @file  TagPresenceTracker.hpp
 *  @brief Tag presence through the interaction classifier: added / present / removed.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "io/InteractionClassifier.hpp"

namespace hearo {
  namespace core {
    class EventPublisher;
  }

  namespace daemons {

    /**
     * @class TagPresenceTracker
     * @brief Presence is the classifier's "pressed" level.
     *
     *  * Engaged edge  -> NFC_EVENT_TAG_ADDED{uid, tech}
     *  * HoldTick      -> NFC_EVENT_TAG_PRESENT{uid} (heartbeat)
     *  * Released edge -> NFC_EVENT_TAG_REMOVED{uid, reason:"timeout"}
     *  * A different uid while one is tracked -> TAG_REMOVED{reason:"replaced"}
     *    and detection restarts for the new uid.
     *
     * The raw level stays high for (missRelease - debounce) after the last
     * successful read so removal is reported missRelease after it.
     */
    class TagPresenceTracker {
    public:
      TagPresenceTracker(core::EventPublisher& events, const core::NfcConfig& cfg);

      /// A read cycle returned \p uid.
      void seen(const std::string& uid, std::chrono::milliseconds now);

      /// Advance time; call once per tick after any seen().
      void update(std::chrono::milliseconds now);

      bool present() const { return announced_; }
      const std::optional<std::string>& uid() const { return uid_; }

      static io::ClassifierConfig classifierConfig(const core::NfcConfig& cfg);

      // the classifier callbacks capture `this`
      TagPresenceTracker(const TagPresenceTracker&) = delete;
      TagPresenceTracker& operator=(const TagPresenceTracker&) = delete;

    private:
      void onEdge(io::InteractionClassifier::Edge edge);
      void onTick(const io::InteractionEvent& ev);

      core::EventPublisher& events_;
      io::InteractionClassifier classifier_;
      std::chrono::milliseconds window_;
      std::optional<std::string> uid_;
      std::chrono::milliseconds lastSeen_{ 0 };
      bool announced_{ false };
    };

  } // namespace daemons
} // namespace hearo
