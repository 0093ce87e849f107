#pragma once

/** @file  CentralStateMachine.hpp
 *  @brief Global system state derived from the daemon event stream.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "protocols/Envelope.hpp"
#include "protocols/Peer.hpp"

namespace hearo {
  namespace core {

    class CommandClient;
    class EventPublisher;
    class Logger;

    enum class SystemState { Initializing, NoNetwork, Offline, ReadyPaused, Playing, ShuttingDown, Faulted };

    /// Wire name used in `HCSM_EVENT_STATE_CHANGED` ("NO_NETWORK", ...).
    const char* toString(SystemState s);

    /**
     * @class CentralStateMachine
     * @brief Folds events into one SystemState and issues commands to peers.
     *
     *  * Owns no hardware and never blocks: playback commands are sent
     *    without a reply endpoint, status queries reply to \p replyPath and
     *    come back through `handleNetworkStatus()` / `handlePlayerStatus()`.
     *  * Events that are irrelevant in the current state are ignored.
     *  * `HCSM_EVENT_INITIATED` is emitted at most once per instance.
     */
    class CentralStateMachine {

    public:
      CentralStateMachine(EventPublisher& events, CommandClient& commands, HcsmConfig config,
                          std::string replyPath, Logger& log);
      ~CentralStateMachine() = default;

      // ---- public API ----
      void begin();   ///< announce the initial state, ask WSM for its status
      void shutdown(); ///< local shutdown request (signal / command)

      void handleEvent(const protocols::Event& ev);
      void handleNetworkStatus(const nlohmann::json& status); ///< WSM_COMMAND_STATUS result
      void handlePlayerStatus(const nlohmann::json& status);  ///< PLSM_COMMAND_STATUS result

      SystemState state() const { return state_; }
      bool initiated() const { return initiated_; }
      bool networkSeen() const { return networkSeen_; }
      bool networkConnected() const { return connected_; }
      const std::optional<std::string>& currentTag() const { return currentTag_; }
      const std::set<protocols::Peer>& startedPeers() const { return started_; }

      nlohmann::json snapshot() const;

    private:
      void transitionTo(SystemState next);
      bool allRequiredStarted() const;
      bool isRequired(protocols::Peer p) const;
      void checkInitDone();

      void onInitializing(const std::string& name);
      void onNoNetwork(const std::string& name);
      void onOffline(const std::string& name);
      void onReadyPaused(const std::string& name, const nlohmann::json& payload);
      void onPlaying(const std::string& name, const nlohmann::json& payload);
      void onButton(const nlohmann::json& payload);
      void onTagAdded(const nlohmann::json& payload);

      void sendPlayback(std::string_view cmd, nlohmann::json payload = nlohmann::json::object());
      void queryNetwork();
      void queryPlayer();
      void batteryCritical();

      EventPublisher& events_;
      CommandClient& commands_;
      const HcsmConfig config_;
      const std::string replyPath_;
      Logger& log_;

      SystemState state_{ SystemState::Initializing };
      std::set<protocols::Peer> started_;
      bool networkSeen_{ false };
      bool connected_{ false };
      bool initiated_{ false };
      std::optional<std::string> currentTag_;
    };

  } // namespace core
} // namespace hearo
