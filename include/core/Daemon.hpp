#pragma once
/** @file  Daemon.hpp
 *  @brief Common shell of every Hearo daemon: endpoint, lifecycle events, loop.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Hearo headers
#include "core/CommandClient.hpp"
#include "core/CommandRegistry.hpp"
#include "core/CommandServer.hpp"
#include "core/Config.hpp"
#include "core/Endpoint.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "io/DatagramChannel.hpp"
#include "protocols/EnvelopeFactory.hpp"
#include "protocols/Peer.hpp"

namespace hearo {
  namespace core {

    class Logger;

    inline constexpr const char* kVersion = "1.0.0";

    struct DaemonOptions {
      protocols::Peer self{ protocols::Peer::BD };
      std::string bindPath{};           ///< command endpoint (bus path for hcsm)
      std::vector<std::string> sinks{}; ///< where this daemon's events go
      std::string extraBindPath{};      ///< optional second receive address
      std::chrono::milliseconds tick{ 100 };
    };

    /**
     * @class Daemon
     * @brief Base class for bd, nfcd, wsm, plsm, powd and hcsm.
     *
     * Loop (single thread, cooperative):
     *  1. wait on the endpoint(s) until the next tick is due, dispatching
     *     commands to the registry, events to `onEvent()` and acks/results to
     *     `onReply()`;
     *  2. run `tick()` once per period.
     *
     * `start()` emits `<PREFIX>_EVENT_DAEMON_STARTED`, `stop()` emits
     * `<PREFIX>_EVENT_DAEMON_STOPPED`. `<PREFIX>_CMD_PING` and
     * `<PREFIX>_CMD_SET_DEBUG` are always registered.
     */
    class Daemon {
    public:
      Daemon(Logger& log, IpcConfig ipc, DaemonOptions options,
             std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());
      virtual ~Daemon() = default;

      //---public API------------------------------------------------------
      /// Bind, run `setup()`, announce. @returns false on a fatal init failure.
      bool start();

      /// One loop cycle (bounded wait + at most one tick).
      void step();

      /// Run `teardown()` and announce the stop. No-op if not started.
      void stop(const std::string& reason);

      /// start(), loop until a stop is requested or a signal arrives, stop().
      /// @returns process exit status.
      int run();

      void requestStop(std::string reason);
      bool running() const { return running_; }

      /// SIGINT/SIGTERM end `run()` after the current cycle.
      static void installSignalHandlers();

      protocols::Peer self() const { return options_.self; }
      std::int64_t uptimeMs() const;

      Daemon(const Daemon&) = delete;
      Daemon& operator=(const Daemon&) = delete;

    protected:
      //---hooks-----------------------------------------------------------
      virtual bool setup() { return true; }
      virtual void tick(std::int64_t /*nowMs*/) {}
      virtual void teardown() {}
      virtual void onEvent(const protocols::Event& /*ev*/) {}
      virtual void onReply(const protocols::Message& /*msg*/,
                           const std::optional<CommandClient::InFlight>& /*request*/) {}
      virtual void pingExtras(nlohmann::json& /*result*/) const {}
      virtual std::string statusText() const { return "running"; }

      /// Register a daemon command; duplicate names are a programming error.
      void addCommand(std::string_view name, CommandRegistry::Handler handler);

      /// `<PREFIX>_<suffix>` for this daemon (e.g. `BD_CMD_PING`).
      std::string ownName(std::string_view suffix) const;

      Logger& log_;
      const IpcConfig ipc_;
      const DaemonOptions options_;
      protocols::EnvelopeFactory factory_;
      Endpoint endpoint_;
      std::unique_ptr<Endpoint> extraEndpoint_;
      EventPublisher publisher_;
      std::shared_ptr<ErrorMonitor> errors_;
      CommandRegistry registry_;
      CommandServer server_;
      CommandClient client_;

    private:
      void dispatch(protocols::Message&& msg);
      CommandOutcome handlePing(const protocols::Command& cmd);
      CommandOutcome handleSetDebug(const protocols::Command& cmd);

      bool started_{ false };
      bool running_{ false };
      std::string stopReason_{};
      std::int64_t startedAt_{ 0 };
      std::int64_t nextTick_{ 0 };
    };

  } // namespace core
} // namespace hearo
