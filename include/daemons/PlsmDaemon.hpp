#pragma once
/** @file  PlsmDaemon.hpp
 *  @brief Player state machine daemon: PLSM_COMMAND_* -> playback backend.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <memory>

#include "core/Config.hpp"
#include "core/Daemon.hpp"
#include "daemons/PlaybackBackend.hpp"
#include "daemons/PlayerStateMachine.hpp"
#include "daemons/TagStore.hpp"

namespace hearo::daemons {

  class PlsmDaemon : public core::Daemon {
  public:
    PlsmDaemon(core::Logger& log, const core::HearoConfig& cfg,
               std::unique_ptr<PlaybackBackend> backend, std::unique_ptr<TagStore> tags,
               std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    const PlayerStateMachine& fsm() const { return fsm_; }

  protected:
    void tick(std::int64_t nowMs) override;
    void pingExtras(nlohmann::json& result) const override;
    std::string statusText() const override { return fsm_.stateName(); }

  private:
    std::unique_ptr<PlaybackBackend> backend_;
    std::unique_ptr<TagStore> tags_;
    PlayerStateMachine fsm_;
    const char* lastState_{ nullptr };
  };

} // namespace hearo::daemons
