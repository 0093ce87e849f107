#pragma once
/** @file  WsmDaemon.hpp
 *  @brief Wi-Fi state machine daemon.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <memory>

#include "core/Config.hpp"
#include "core/Daemon.hpp"
#include "daemons/WifiControl.hpp"
#include "daemons/WifiStateMachine.hpp"

namespace hearo::daemons {

  class WsmDaemon : public core::Daemon {
  public:
    WsmDaemon(core::Logger& log, const core::HearoConfig& cfg, std::unique_ptr<WifiControl> control,
              std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    const WifiStateMachine& fsm() const { return fsm_; }

  protected:
    void tick(std::int64_t nowMs) override;
    void pingExtras(nlohmann::json& result) const override;
    std::string statusText() const override { return fsm_.stateName(); }

  private:
    std::unique_ptr<WifiControl> control_;
    WifiStateMachine fsm_;
    const char* lastState_{ nullptr };
  };

} // namespace hearo::daemons
