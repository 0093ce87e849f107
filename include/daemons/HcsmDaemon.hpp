#pragma once
/** @file  HcsmDaemon.hpp
 *  @brief Orchestrator daemon: owns the event bus and the central state machine.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include "core/CentralStateMachine.hpp"
#include "core/Config.hpp"
#include "core/Daemon.hpp"

namespace hearo::daemons {

  /**
 * @class HcsmDaemon
 * @brief Receives every peer event on `ipc.events`, commands on its own
 *        endpoint, and emits HCSM_EVENT_* to `hcsm.notify`.
 *
 * Status query results arrive on the bus and are folded back into the
 * state machine by the name of the request they answer.
 */
  class HcsmDaemon : public core::Daemon {
  public:
    HcsmDaemon(core::Logger& log, const core::HearoConfig& cfg,
               std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    const core::CentralStateMachine& csm() const { return csm_; }

  protected:
    bool setup() override;
    void teardown() override;
    void onEvent(const protocols::Event& ev) override;
    void onReply(const protocols::Message& msg,
                 const std::optional<core::CommandClient::InFlight>& request) override;
    void pingExtras(nlohmann::json& result) const override;
    std::string statusText() const override { return core::toString(csm_.state()); }

  private:
    core::CentralStateMachine csm_;
  };

} // namespace hearo::daemons
