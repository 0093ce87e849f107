#pragma once
/** @file  NfcDaemon.hpp
 *  @brief NFC daemon: PN532 read loop -> NFC_EVENT_TAG_* events.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <memory>

#include "core/Config.hpp"
#include "core/Daemon.hpp"
#include "daemons/NfcStateMachine.hpp"
#include "daemons/TagReader.hpp"

namespace hearo::daemons {

  class NfcDaemon : public core::Daemon {
  public:
    NfcDaemon(core::Logger& log, const core::HearoConfig& cfg, std::unique_ptr<TagReader> reader,
              std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    const NfcStateMachine& fsm() const { return fsm_; }

  protected:
    void tick(std::int64_t nowMs) override;
    void teardown() override;
    void pingExtras(nlohmann::json& result) const override;
    std::string statusText() const override { return fsm_.stateName(); }

  private:
    std::unique_ptr<TagReader> reader_;
    NfcStateMachine fsm_;
  };

} // namespace hearo::daemons
