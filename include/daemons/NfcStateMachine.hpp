#pragma once
/** @file  NfcStateMachine.hpp
 *  @brief Reader lifecycle (Init/Ready/Error) around the tag presence tracker.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>

#include "core/Config.hpp"
#include "core/PeerStateMachine.hpp"
#include "daemons/TagPresenceTracker.hpp"
#include "daemons/TagReader.hpp"

namespace hearo::daemons {

  /**
 * @class NfcStateMachine
 * @brief One read cycle per tick while Ready.
 *
 *  * Init  : reader init; success -> NFC_EVENT_READY, Ready.
 *  * Ready : read; a failed read is an I2C_TIMEOUT error and counts as "no tag".
 *  * Error : init retried with backoff.
 *  * `requestRestart()` closes and re-inits the reader on the next tick.
 */
  class NfcStateMachine : public core::PeerStateMachine {
  public:
    enum class State { Init, Ready, Error };

    NfcStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors, TagReader& reader,
                    const core::NfcConfig& cfg);

    void requestRestart() { restart_ = true; }

    State state() const { return state_; }
    const char* stateName() const override;
    nlohmann::json status(std::int64_t nowMs) const override;

    const TagPresenceTracker& tracker() const { return tracker_; }

  protected:
    void step(std::int64_t nowMs) override;
    void onFailure(const core::PeerError& err, std::int64_t nowMs) override;

  private:
    void initReader();

    TagReader& reader_;
    TagPresenceTracker tracker_;
    State state_{ State::Init };
    bool restart_{ false };
    bool readFailing_{ false };
  };

} // namespace hearo::daemons
