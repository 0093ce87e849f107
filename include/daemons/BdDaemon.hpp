#pragma once
/** @file  BdDaemon.hpp
 *  @brief Button daemon: GPIO lines -> classified BD_EVENT_BUTTON events.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <functional>
#include <memory>

#include "core/Config.hpp"
#include "core/Daemon.hpp"
#include "daemons/ButtonMonitor.hpp"
#include "io/GPIOInput.hpp"

namespace hearo::daemons {

  class BdDaemon : public core::Daemon {
  public:
    using LineFactory = std::function<std::unique_ptr<io::GPIOInput>()>;

    BdDaemon(core::Logger& log, const core::HearoConfig& cfg,
             LineFactory lines = [] { return std::make_unique<io::GPIOInput>(); },
             std::unique_ptr<io::DatagramChannel> channel = std::make_unique<io::DatagramChannel>());

    const ButtonMonitor& monitor() const { return monitor_; }

    /// Classifier settings for one configured line (RESET gets the long threshold).
    static io::ClassifierConfig classifierFor(const core::ButtonsConfig& cfg,
                                              const core::ButtonLineConfig& line);

  protected:
    bool setup() override;
    void tick(std::int64_t nowMs) override;
    void pingExtras(nlohmann::json& result) const override;

  private:
    core::ButtonsConfig cfg_;
    LineFactory makeLine_;
    ButtonMonitor monitor_;
  };

} // namespace hearo::daemons
