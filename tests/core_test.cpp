// Hearo-Prod headers
#include "core/Backoff.hpp"
#include "core/Config.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/PeerStateMachine.hpp"

// Hearo-Fake headers
#include "MockErrorMonitor.hpp"
#include "RecordingPublisher.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace hearo::test {

  using namespace hearo::core;
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::StrictMock;
  using nlohmann::json;

  //---ErrorMonitor------------------------------------------------------------

  TEST(error_monitor, escalates_each_code_once_until_cleared) {
    ErrorMonitor mon;
    std::vector<FailureReport> reports;
    mon.registerEscalation([&](const FailureReport& r) { reports.push_back(r); });

    mon.notifyFailure("I2C_TIMEOUT", "no answer");
    mon.notifyFailure("I2C_TIMEOUT", "no answer again");
    mon.notifyFailure("HW_NOT_FOUND", "gone", false);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].code, "I2C_TIMEOUT");
    EXPECT_EQ(reports[0].message, "no answer");
    EXPECT_TRUE(reports[0].recovering);
    EXPECT_FALSE(reports[1].recovering);

    mon.clear("I2C_TIMEOUT");
    mon.notifyFailure("I2C_TIMEOUT", "back");
    mon.notifyFailure("HW_NOT_FOUND", "still gone");
    EXPECT_EQ(reports.size(), 3u);

    mon.clear();
    mon.notifyFailure("HW_NOT_FOUND", "once more");
    EXPECT_EQ(reports.size(), 4u);
  }

  TEST(error_monitor, last_code_survives_clear) {
    ErrorMonitor mon;
    EXPECT_EQ(mon.lastErrorCode(), "");
    mon.notifyFailure("WIFI_TOOL_TIMEOUT", "wpa_cli hung");
    mon.notifyFailure("WIFI_TOOL_TIMEOUT", "wpa_cli hung");
    mon.clear();
    EXPECT_EQ(mon.lastErrorCode(), "WIFI_TOOL_TIMEOUT");
  }

  //---Backoff-----------------------------------------------------------------

  TEST(backoff, doubles_up_to_max_and_resets) {
    Backoff b(1000, 5000);
    EXPECT_EQ(b.next(), 1000);
    EXPECT_EQ(b.next(), 2000);
    EXPECT_EQ(b.next(), 4000);
    EXPECT_EQ(b.next(), 5000);
    EXPECT_EQ(b.next(), 5000);
    b.reset();
    EXPECT_EQ(b.next(), 1000);
  }

  TEST(backoff, rejects_inverted_bounds) {
    EXPECT_THROW(Backoff(0, 100), std::invalid_argument);
    EXPECT_THROW(Backoff(500, 100), std::invalid_argument);
  }

  //---Logger------------------------------------------------------------------

  TEST(logger, parses_level_names) {
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("none"), LogLevel::None);
    EXPECT_FALSE(parseLevel("verbose"));
  }

  TEST(logger, filters_by_level_and_tags_lines) {
    std::ostringstream out;
    Logger log("wsm", LogLevel::Warn);
    log.setConsole(&out);

    log.info("hidden");
    log.warn("link down");
    EXPECT_THAT(out.str(), HasSubstr("[WARN] wsm: link down\n"));
    EXPECT_THAT(out.str(), ::testing::Not(HasSubstr("hidden")));

    log.setLevel(LogLevel::Debug);
    log.debug("now visible");
    EXPECT_THAT(out.str(), HasSubstr("[DEBUG] wsm: now visible"));
  }

  //---Config------------------------------------------------------------------

  TEST(config, empty_document_yields_defaults) {
    auto cfg = parseConfig(json::object());
    EXPECT_EQ(cfg.ipc.events, "/tmp/hearo/events.sock");
    EXPECT_EQ(cfg.ipc.endpoint(protocols::Peer::PLSM), "/tmp/hearo/psm_cmd.sock");
    EXPECT_EQ(cfg.buttons.lines.size(), 5u);
    EXPECT_EQ(cfg.buttons.longThresholdMs, 800);
    EXPECT_EQ(cfg.nfc.address, 0x24);
    EXPECT_EQ(cfg.hcsm.requiredPeers.size(), 6u);
    EXPECT_EQ(cfg.log.level, "info");
  }

  TEST(config, overlays_present_keys) {
    auto cfg = parseConfig(json::parse(R"({
      "ipc": { "events": "/run/hearo/bus.sock", "wsm": "/run/hearo/wsm.sock" },
      "buttons": { "lines": { "NEXT": 5, "RESET": { "line": 6, "long_threshold_ms": 4000 } } },
      "hcsm": { "required_peers": ["nfc", "plsm"], "seek_delta_ms": 10000 },
      "log": { "level": "debug", "file": "/var/log/hearo.log" }
    })"));

    EXPECT_EQ(cfg.ipc.events, "/run/hearo/bus.sock");
    EXPECT_EQ(cfg.ipc.endpoint(protocols::Peer::WSM), "/run/hearo/wsm.sock");
    EXPECT_EQ(cfg.ipc.endpoint(protocols::Peer::BD), "/tmp/hearo/bd.sock");

    ASSERT_EQ(cfg.buttons.lines.size(), 2u);
    // nlohmann objects iterate in key order
    EXPECT_EQ(cfg.buttons.lines[0].name, "NEXT");
    EXPECT_EQ(cfg.buttons.lines[0].line, 5u);
    EXPECT_EQ(cfg.buttons.lines[0].longThresholdMs, -1);
    EXPECT_EQ(cfg.buttons.lines[1].name, "RESET");
    EXPECT_EQ(cfg.buttons.lines[1].longThresholdMs, 4000);

    EXPECT_EQ(cfg.hcsm.requiredPeers,
              (std::vector<protocols::Peer>{ protocols::Peer::NFC, protocols::Peer::PLSM }));
    EXPECT_EQ(cfg.hcsm.seekDeltaMs, 10000);
    EXPECT_EQ(cfg.log.file, "/var/log/hearo.log");
  }

  TEST(config, bad_values_name_the_key) {
    auto message = [](const char* doc) {
      try {
        parseConfig(json::parse(doc));
      } catch (const std::runtime_error& e) {
        return std::string(e.what());
      }
      return std::string("no error");
    };

    EXPECT_THAT(message(R"({"wifi": {"tick_ms": "fast"}})"), HasSubstr("[Config] wifi.tick_ms"));
    EXPECT_THAT(message(R"({"nfc": 3})"), HasSubstr("section 'nfc' must be an object"));
    EXPECT_THAT(message(R"({"hcsm": {"required_peers": ["spotifyd"]}})"),
                HasSubstr("unknown peer 'spotifyd'"));
    EXPECT_THAT(message(R"({"log": {"level": "loud"}})"), HasSubstr("unknown level 'loud'"));
    EXPECT_THAT(message(R"({"player": {"helper": []}})"), HasSubstr("player.helper"));
    EXPECT_THAT(message(R"({"buttons": {"lines": {"NEXT": "x"}}})"), HasSubstr("buttons.lines.NEXT"));
    EXPECT_THAT(message("[]"), HasSubstr("top level must be an object"));
  }

  TEST(config_loader, missing_file_is_empty_and_garbage_throws) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("hearo-cfg-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);

    ConfigLoader missing((dir / "none.json").string());
    EXPECT_FALSE(missing.exists());
    EXPECT_TRUE(missing.load().empty());

    const auto bad = (dir / "bad.json").string();
    std::ofstream(bad) << "{ \"ipc\": ";
    EXPECT_THROW(ConfigLoader(bad).load(), std::runtime_error);

    // comments are tolerated
    const auto good = (dir / "good.json").string();
    std::ofstream(good) << "{ // hearo\n \"log\": { \"level\": \"warn\" } }";
    EXPECT_EQ(ConfigLoader(good).load()["log"]["level"], "warn");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  //---PeerStateMachine--------------------------------------------------------

  namespace {
    /// Minimal FSM that throws whatever the test loads into it.
    class ProbeMachine : public PeerStateMachine {
    public:
      ProbeMachine(EventPublisher& ev, ErrorMonitor& err)
          : PeerStateMachine(ev, err, Backoff(100, 400)) {}

      std::function<void()> action;
      std::vector<std::string> failures;

      nlohmann::json status(std::int64_t) const override { return json::object(); }
      const char* stateName() const override { return "PROBE"; }

      using PeerStateMachine::retryAt;
      using PeerStateMachine::retryDue;

    protected:
      void step(std::int64_t) override {
        if (action)
          action();
      }
      void onFailure(const PeerError& err, std::int64_t nowMs) override {
        failures.push_back(err.code());
        scheduleRetry(nowMs);
      }
    };
  } // namespace

  TEST(peer_state_machine, failures_are_reported_not_thrown) {
    PublisherHarness h;
    StrictMock<MockErrorMonitor> errors;
    ProbeMachine fsm(h.events, errors);

    EXPECT_CALL(errors, notifyFailure("HW_NOT_FOUND", "no PN532", true));
    EXPECT_CALL(errors, notifyFailure("INTERNAL_ERROR", HasSubstr("vector"), true));

    fsm.action = [] { throw PeerError(FailureClass::ResourceUnavailable, "HW_NOT_FOUND", "no PN532"); };
    EXPECT_NO_THROW(fsm.tick(1000));
    EXPECT_EQ(fsm.retryAt(), 1100);
    EXPECT_FALSE(fsm.retryDue(1099));
    EXPECT_TRUE(fsm.retryDue(1100));

    fsm.action = [] { throw std::out_of_range("vector::at"); };
    EXPECT_NO_THROW(fsm.tick(1100));
    EXPECT_EQ(fsm.retryAt(), 1300);

    EXPECT_EQ(fsm.failures, (std::vector<std::string>{ "HW_NOT_FOUND", "INTERNAL_ERROR" }));
  }

  TEST(peer_state_machine, quiet_tick_touches_nothing) {
    PublisherHarness h;
    StrictMock<MockErrorMonitor> errors;
    ProbeMachine fsm(h.events, errors);
    EXPECT_CALL(errors, notifyFailure(_, _, _)).Times(0);
    fsm.tick(0);
    EXPECT_TRUE(fsm.failures.empty());
    EXPECT_TRUE(h.events.published.empty());
  }

} // namespace hearo::test
