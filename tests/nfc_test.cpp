// Hearo-Prod headers
#include "core/Config.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "daemons/NfcDaemon.hpp"
#include "daemons/NfcStateMachine.hpp"
#include "daemons/TagPresenceTracker.hpp"
#include "daemons/TagReader.hpp"
#include "protocols/Names.hpp"

// Hearo-Fake headers
#include "FakeBus.hpp"
#include "FakeTagReader.hpp"
#include "RecordingPublisher.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace hearo::test {

  using namespace hearo::daemons;
  using namespace std::chrono_literals;
  namespace names = hearo::protocols::names;

  //---TagPresenceTracker------------------------------------------------------

  class TagPresenceTrackerTest : public ::testing::Test {
  protected:
    /// One read cycle every 50 ms over [from, to); \p uid empty == no tag in the field.
    void reads(const std::string& uid, std::chrono::milliseconds from, std::chrono::milliseconds to) {
      for (auto t = from; t < to; t += 50ms) {
        if (!uid.empty())
          tracker.seen(uid, t);
        tracker.update(t);
      }
    }

    PublisherHarness h;
    core::NfcConfig cfg; // debounce 300, miss release 600, heartbeat 1000
    TagPresenceTracker tracker{ h.events, cfg };
  };

  TEST_F(TagPresenceTrackerTest, added_after_debounce_then_heartbeat) {
    reads("04A1B2C3", 0ms, 300ms);
    EXPECT_EQ(h.events.count(names::kNfcEventTagAdded), 0u);

    reads("04A1B2C3", 300ms, 1050ms);
    ASSERT_EQ(h.events.count(names::kNfcEventTagAdded), 1u);
    EXPECT_EQ(h.events.last(names::kNfcEventTagAdded)->payload["uid"], "04A1B2C3");
    EXPECT_EQ(h.events.last(names::kNfcEventTagAdded)->payload["tech"], "ISO14443");
    ASSERT_EQ(h.events.count(names::kNfcEventTagPresent), 1u);
    EXPECT_EQ(h.events.last(names::kNfcEventTagPresent)->payload["present_ms"], 1000);
    EXPECT_TRUE(tracker.present());
  }

  TEST_F(TagPresenceTrackerTest, removal_is_reported_after_the_miss_window) {
    reads("04A1B2C3", 0ms, 2000ms); // last read at 1950
    reads("", 2000ms, 2550ms);
    EXPECT_EQ(h.events.count(names::kNfcEventTagRemoved), 0u);

    reads("", 2550ms, 2600ms);
    ASSERT_EQ(h.events.count(names::kNfcEventTagRemoved), 1u);
    const auto* removed = h.events.last(names::kNfcEventTagRemoved);
    EXPECT_EQ(removed->payload["uid"], "04A1B2C3");
    EXPECT_EQ(removed->payload["reason"], "timeout");
    EXPECT_FALSE(tracker.present());

    EXPECT_EQ(h.events.names(),
              (std::vector<std::string>{ "NFC_EVENT_TAG_ADDED", "NFC_EVENT_TAG_PRESENT",
                                         "NFC_EVENT_TAG_PRESENT", "NFC_EVENT_TAG_REMOVED" }));
  }

  TEST_F(TagPresenceTrackerTest, brief_swipe_never_announces) {
    reads("04A1B2C3", 0ms, 50ms); // a single read
    reads("", 50ms, 2000ms);
    EXPECT_TRUE(h.events.published.empty());
    EXPECT_FALSE(tracker.uid());
  }

  TEST_F(TagPresenceTrackerTest, missed_reads_inside_the_window_are_bridged) {
    reads("04A1B2C3", 0ms, 500ms);
    reads("", 500ms, 700ms); // 200 ms gap < 300 ms window
    reads("04A1B2C3", 700ms, 900ms);

    EXPECT_EQ(h.events.count(names::kNfcEventTagAdded), 1u);
    EXPECT_EQ(h.events.count(names::kNfcEventTagRemoved), 0u);
  }

  TEST_F(TagPresenceTrackerTest, swapping_tags_replaces_the_first) {
    reads("04AA", 0ms, 500ms);
    reads("04BB", 500ms, 1000ms);

    ASSERT_EQ(h.events.count(names::kNfcEventTagRemoved), 1u);
    EXPECT_EQ(h.events.last(names::kNfcEventTagRemoved)->payload["uid"], "04AA");
    EXPECT_EQ(h.events.last(names::kNfcEventTagRemoved)->payload["reason"], "replaced");
    ASSERT_EQ(h.events.count(names::kNfcEventTagAdded), 2u);
    EXPECT_EQ(h.events.last(names::kNfcEventTagAdded)->payload["uid"], "04BB");
    EXPECT_EQ(tracker.uid(), "04BB");
  }

  //---NfcStateMachine---------------------------------------------------------

  class NfcStateMachineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errors.registerEscalation([this](const core::FailureReport& r) { escalated.push_back(r.code); });
    }

    void ticks(std::chrono::milliseconds from, std::chrono::milliseconds to) {
      for (auto t = from; t < to; t += 50ms)
        fsm.tick(t.count());
    }

    PublisherHarness h;
    core::ErrorMonitor errors;
    std::vector<std::string> escalated;
    FakeTagReader reader;
    core::NfcConfig cfg;
    NfcStateMachine fsm{ h.events, errors, reader, cfg };
  };

  TEST_F(NfcStateMachineTest, first_tick_initialises_and_announces_ready) {
    fsm.tick(0);
    EXPECT_EQ(fsm.state(), NfcStateMachine::State::Ready);
    EXPECT_EQ(reader.inits, 1);
    EXPECT_EQ(h.events.names(), (std::vector<std::string>{ "NFC_EVENT_READY" }));
    EXPECT_EQ(fsm.status(0)["state"], "READY");
  }

  TEST_F(NfcStateMachineTest, tag_on_the_reader_is_tracked) {
    fsm.tick(0);
    reader.uid = "04A1B2C3";
    ticks(50ms, 400ms);

    EXPECT_EQ(h.events.count(names::kNfcEventTagAdded), 1u);
    auto st = fsm.status(400);
    EXPECT_EQ(st["tag"], "04A1B2C3");
    EXPECT_EQ(st["present"], true);
  }

  TEST_F(NfcStateMachineTest, missing_reader_retries_with_backoff) {
    reader.initFails = true;
    fsm.tick(0);
    EXPECT_EQ(fsm.state(), NfcStateMachine::State::Error);
    EXPECT_EQ(escalated, (std::vector<std::string>{ "HW_NOT_FOUND" }));

    ticks(50ms, 1000ms);
    EXPECT_EQ(reader.inits, 1);

    fsm.tick(1000); // first retry after 1 s, fails again
    EXPECT_EQ(reader.inits, 2);
    EXPECT_EQ(escalated.size(), 1u);

    reader.initFails = false;
    fsm.tick(2999);
    EXPECT_EQ(reader.inits, 2);
    fsm.tick(3000); // second retry after 2 s more
    EXPECT_EQ(fsm.state(), NfcStateMachine::State::Ready);
    EXPECT_EQ(h.events.count(names::kNfcEventReady), 1u);
    EXPECT_EQ(errors.lastErrorCode(), "HW_NOT_FOUND");
  }

  TEST_F(NfcStateMachineTest, read_errors_stay_ready_and_escalate_once) {
    fsm.tick(0);
    reader.readFails = true;
    ticks(50ms, 500ms);

    EXPECT_EQ(fsm.state(), NfcStateMachine::State::Ready);
    EXPECT_EQ(escalated, (std::vector<std::string>{ "I2C_TIMEOUT" }));

    reader.readFails = false;
    ticks(500ms, 600ms);
    reader.readFails = true;
    ticks(600ms, 700ms);
    EXPECT_EQ(escalated.size(), 2u);
  }

  TEST_F(NfcStateMachineTest, read_errors_while_a_tag_is_present_end_in_removal) {
    fsm.tick(0);
    reader.uid = "04A1B2C3";
    ticks(50ms, 500ms);
    ASSERT_TRUE(fsm.tracker().present());

    reader.readFails = true;
    ticks(500ms, 1500ms);
    EXPECT_EQ(h.events.count(names::kNfcEventTagRemoved), 1u);
  }

  TEST_F(NfcStateMachineTest, restart_reinitialises_the_reader) {
    fsm.tick(0);
    fsm.requestRestart();
    fsm.tick(50);

    EXPECT_EQ(reader.closes, 1);
    EXPECT_EQ(reader.inits, 2);
    EXPECT_EQ(h.events.count(names::kNfcEventReady), 2u);
  }

  //---Pn532TagReader----------------------------------------------------------

  TEST(pn532_tag_reader, maps_chip_failures_to_classified_errors) {
    auto chip = std::make_unique<FakePn532>();
    auto* pn = chip.get();
    Pn532TagReader reader("/dev/i2c-1", 0x24, 30ms, std::move(chip));

    pn->openOk = false;
    try {
      reader.init();
      FAIL() << "init should throw";
    } catch (const core::PeerError& e) {
      EXPECT_EQ(e.cls(), core::FailureClass::ResourceUnavailable);
      EXPECT_EQ(e.code(), "HW_NOT_FOUND");
      EXPECT_NE(std::string(e.what()).find("/dev/i2c-1"), std::string::npos);
    }

    pn->openOk = true;
    EXPECT_NO_THROW(reader.init());
    EXPECT_FALSE(reader.readUid());
    pn->uid = "04A1B2C3";
    EXPECT_EQ(reader.readUid(), "04A1B2C3");

    pn->readOk = false;
    try {
      reader.readUid();
      FAIL() << "read should throw";
    } catch (const core::PeerError& e) {
      EXPECT_EQ(e.cls(), core::FailureClass::Transient);
      EXPECT_EQ(e.code(), "I2C_TIMEOUT");
    }
  }

  //---NfcDaemon---------------------------------------------------------------

  TEST(nfc_daemon, restart_command_and_ping_state) {
    core::Logger log{ "nfcd", core::LogLevel::None };
    core::HearoConfig cfg;
    auto bus = std::make_shared<FakeBus>();
    bus->listen(cfg.ipc.events);
    const std::string reply = "/tmp/hearo/test-reply.sock";
    bus->listen(reply);

    auto reader = std::make_unique<FakeTagReader>();
    auto* fake = reader.get();
    NfcDaemon nfcd(log, cfg, std::move(reader), std::make_unique<FakeDatagramChannel>(bus));
    ASSERT_TRUE(nfcd.start());
    nfcd.step(); // first tick: reader init

    EXPECT_EQ(bus->eventNames(cfg.ipc.events),
              (std::vector<std::string>{ "NFC_EVENT_DAEMON_STARTED", "NFC_EVENT_READY" }));

    protocols::EnvelopeFactory tester("tester");
    bus->inject(cfg.ipc.endpoint(protocols::Peer::NFC), tester.makeCommand(names::kNfcCmdRestart, nlohmann::json::object(), reply));
    bus->inject(cfg.ipc.endpoint(protocols::Peer::NFC), tester.makeCommand("NFC_CMD_PING", nlohmann::json::object(), reply));
    nfcd.step();

    auto results = bus->sentTo<protocols::Result>(reply);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].payload["restarting"], true);
    EXPECT_EQ(results[1].payload["status"], "READY");
    EXPECT_TRUE(results[1].payload["tag"].is_null());

    nfcd.stop("test");
    EXPECT_GE(fake->closes, 1);
  }

} // namespace hearo::test
