// Hearo-Prod headers
#include "core/Config.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "daemons/PlaybackBackend.hpp"
#include "daemons/PlayerStateMachine.hpp"
#include "daemons/PlsmDaemon.hpp"
#include "daemons/TagStore.hpp"
#include "protocols/Names.hpp"

// Hearo-Fake headers
#include "FakeBus.hpp"
#include "FakePlaybackBackend.hpp"
#include "FakeProcessRunner.hpp"
#include "FakeTagStore.hpp"
#include "RecordingPublisher.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace hearo::test {

  using namespace hearo::daemons;
  using namespace std::chrono_literals;
  using core::FailureClass;
  using core::PeerError;
  namespace names = hearo::protocols::names;
  namespace fs = std::filesystem;

  constexpr const char* kKidsPlaylist = "spotify:playlist:kids";
  constexpr const char* kStoryTrack = "spotify:track:story7";

  //---PlayerStateMachine------------------------------------------------------

  class PlayerStateMachineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errors.registerEscalation([this](const core::FailureReport& r) { escalated.push_back(r.code); });
      tags.tags["04AA"] = TagEntry{ kKidsPlaylist, "", 0 };
      tags.tags["04BB"] = TagEntry{ "spotify:album:stories", kStoryTrack, 42000 };
    }

    /// Authenticate and start \p uid at t=0.
    void playing(const std::string& uid) {
      fsm.tick(0);
      ASSERT_TRUE(fsm.playTag({ { "uid", uid } }, 0).ok);
      h.events.published.clear();
    }

    PublisherHarness h;
    core::ErrorMonitor errors;
    std::vector<std::string> escalated;
    FakePlaybackBackend backend;
    FakeTagStore tags;
    core::PlayerConfig cfg; // progress 2 s, backoff 2..60 s
    PlayerStateMachine fsm{ h.events, errors, backend, tags, cfg };
  };

  TEST_F(PlayerStateMachineTest, first_tick_authenticates) {
    fsm.tick(0);

    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
    EXPECT_EQ(fsm.auth(), PlayerStateMachine::Auth::Ok);
    EXPECT_EQ(h.events.names(),
              (std::vector<std::string>{ "PLSM_EVENT_STATE_CHANGED", "PLSM_EVENT_AUTHENTICATED",
                                         "PLSM_EVENT_STATE_CHANGED" }));
    EXPECT_EQ(h.events.published[0].payload["old"], "PL_INIT");
    EXPECT_EQ(h.events.published[0].payload["new"], "PL_AUTHENTICATING");
    EXPECT_EQ(h.events.published[2].payload["new"], "PL_READY");
  }

  TEST_F(PlayerStateMachineTest, startup_auth_failure_retries_with_backoff) {
    backend.failOn("ensureReady", FailureClass::AuthIssue, "AUTH_FAILED");
    fsm.tick(0);

    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Error);
    EXPECT_EQ(fsm.auth(), PlayerStateMachine::Auth::Failed);
    ASSERT_EQ(h.events.count(names::kPlsmEventAuthFailed), 1u);
    EXPECT_EQ(h.events.last(names::kPlsmEventAuthFailed)->payload["reason"], "AUTH_FAILED");
    EXPECT_EQ(escalated, (std::vector<std::string>{ "AUTH_FAILED" }));

    backend.succeed("ensureReady");
    fsm.tick(1999);
    EXPECT_EQ(backend.count("ensureReady"), 1u);
    fsm.tick(2000);
    EXPECT_EQ(backend.count("ensureReady"), 2u);
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
    EXPECT_EQ(h.events.count(names::kPlsmEventAuthenticated), 1u);
  }

  TEST_F(PlayerStateMachineTest, tag_resolves_to_its_playlist) {
    fsm.tick(0);
    auto out = fsm.playTag({ { "uid", "04AA" } }, 100);

    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.payload["uri"], kKidsPlaylist);
    EXPECT_EQ(out.payload["position_ms"], 0);
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Playing);
    EXPECT_EQ(backend.state.uri, kKidsPlaylist);

    const auto* resolved = h.events.last(names::kPlsmEventTagResolved);
    ASSERT_NE(resolved, nullptr);
    EXPECT_EQ(resolved->payload["uid"], "04AA");
    const auto* started = h.events.last(names::kPlsmEventPlayStarted);
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->payload["uri"], kKidsPlaylist);
  }

  TEST_F(PlayerStateMachineTest, tag_with_saved_progress_resumes_the_track) {
    fsm.tick(0);
    auto out = fsm.playTag({ { "uid", "04BB" } }, 100);

    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.payload["uri"], kStoryTrack);
    EXPECT_EQ(backend.state.uri, kStoryTrack);
    EXPECT_EQ(backend.state.positionMs, 42000);
    EXPECT_EQ(fsm.positionMs(), 42000);
  }

  TEST_F(PlayerStateMachineTest, unmapped_or_malformed_tags_are_rejected) {
    fsm.tick(0);

    auto unknown = fsm.playTag({ { "uid", "04FF" } }, 0);
    EXPECT_FALSE(unknown.accepted);
    EXPECT_EQ(unknown.error->code, "TAG_UNMAPPED");
    EXPECT_EQ(h.events.last(names::kPlsmEventTagUnknown)->payload["uid"], "04FF");

    EXPECT_EQ(fsm.playTag(nlohmann::json::object(), 0).error->code, names::kErrBadPayload);
    EXPECT_EQ(fsm.playTag({ { "uid", "" } }, 0).error->code, names::kErrBadPayload);
    EXPECT_EQ(fsm.playTag({ { "uid", 4 } }, 0).error->code, names::kErrBadPayload);
    EXPECT_EQ(backend.count("play"), 0u);
  }

  TEST_F(PlayerStateMachineTest, playback_needs_authentication) {
    auto out = fsm.playTag({ { "uid", "04AA" } }, 0);

    EXPECT_FALSE(out.accepted);
    EXPECT_EQ(out.error->code, "AUTH_REQUIRED");
    const auto* ev = h.events.last(names::kPlsmEventAuthFailed);
    ASSERT_NE(ev, nullptr);
    EXPECT_EQ(ev->payload["reason"], "auth_not_ok");
    EXPECT_EQ(ev->payload["auth"], "AUTH_NONE");
    EXPECT_TRUE(backend.calls.empty());
  }

  TEST_F(PlayerStateMachineTest, tag_store_failure_is_reported) {
    fsm.tick(0);
    tags.lookupFails = true;

    auto out = fsm.playTag({ { "uid", "04AA" } }, 0);
    EXPECT_FALSE(out.accepted);
    EXPECT_EQ(out.error->code, "TAG_STORE_CORRUPT");
    EXPECT_EQ(escalated, (std::vector<std::string>{ "TAG_STORE_CORRUPT" }));
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
  }

  TEST_F(PlayerStateMachineTest, stop_saves_progress_and_is_idempotent) {
    playing("04BB");

    auto first = fsm.stop(500);
    ASSERT_TRUE(first.ok);
    EXPECT_EQ(first.payload["stopped"], true);
    EXPECT_EQ(first.payload["position_ms"], 42000);
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
    const auto* stopped = h.events.last(names::kPlsmEventPlayStopped);
    ASSERT_NE(stopped, nullptr);
    EXPECT_EQ(stopped->payload["reason"], "stopped");
    EXPECT_EQ(stopped->payload["uid"], "04BB");
    EXPECT_EQ(tags.saves, 1);

    auto second = fsm.stop(600);
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(second.payload["stopped"], false);
    EXPECT_EQ(backend.count("pause"), 1u);
    EXPECT_EQ(h.events.count(names::kPlsmEventPlayStopped), 1u);
  }

  TEST_F(PlayerStateMachineTest, seek_is_relative_and_clamped_at_zero) {
    playing("04AA");

    auto back = fsm.seek({ { "delta_ms", -15000 } }, 100);
    ASSERT_TRUE(back.ok);
    EXPECT_EQ(back.payload["position_ms"], 0);

    auto fwd = fsm.seek({ { "delta_ms", 15000 } }, 200);
    EXPECT_EQ(fwd.payload["position_ms"], 15000);
    EXPECT_EQ(backend.state.positionMs, 15000);
    EXPECT_EQ(fsm.positionMs(), 15000);
  }

  TEST_F(PlayerStateMachineTest, transport_commands_need_active_playback) {
    fsm.tick(0);

    EXPECT_EQ(fsm.seek({ { "delta_ms", "far" } }, 0).error->code, names::kErrBadPayload);
    EXPECT_EQ(fsm.seek({ { "delta_ms", 1000 } }, 0).error->code, "NO_ACTIVE_PLAYBACK");
    EXPECT_EQ(fsm.next(0).error->code, "NO_ACTIVE_PLAYBACK");
    EXPECT_EQ(fsm.previous(0).error->code, "NO_ACTIVE_PLAYBACK");
    EXPECT_EQ(backend.count("next"), 0u);
  }

  TEST_F(PlayerStateMachineTest, transient_failure_keeps_playing) {
    playing("04AA");
    backend.failOn("next", FailureClass::Transient, "BACKEND_TIMEOUT");

    auto out = fsm.next(100);
    EXPECT_TRUE(out.accepted);
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.error->code, "BACKEND_TIMEOUT");
    ASSERT_EQ(h.events.count(names::kPlsmEventPlaybackError), 1u);
    EXPECT_EQ(h.events.last(names::kPlsmEventPlaybackError)->payload["code"], "BACKEND_TIMEOUT");
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Playing);
    EXPECT_EQ(fsm.auth(), PlayerStateMachine::Auth::Ok);
  }

  TEST_F(PlayerStateMachineTest, auth_failure_mid_session_is_auth_lost) {
    playing("04BB");
    backend.failOn("seek", FailureClass::AuthIssue, "AUTH_FAILED");

    auto out = fsm.seek({ { "delta_ms", 1000 } }, 100);
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Error);
    EXPECT_EQ(fsm.auth(), PlayerStateMachine::Auth::Lost);
    ASSERT_EQ(h.events.count(names::kPlsmEventAuthLost), 1u);
    EXPECT_EQ(h.events.count(names::kPlsmEventAuthFailed), 0u);
    EXPECT_EQ(h.events.count(names::kPlsmEventDisconnected), 0u);
    // progress saved before leaving Playing
    EXPECT_EQ(tags.saves, 1);
  }

  TEST_F(PlayerStateMachineTest, lost_device_disconnects_then_reauthenticates) {
    playing("04AA");
    backend.failOn("previous", FailureClass::ResourceUnavailable, "DEVICE_UNAVAILABLE");

    EXPECT_FALSE(fsm.previous(1000).ok);
    EXPECT_EQ(h.events.names(),
              (std::vector<std::string>{ "PLSM_EVENT_DISCONNECTED", "PLSM_EVENT_AUTH_LOST",
                                         "PLSM_EVENT_STATE_CHANGED" }));
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Error);

    fsm.tick(2999);
    EXPECT_EQ(backend.count("ensureReady"), 1u);
    fsm.tick(3000);
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
    EXPECT_EQ(fsm.auth(), PlayerStateMachine::Auth::Ok);
    EXPECT_EQ(h.events.count(names::kPlsmEventAuthenticated), 1u);
  }

  TEST_F(PlayerStateMachineTest, progress_is_saved_and_track_end_detected) {
    playing("04AA");
    backend.state = { true, "spotify:track:one", 5000 };

    fsm.tick(1999);
    EXPECT_EQ(backend.count("status"), 0u);
    fsm.tick(2000);
    EXPECT_EQ(backend.count("status"), 1u);
    EXPECT_EQ(tags.tags["04AA"].lastTrackUri, "spotify:track:one");
    EXPECT_EQ(tags.tags["04AA"].lastPosMs, 5000);
    EXPECT_EQ(fsm.uri(), "spotify:track:one");

    backend.state.isPlaying = false;
    fsm.tick(4000);
    const auto* ended = h.events.last(names::kPlsmEventPlayStopped);
    ASSERT_NE(ended, nullptr);
    EXPECT_EQ(ended->payload["reason"], "ended");
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Ready);
  }

  TEST_F(PlayerStateMachineTest, swapping_tags_keeps_the_outgoing_position) {
    playing("04AA");
    ASSERT_TRUE(fsm.seek({ { "delta_ms", 30000 } }, 100).ok);

    ASSERT_TRUE(fsm.playTag({ { "uid", "04BB" } }, 200).ok);
    EXPECT_EQ(tags.tags["04AA"].lastPosMs, 30000);
    EXPECT_EQ(tags.tags["04AA"].lastTrackUri, kKidsPlaylist);
    EXPECT_EQ(fsm.uid().value_or(""), "04BB");
    EXPECT_EQ(fsm.state(), PlayerStateMachine::State::Playing);
  }

  TEST_F(PlayerStateMachineTest, status_snapshot) {
    playing("04AA");
    auto st = fsm.status(100);

    EXPECT_EQ(st["state"], "PL_PLAYING");
    EXPECT_EQ(st["auth"], "AUTH_OK");
    EXPECT_EQ(st["uid"], "04AA");
    EXPECT_EQ(st["uri"], kKidsPlaylist);
    EXPECT_EQ(st["position_ms"], 0);
    EXPECT_TRUE(st["last_error_code"].is_null());
  }

  //---JsonTagStore------------------------------------------------------------

  class JsonTagStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
      dir = fs::temp_directory_path() /
            ("hearo-tags-" + std::to_string(::getpid()) + "-" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::remove_all(dir);
      fs::create_directories(dir);
      file = (dir / "tags.json").string();
    }
    void TearDown() override {
      std::error_code ec;
      fs::remove_all(dir, ec);
    }

    void write(const std::string& text) const {
      std::ofstream out(file);
      out << text;
    }

    fs::path dir;
    std::string file;
  };

  TEST_F(JsonTagStoreTest, missing_file_is_an_empty_map) {
    JsonTagStore store(file);
    EXPECT_FALSE(store.lookup("04AA"));
    store.saveProgress("04AA", "spotify:track:x", 10);
    EXPECT_FALSE(fs::exists(file));
  }

  TEST_F(JsonTagStoreTest, progress_survives_a_reload) {
    write(R"({"tags": {"04AA": {"playlist_uri": "spotify:playlist:kids"},
                       "04CC": {}}})");
    {
      JsonTagStore store(file);
      auto e = store.lookup("04AA");
      ASSERT_TRUE(e);
      EXPECT_EQ(e->playlistUri, "spotify:playlist:kids");
      EXPECT_EQ(e->lastPosMs, 0);
      EXPECT_FALSE(store.lookup("04CC")); // nothing to play
      store.saveProgress("04AA", "spotify:track:3", 61000);
      store.saveProgress("04AA", "spotify:track:4", -5);
    }
    EXPECT_FALSE(fs::exists(file + ".tmp"));

    JsonTagStore reloaded(file);
    auto e = reloaded.lookup("04AA");
    ASSERT_TRUE(e);
    EXPECT_EQ(e->playlistUri, "spotify:playlist:kids");
    EXPECT_EQ(e->lastTrackUri, "spotify:track:4");
    EXPECT_EQ(e->lastPosMs, 0);
  }

  TEST_F(JsonTagStoreTest, corrupt_file_is_unavailable) {
    write("{ not json");
    JsonTagStore store(file);
    try {
      store.lookup("04AA");
      FAIL() << "expected TAG_STORE_CORRUPT";
    } catch (const PeerError& e) {
      EXPECT_EQ(e.cls(), FailureClass::ResourceUnavailable);
      EXPECT_EQ(e.code(), "TAG_STORE_CORRUPT");
    }

    write(R"({"tags": []})");
    JsonTagStore wrongShape(file);
    EXPECT_THROW(wrongShape.lookup("04AA"), PeerError);
  }

  //---ShellPlaybackBackend----------------------------------------------------

  class ShellPlaybackBackendTest : public ::testing::Test {
  protected:
    FakeProcessRunner runner;
    ShellPlaybackBackend helper{ runner, { "hearo-playctl" }, 10s };

    /// Run \p call and return the PeerError it raised.
    template <typename F> PeerError raised(F&& call) {
      try {
        call();
      } catch (const PeerError& e) {
        return e;
      }
      ADD_FAILURE() << "no PeerError raised";
      return PeerError(FailureClass::Transient, "NONE", "");
    }
  };

  TEST_F(ShellPlaybackBackendTest, passes_arguments_to_the_helper) {
    runner.answer("hearo-playctl play spotify:track:1 1500", 0);
    runner.answer("hearo-playctl seek 30000", 0);
    EXPECT_NO_THROW(helper.play("spotify:track:1", 1500));
    EXPECT_NO_THROW(helper.seek(30000));
    EXPECT_EQ(runner.ran,
              (std::vector<std::string>{ "hearo-playctl play spotify:track:1 1500",
                                         "hearo-playctl seek 30000" }));
  }

  TEST_F(ShellPlaybackBackendTest, exit_status_selects_the_failure_class) {
    runner.answer("hearo-playctl ensure-ready", 2);
    auto auth = raised([&] { helper.ensureReady(); });
    EXPECT_EQ(auth.cls(), FailureClass::AuthIssue);
    EXPECT_EQ(auth.code(), "AUTH_FAILED");

    runner.answer("hearo-playctl pause", 3);
    auto device = raised([&] { helper.pause(); });
    EXPECT_EQ(device.cls(), FailureClass::ResourceUnavailable);
    EXPECT_EQ(device.code(), "DEVICE_UNAVAILABLE");

    runner.answer("hearo-playctl resume", 127);
    EXPECT_EQ(raised([&] { helper.resume(); }).code(), "BACKEND_UNAVAILABLE");

    auto other = raised([&] { helper.next(); }); // unscripted: exit 1
    EXPECT_EQ(other.cls(), FailureClass::Transient);
    EXPECT_EQ(other.code(), "BACKEND_ERROR");

    runner.timeout("hearo-playctl previous");
    EXPECT_EQ(raised([&] { helper.previous(); }).code(), "BACKEND_TIMEOUT");

    runner.unavailable("hearo-playctl ensure-ready");
    auto missing = raised([&] { helper.ensureReady(); });
    EXPECT_EQ(missing.cls(), FailureClass::ResourceUnavailable);
    EXPECT_EQ(missing.code(), "BACKEND_UNAVAILABLE");
  }

  TEST_F(ShellPlaybackBackendTest, status_parses_the_helper_json) {
    runner.answer("hearo-playctl status", 0,
                  R"({"is_playing": true, "uri": "spotify:track:9", "position_ms": 61000})");
    auto st = helper.status();
    EXPECT_TRUE(st.isPlaying);
    EXPECT_EQ(st.uri, "spotify:track:9");
    EXPECT_EQ(st.positionMs, 61000);

    runner.answer("hearo-playctl status", 0, "playing");
    EXPECT_EQ(raised([&] { helper.status(); }).code(), "BACKEND_BAD_OUTPUT");
  }

  TEST(shell_playback_backend, refuses_an_empty_helper) {
    FakeProcessRunner runner;
    EXPECT_THROW(ShellPlaybackBackend(runner, {}, 1s), std::invalid_argument);
  }

  //---PlsmDaemon--------------------------------------------------------------

  TEST(plsm_daemon, play_tag_status_and_shutdown_over_the_bus) {
    core::Logger log{ "plsm", core::LogLevel::None };
    core::HearoConfig cfg;
    auto bus = std::make_shared<FakeBus>();
    bus->listen(cfg.ipc.events);
    const std::string reply = "/tmp/hearo/test-reply.sock";
    bus->listen(reply);

    auto tags = std::make_unique<FakeTagStore>();
    tags->tags["04AA"] = TagEntry{ kKidsPlaylist, "", 0 };
    PlsmDaemon plsm(log, cfg, std::make_unique<FakePlaybackBackend>(), std::move(tags),
                    std::make_unique<FakeDatagramChannel>(bus));
    ASSERT_TRUE(plsm.start());
    plsm.step(); // authenticate
    ASSERT_EQ(plsm.fsm().state(), PlayerStateMachine::State::Ready);

    const auto self = cfg.ipc.endpoint(protocols::Peer::PLSM);
    protocols::EnvelopeFactory tester("hcsm");
    bus->inject(self, tester.makeCommand(names::kPlsmCommandPlayTag, { { "uid", "04AA" } }, reply));
    bus->inject(self, tester.makeCommand(names::kPlsmCommandStatus, nlohmann::json::object(), reply));
    plsm.step();

    auto results = bus->sentTo<protocols::Result>(reply);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].payload["uri"], kKidsPlaylist);
    EXPECT_EQ(results[1].payload["state"], "PL_PLAYING");

    bus->inject(self, tester.makeCommand(names::kPlsmCommandShutdown, nlohmann::json::object(), reply));
    plsm.step();
    EXPECT_FALSE(plsm.running());
    EXPECT_EQ(bus->sentTo<protocols::Result>(reply).size(), 3u);
  }

} // namespace hearo::test
