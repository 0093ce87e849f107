// Hearo-Prod headers
#include "io/BatteryGauge.hpp"
#include "io/ButtonGPIO.hpp"
#include "io/DatagramChannel.hpp"
#include "io/FileLogger.hpp"
#include "io/ProcessRunner.hpp"

// Hearo-Fake headers
#include "FakeGPIOInput.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <signal.h>
#include <sys/time.h>
#include <unistd.h>

namespace hearo::test {

  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  class TempDir : public ::testing::Test {
  protected:
    void SetUp() override {
      dir = fs::temp_directory_path() /
            ("hearo-io-" + std::to_string(::getpid()) + "-" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::remove_all(dir);
      fs::create_directories(dir);
    }
    void TearDown() override {
      std::error_code ec;
      fs::remove_all(dir, ec);
    }

    std::string path(const std::string& leaf) const { return (dir / leaf).string(); }

    static std::string slurp(const std::string& p) {
      std::ifstream in(p);
      return std::string(std::istreambuf_iterator<char>(in), {});
    }

    fs::path dir;
  };

  //---DatagramChannel--------------------------------------------------------

  using DatagramChannelTest = TempDir;

  TEST_F(DatagramChannelTest, one_send_is_one_datagram) {
    io::DatagramChannel rx, tx;
    ASSERT_TRUE(rx.bind(path("rx.sock")));

    ASSERT_TRUE(tx.sendTo(path("rx.sock"), R"({"a":1})"));
    ASSERT_TRUE(tx.sendTo(path("rx.sock"), R"({"b":2})"));

    auto first = rx.receive(100ms);
    auto second = rx.receive(100ms);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, R"({"a":1})");
    EXPECT_EQ(*second, R"({"b":2})");
    EXPECT_FALSE(rx.receive(10ms));
  }

  TEST_F(DatagramChannelTest, sending_to_nobody_fails_without_blocking) {
    io::DatagramChannel tx;
    EXPECT_FALSE(tx.sendTo(path("nobody.sock"), "x"));
    EXPECT_FALSE(tx.lastError().empty());
  }

  TEST_F(DatagramChannelTest, rebind_after_a_failed_send_starts_clean) {
    io::DatagramChannel ch;
    ASSERT_FALSE(ch.sendTo(path("nobody.sock"), "x"));
    ASSERT_FALSE(ch.lastError().empty());

    ASSERT_TRUE(ch.bind(path("me.sock")));
    EXPECT_TRUE(ch.lastError().empty());
  }

  namespace {
    extern "C" void ignoreAlarm(int) {}
  } // namespace

  TEST_F(DatagramChannelTest, a_signal_ends_the_wait_early) {
    io::DatagramChannel rx;
    ASSERT_TRUE(rx.bind(path("rx.sock")));

    struct sigaction sa, previous;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = ignoreAlarm;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART, like the daemon handlers
    ASSERT_EQ(::sigaction(SIGALRM, &sa, &previous), 0);

    itimerval timer{};
    timer.it_value.tv_usec = 50 * 1000;
    ASSERT_EQ(::setitimer(ITIMER_REAL, &timer, nullptr), 0);

    const auto t0 = std::chrono::steady_clock::now();
    auto got = rx.receive(5s);
    const auto waited = std::chrono::steady_clock::now() - t0;

    itimerval off{};
    ::setitimer(ITIMER_REAL, &off, nullptr);
    ::sigaction(SIGALRM, &previous, nullptr);

    EXPECT_FALSE(got.has_value());
    EXPECT_LT(waited, 2s);
    EXPECT_TRUE(rx.lastError().empty());
  }

  TEST_F(DatagramChannelTest, bind_reclaims_a_stale_socket_file) {
    {
      std::ofstream stale(path("bus.sock"));
      stale << "left over";
    }
    io::DatagramChannel rx;
    ASSERT_TRUE(rx.bind(path("bus.sock")));
    EXPECT_EQ(rx.boundPath(), path("bus.sock"));

    io::DatagramChannel tx;
    ASSERT_TRUE(tx.sendTo(path("bus.sock"), "hello"));
    EXPECT_EQ(rx.receive(100ms).value_or(""), "hello");
  }

  TEST_F(DatagramChannelTest, close_unlinks_the_bound_path) {
    {
      io::DatagramChannel rx;
      ASSERT_TRUE(rx.bind(path("gone.sock")));
      EXPECT_TRUE(fs::exists(path("gone.sock")));
    }
    EXPECT_FALSE(fs::exists(path("gone.sock")));
  }

  TEST_F(DatagramChannelTest, rejects_paths_too_long_for_sockaddr_un) {
    io::DatagramChannel rx;
    EXPECT_FALSE(rx.bind(path(std::string(200, 'x'))));
    EXPECT_NE(rx.lastError().find("invalid socket path"), std::string::npos);
  }

  //---FileLogger------------------------------------------------------------

  using FileLoggerTest = TempDir;

  TEST_F(FileLoggerTest, buffers_until_flush) {
    io::FileLogger log;
    ASSERT_TRUE(log.open(path("hearo.log")));
    log.write("line one\n");
    EXPECT_EQ(slurp(path("hearo.log")), "");
    ASSERT_TRUE(log.flush());
    EXPECT_EQ(slurp(path("hearo.log")), "line one\n");
  }

  TEST_F(FileLoggerTest, rotates_and_keeps_n_backups) {
    io::FileLogger log;
    ASSERT_TRUE(log.open(path("hearo.log"), 10, 2));
    log.write("aaaaaaaa\n"); // 9 bytes
    log.write("bbbbbbbb\n"); // would pass 10 -> rotate
    log.write("cccccccc\n");
    log.write("dddddddd\n");
    ASSERT_TRUE(log.flush());

    EXPECT_EQ(slurp(path("hearo.log")), "dddddddd\n");
    EXPECT_EQ(slurp(path("hearo.log.1")), "cccccccc\n");
    EXPECT_EQ(slurp(path("hearo.log.2")), "bbbbbbbb\n");
    EXPECT_FALSE(fs::exists(path("hearo.log.3")));
  }

  //---ProcessRunner-----------------------------------------------------------

  TEST(process_runner, captures_stdout_and_exit_status) {
    io::ProcessRunner runner;
    auto res = runner.run({ "/bin/echo", "hello", "hearo" }, 2000ms);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->exitCode, 0);
    EXPECT_FALSE(res->timedOut);
    EXPECT_EQ(res->output, "hello hearo\n");

    auto fail = runner.run({ "/bin/sh", "-c", "exit 3" }, 2000ms);
    ASSERT_TRUE(fail);
    EXPECT_EQ(fail->exitCode, 3);
  }

  TEST(process_runner, missing_program_exits_127) {
    io::ProcessRunner runner;
    auto res = runner.run({ "hearo-no-such-tool" }, 2000ms);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->exitCode, 127);
  }

  TEST(process_runner, kills_a_child_past_its_deadline) {
    io::ProcessRunner runner;
    const auto start = std::chrono::steady_clock::now();
    auto res = runner.run({ "/bin/sleep", "5" }, 100ms);
    ASSERT_TRUE(res);
    EXPECT_TRUE(res->timedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  }

  //---BatteryGauge------------------------------------------------------------

  using BatteryGaugeTest = TempDir;

  TEST_F(BatteryGaugeTest, reads_capacity_and_charging_status) {
    std::ofstream(path("capacity")) << "57\n";
    std::ofstream(path("status")) << "Charging\n";

    io::SysfsBatteryGauge gauge(dir.string());
    auto r = gauge.read();
    ASSERT_TRUE(r);
    EXPECT_EQ(r->soc, 57);
    EXPECT_TRUE(r->extPower);
  }

  TEST_F(BatteryGaugeTest, online_file_overrides_status) {
    std::ofstream(path("capacity")) << "101\n";
    std::ofstream(path("status")) << "Charging\n";
    std::ofstream(path("online")) << "0\n";

    io::SysfsBatteryGauge gauge(dir.string(), path("online"));
    auto r = gauge.read();
    ASSERT_TRUE(r);
    EXPECT_EQ(r->soc, 100);
    EXPECT_FALSE(r->extPower);
  }

  TEST_F(BatteryGaugeTest, missing_or_garbage_capacity_is_an_error) {
    io::SysfsBatteryGauge gauge(dir.string());
    EXPECT_FALSE(gauge.read());
    EXPECT_NE(gauge.lastError().find("capacity"), std::string::npos);

    std::ofstream(path("capacity")) << "full\n";
    EXPECT_FALSE(gauge.read());
    EXPECT_NE(gauge.lastError().find("bad capacity"), std::string::npos);
  }

  //---ButtonGPIO--------------------------------------------------------------

  TEST(button_gpio, reports_interactions_with_its_name) {
    auto line = std::make_shared<FakeLine>();
    io::ButtonGPIO button("NEXT", std::make_unique<FakeGPIOInput>(line));

    std::vector<std::pair<std::string, io::InteractionEvent>> seen;
    button.registerCallback(
        [&](const std::string& name, const io::InteractionEvent& ev) { seen.emplace_back(name, ev); });

    std::chrono::milliseconds t{ 0 };
    line->pressed = true;
    for (; t < 200ms; t += 10ms)
      EXPECT_TRUE(button.poll(t));
    line->pressed = false;
    for (; t < 300ms; t += 10ms)
      EXPECT_TRUE(button.poll(t));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].first, "NEXT");
    EXPECT_EQ(seen[0].second.kind, io::Interaction::ShortPress);
    EXPECT_EQ(seen[0].second.duration, 200ms);
  }

  TEST(button_gpio, failed_read_counts_as_released) {
    auto line = std::make_shared<FakeLine>();
    io::ButtonGPIO button("PREV", std::make_unique<FakeGPIOInput>(line));

    line->pressed = true;
    line->readFails = true;
    EXPECT_FALSE(button.poll(0ms));
    EXPECT_FALSE(button.poll(100ms));
    EXPECT_EQ(button.classifier().state(), io::InteractionClassifier::State::Idle);
    EXPECT_FALSE(button.lastError().empty());
  }

} // namespace hearo::test
