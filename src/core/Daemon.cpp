/* @file Daemon.cpp
 * @brief daemon lifecycle + cooperative loop
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <type_traits>
#include <variant>

// Linux headers
#include <signal.h>
#include <unistd.h>

// Hearo headers
#include "core/Daemon.hpp"
#include "core/Logger.hpp"
#include "protocols/Names.hpp"

using namespace hearo::core;
namespace names = hearo::protocols::names;

namespace {
  volatile std::sig_atomic_t gSignal = 0;

  extern "C" void onSignal(int signo) { gSignal = signo; }
} // namespace

Daemon::Daemon(Logger& log, IpcConfig ipc, DaemonOptions options,
               std::unique_ptr<io::DatagramChannel> channel)
    : log_(log), ipc_(std::move(ipc)), options_(std::move(options)),
      factory_(protocols::toString(options_.self)), endpoint_(log_, std::move(channel)),
      publisher_(endpoint_, factory_, options_.sinks),
      errors_(std::make_shared<ErrorMonitor>()), server_(endpoint_, factory_, registry_, log_),
      client_(endpoint_, factory_, ipc_, errors_, log_) {

  errors_->registerEscalation([this](const FailureReport& r) {
    log_.error(r.code + ": " + r.message);
    publisher_.publish(protocols::lifecycleEvent(options_.self, names::kError),
                       { { "code", r.code }, { "message", r.message },
                         { "recovering", r.recovering } });
  });

  addCommand(ownName(names::kPing), [this](const protocols::Command& c) { return handlePing(c); });
  addCommand(ownName(names::kSetDebug),
             [this](const protocols::Command& c) { return handleSetDebug(c); });
}

void Daemon::installSignalHandlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: poll() must return so the loop sees the flag
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::string Daemon::ownName(std::string_view suffix) const {
  return std::string(protocols::eventPrefix(options_.self)) + "_" + std::string(suffix);
}

void Daemon::addCommand(std::string_view name, CommandRegistry::Handler handler) {
  if (!registry_.registerCommand(name, std::move(handler)))
    throw std::logic_error("[Daemon] duplicate command " + std::string(name));
}

std::int64_t Daemon::uptimeMs() const { return started_ ? steadyMs() - startedAt_ : 0; }

bool Daemon::start() {
  if (started_)
    return true;

  if (!endpoint_.bind(options_.bindPath)) {
    errors_->notifyFailure("BIND_FAILED", "cannot bind " + options_.bindPath, false);
    return false;
  }
  if (!options_.extraBindPath.empty()) {
    extraEndpoint_ = std::make_unique<Endpoint>(log_);
    if (!extraEndpoint_->bind(options_.extraBindPath)) {
      errors_->notifyFailure("BIND_FAILED", "cannot bind " + options_.extraBindPath, false);
      return false;
    }
  }

  startedAt_ = steadyMs();
  started_ = true;
  running_ = true;
  stopReason_.clear();

  if (!setup()) {
    if (errors_->lastErrorCode().empty())
      errors_->notifyFailure("INIT_FAILED", "daemon setup failed", false);
    log_.error("setup failed, not starting");
    started_ = false;
    running_ = false;
    return false;
  }

  publisher_.publish(protocols::lifecycleEvent(options_.self, names::kDaemonStarted),
                     { { "version", kVersion }, { "pid", static_cast<int>(::getpid()) } });
  log_.info(std::string(protocols::toString(options_.self)) + " started on " +
            options_.bindPath);
  nextTick_ = steadyMs();
  return true;
}

void Daemon::dispatch(protocols::Message&& msg) {
  std::visit(
      [&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocols::Command>) {
          server_.handle(m);
        } else if constexpr (std::is_same_v<T, protocols::Event>) {
          onEvent(m);
        } else {
          const auto request = client_.onReply(msg);
          onReply(msg, request);
        }
      },
      msg);
}

void Daemon::step() {
  if (!started_)
    return;

  const auto handler = [this](protocols::Message&& m) { dispatch(std::move(m)); };

  auto now = steadyMs();
  const auto wait = std::max<std::int64_t>(0, nextTick_ - now);
  endpoint_.pump(handler, std::chrono::milliseconds{ wait });
  if (extraEndpoint_)
    extraEndpoint_->pump(handler, std::chrono::milliseconds{ 0 });

  now = steadyMs();
  if (now < nextTick_ || !running_)
    return;

  tick(now);
  client_.expire(now);

  const auto period = options_.tick.count();
  nextTick_ += period;
  if (nextTick_ <= now) // fell behind; skip the missed ticks
    nextTick_ = now + period;
}

void Daemon::requestStop(std::string reason) {
  if (stopReason_.empty())
    stopReason_ = std::move(reason);
  running_ = false;
}

void Daemon::stop(const std::string& reason) {
  if (!started_)
    return;

  teardown();
  publisher_.publish(protocols::lifecycleEvent(options_.self, names::kDaemonStopped),
                     { { "reason", reason }, { "pid", static_cast<int>(::getpid()) } });
  log_.info(std::string(protocols::toString(options_.self)) + " stopped (" + reason + ")");
  log_.flush();
  started_ = false;
  running_ = false;
}

int Daemon::run() {
  if (!start()) {
    log_.flush();
    return 1;
  }

  while (running_) {
    if (gSignal != 0) {
      requestStop(gSignal == SIGINT ? "SIGINT" : "SIGTERM");
      break;
    }
    step();
  }

  stop(stopReason_.empty() ? "stopped" : stopReason_);
  return 0;
}

CommandOutcome Daemon::handlePing(const protocols::Command&) {
  nlohmann::json result = {
    { "daemon", protocols::toString(options_.self) },
    { "version", kVersion },
    { "status", statusText() },
    { "uptime_ms", uptimeMs() },
  };
  const auto code = errors_->lastErrorCode();
  result["last_error_code"] = code.empty() ? nlohmann::json(nullptr) : nlohmann::json(code);
  pingExtras(result);
  return CommandOutcome::done(std::move(result));
}

CommandOutcome Daemon::handleSetDebug(const protocols::Command& cmd) {
  const auto it = cmd.payload.find("level");
  if (it == cmd.payload.end() || !it->is_string())
    return CommandOutcome::rejected(std::string(names::kErrBadPayload), "level must be a string");

  const auto level = parseLevel(it->get<std::string>());
  if (!level)
    return CommandOutcome::rejected(std::string(names::kErrInvalidLevel),
                                    "unknown level " + it->get<std::string>());

  log_.setLevel(*level);
  log_.info(std::string("log level set to ") + toString(*level));
  return CommandOutcome::done({ { "level", toString(*level) } });
}
