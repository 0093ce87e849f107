/* @file DatagramChannel.cpp
 * @brief IO abstraction that wraps an AF_UNIX datagram socket - handles file descriptor, bind
 *        reclaim, single datagram io and RAII - POSIX compliant
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <filesystem>
#include <system_error>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

// Hearo headers
#include "io/DatagramChannel.hpp"

using namespace hearo::io;

namespace {
  bool fillAddress(const std::string& path, sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
      return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
  }

  std::string errnoText(const char* call) {
    return std::string(call) + ": " + std::strerror(errno);
  }
} // namespace

DatagramChannel::~DatagramChannel() { close(); }

DatagramChannel::DatagramChannel(DatagramChannel&& other) noexcept
    : lastError_(std::move(other.lastError_)),
      fd_(std::exchange(other.fd_, -1)),
      path_(std::exchange(other.path_, {})) {}

DatagramChannel& DatagramChannel::operator=(DatagramChannel&& other) noexcept {
  if (this != &other) {
    close();
    lastError_ = std::move(other.lastError_);
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

bool DatagramChannel::ensureSocket() {
  if (fd_ >= 0)
    return true;
  fd_ = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    lastError_ = errnoText("socket");
    return false;
  }
  return true;
}

bool DatagramChannel::bind(const std::string& path) {
  // re-binding the same object: drop the old address first
  close();
  lastError_.clear();

  sockaddr_un addr;
  if (!fillAddress(path, addr)) {
    lastError_ = "invalid socket path '" + path + "'";
    return false;
  }

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);
  if (ec) {
    lastError_ = "mkdir " + parent.string() + ": " + ec.message();
    return false;
  }

  // the previous owner is assumed dead; its file would make bind() fail with EADDRINUSE
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    lastError_ = errnoText("unlink");
    return false;
  }

  if (!ensureSocket())
    return false;

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    lastError_ = errnoText("bind");
    close();
    return false;
  }
  // peers running under other uids must be able to send here
  if (::chmod(path.c_str(), 0666) != 0)
    lastError_ = errnoText("chmod");
  path_ = path;
  return true;
}

bool DatagramChannel::sendTo(const std::string& peerPath, const std::string& data) {
  sockaddr_un addr;
  if (!fillAddress(peerPath, addr)) {
    lastError_ = "invalid peer path '" + peerPath + "'";
    return false;
  }
  if (!ensureSocket())
    return false;

  while (true) {
    ssize_t sent = ::sendto(fd_, data.data(), data.size(), MSG_NOSIGNAL,
                            reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent == static_cast<ssize_t>(data.size()))
      return true;
    if (sent == -1 && errno == EINTR)
      continue; // try again
    // ENOENT / ECONNREFUSED: nobody bound there, EAGAIN: receiver queue full
    lastError_ = sent < 0 ? errnoText("sendto") : std::string("sendto: short write");
    return false;
  }
}

// -------------------------------------------------------------------
// DatagramChannel::receive
// Waits for one datagram with timeout.
// Returns std::nullopt on timeout, signal or error.
// -------------------------------------------------------------------
std::optional<std::string> DatagramChannel::receive(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    auto msLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = msLeft.count() > 0 ? static_cast<int>(msLeft.count()) : 0;

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        return std::nullopt; // a signal: let the caller look at its flags
      lastError_ = errnoText("poll");
      return std::nullopt;
    }
    if (rc == 0)
      return std::nullopt; // timeout

    if (pfd.revents & POLLIN) {
      std::string buf(kMaxDatagram, '\0');
      ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
      if (n >= 0) {
        buf.resize(static_cast<std::size_t>(n));
        return buf;
      }
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue; // transient → retry
      lastError_ = errnoText("recv");
      return std::nullopt;
    }
    lastError_ = "poll: unexpected revents";
    return std::nullopt;
  }
}

void DatagramChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  if (!path_.empty())
    ::unlink(path_.c_str());
  path_.clear();
}
