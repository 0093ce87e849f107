/* @file Pn532I2C.cpp
 * @brief PN532 frame build / parse over the Linux i2c-dev interface
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <thread>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

// Hearo headers
#include "io/Pn532I2C.hpp"

using namespace hearo::io;

namespace {
  constexpr std::uint8_t kHostToPn532 = 0xD4;
  constexpr std::uint8_t kPn532ToHost = 0xD5;

  constexpr std::uint8_t kCmdGetFirmwareVersion = 0x02;
  constexpr std::uint8_t kCmdSamConfiguration = 0x14;
  constexpr std::uint8_t kCmdRfConfiguration = 0x32;
  constexpr std::uint8_t kCmdInListPassiveTarget = 0x4A;

  constexpr std::array<std::uint8_t, 6> kAckFrame{ 0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00 };
  constexpr std::chrono::milliseconds kAckTimeout{ 50 };
  constexpr std::chrono::milliseconds kSetupTimeout{ 500 };
  constexpr std::chrono::milliseconds kReadyPoll{ 5 };
  constexpr std::size_t kMaxFrame = 64;
} // namespace

Pn532I2C::~Pn532I2C() { close(); }

bool Pn532I2C::open(const std::string& device, std::uint8_t address) {
  close();

  fd_ = ::open(device.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    lastError_ = "open " + device + ": " + std::strerror(errno);
    return false;
  }
  if (::ioctl(fd_, I2C_SLAVE, address) < 0) {
    lastError_ = std::string("I2C_SLAVE: ") + std::strerror(errno);
    close();
    return false;
  }

  auto fw = exchange(kCmdGetFirmwareVersion, {}, kSetupTimeout);
  if (!fw || fw->size() < 4) {
    if (fw)
      lastError_ = "short firmware version reply";
    close();
    return false;
  }
  firmware_ = (static_cast<std::uint32_t>((*fw)[0]) << 24) |
              (static_cast<std::uint32_t>((*fw)[1]) << 16) |
              (static_cast<std::uint32_t>((*fw)[2]) << 8) | (*fw)[3];

  // normal mode, virtual card timeout 50ms*20, IRQ used
  if (!exchange(kCmdSamConfiguration, { 0x01, 0x14, 0x01 }, kSetupTimeout)) {
    close();
    return false;
  }
  // MxRtyPassiveActivation: give up after a few retries instead of waiting forever
  if (!exchange(kCmdRfConfiguration, { 0x05, 0xFF, 0x01, 0x10 }, kSetupTimeout)) {
    close();
    return false;
  }
  return true;
}

bool Pn532I2C::readPassiveTarget(std::optional<std::string>& uid,
                                 std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    lastError_ = "reader not open";
    return false;
  }
  if (!writeCommand(kCmdInListPassiveTarget, { 0x01, 0x00 }))
    return false;
  if (waitReady(kAckTimeout) != Wait::Ready || !readAck()) {
    if (lastError_.empty())
      lastError_ = "no ACK";
    return false;
  }

  switch (waitReady(timeout)) {
  case Wait::Timeout:
    uid = std::nullopt; // field empty within the window
    return true;
  case Wait::Failed:
    return false;
  case Wait::Ready:
    break;
  }

  auto reply = readResponse(kCmdInListPassiveTarget);
  if (!reply)
    return false;

  // NbTg, Tg, SENS_RES[2], SEL_RES, NFCIDLength, NFCID...
  const auto& r = *reply;
  if (r.empty() || r[0] == 0) {
    uid = std::nullopt;
    return true;
  }
  if (r.size() < 6 || r.size() < 6u + r[5]) {
    lastError_ = "truncated target reply";
    return false;
  }
  std::string hex;
  char byte[3];
  for (std::size_t i = 0; i < r[5]; ++i) {
    std::snprintf(byte, sizeof(byte), "%02X", r[6 + i]);
    hex += byte;
  }
  uid = hex;
  return true;
}

void Pn532I2C::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

bool Pn532I2C::writeCommand(std::uint8_t cmd, const std::vector<std::uint8_t>& data) {
  const auto len = static_cast<std::uint8_t>(data.size() + 2);
  std::vector<std::uint8_t> frame{ 0x00, 0x00, 0xFF, len, static_cast<std::uint8_t>(~len + 1),
                                   kHostToPn532, cmd };
  std::uint8_t sum = kHostToPn532 + cmd;
  for (auto b : data) {
    frame.push_back(b);
    sum += b;
  }
  frame.push_back(static_cast<std::uint8_t>(~sum + 1));
  frame.push_back(0x00);

  while (true) {
    ssize_t n = ::write(fd_, frame.data(), frame.size());
    if (n == static_cast<ssize_t>(frame.size())) {
      lastError_.clear();
      return true;
    }
    if (n < 0 && errno == EINTR)
      continue;
    lastError_ = n < 0 ? std::string("i2c write: ") + std::strerror(errno) : "i2c short write";
    return false;
  }
}

Pn532I2C::Wait Pn532I2C::waitReady(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::uint8_t status = 0;
  while (true) {
    ssize_t n = ::read(fd_, &status, 1);
    if (n < 0 && errno != EINTR) {
      lastError_ = std::string("i2c read: ") + std::strerror(errno);
      return Wait::Failed;
    }
    if (n == 1 && (status & 0x01))
      return Wait::Ready;
    if (std::chrono::steady_clock::now() >= deadline)
      return Wait::Timeout;
    std::this_thread::sleep_for(kReadyPoll);
  }
}

bool Pn532I2C::readAck() {
  std::array<std::uint8_t, kAckFrame.size() + 1> buf{};
  ssize_t n = ::read(fd_, buf.data(), buf.size());
  if (n != static_cast<ssize_t>(buf.size())) {
    lastError_ = "i2c ACK read failed";
    return false;
  }
  if (!std::equal(kAckFrame.begin(), kAckFrame.end(), buf.begin() + 1)) {
    lastError_ = "bad ACK frame";
    return false;
  }
  return true;
}

std::optional<std::vector<std::uint8_t>> Pn532I2C::readResponse(std::uint8_t cmd) {
  std::array<std::uint8_t, kMaxFrame + 1> buf{};
  ssize_t n = ::read(fd_, buf.data(), buf.size());
  if (n < 8) {
    lastError_ = n < 0 ? std::string("i2c read: ") + std::strerror(errno) : "short frame";
    return std::nullopt;
  }
  // buf[0] is the ready byte; the frame follows
  const std::uint8_t* f = buf.data() + 1;
  if (f[0] != 0x00 || f[1] != 0x00 || f[2] != 0xFF) {
    lastError_ = "bad frame preamble";
    return std::nullopt;
  }
  const std::uint8_t len = f[3];
  if (static_cast<std::uint8_t>(len + f[4]) != 0 || len < 2 ||
      static_cast<std::size_t>(len) + 7 > static_cast<std::size_t>(n - 1)) {
    lastError_ = "bad frame length";
    return std::nullopt;
  }
  if (f[5] != kPn532ToHost || f[6] != cmd + 1) {
    lastError_ = "unexpected response code";
    return std::nullopt;
  }
  std::uint8_t sum = 0;
  for (std::size_t i = 0; i < len; ++i)
    sum += f[5 + i];
  if (static_cast<std::uint8_t>(sum + f[5 + len]) != 0) {
    lastError_ = "frame checksum mismatch";
    return std::nullopt;
  }
  return std::vector<std::uint8_t>(f + 7, f + 5 + len);
}

std::optional<std::vector<std::uint8_t>>
Pn532I2C::exchange(std::uint8_t cmd, const std::vector<std::uint8_t>& data,
                   std::chrono::milliseconds timeout) {
  if (!writeCommand(cmd, data))
    return std::nullopt;
  if (waitReady(kAckTimeout) != Wait::Ready || !readAck()) {
    if (lastError_.empty())
      lastError_ = "no ACK";
    return std::nullopt;
  }
  if (waitReady(timeout) != Wait::Ready) {
    if (lastError_.empty())
      lastError_ = "response timeout";
    return std::nullopt;
  }
  return readResponse(cmd);
}
