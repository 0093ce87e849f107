/* @file GPIOInput.cpp
 * @brief gpiochip v1 line-handle ioctls
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

// Hearo headers
#include "io/GPIOInput.hpp"

using namespace hearo::io;

GPIOInput::~GPIOInput() { close(); }

GPIOInput::GPIOInput(GPIOInput&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), lastError_(std::move(other.lastError_)) {}

GPIOInput& GPIOInput::operator=(GPIOInput&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

bool GPIOInput::open(const std::string& chip, unsigned int line, bool activeLow,
                     const std::string& consumer) {
  close();

  int chipFd = ::open(chip.c_str(), O_RDONLY | O_CLOEXEC);
  if (chipFd < 0) {
    lastError_ = "open " + chip + ": " + std::strerror(errno);
    return false;
  }

  gpiohandle_request req;
  std::memset(&req, 0, sizeof(req));
  req.lineoffsets[0] = line;
  req.lines = 1;
  req.flags = GPIOHANDLE_REQUEST_INPUT;
  if (activeLow)
    req.flags |= GPIOHANDLE_REQUEST_ACTIVE_LOW | GPIOHANDLE_REQUEST_BIAS_PULL_UP;
  std::strncpy(req.consumer_label, consumer.c_str(), sizeof(req.consumer_label) - 1);

  int rc = ::ioctl(chipFd, GPIO_GET_LINEHANDLE_IOCTL, &req);
  int savedErrno = errno;
  ::close(chipFd); // the line handle outlives the chip fd
  if (rc < 0) {
    lastError_ = "line " + std::to_string(line) + " request: " + std::strerror(savedErrno);
    return false;
  }

  fd_ = req.fd;
  return true;
}

std::optional<bool> GPIOInput::readLevel() {
  if (fd_ < 0) {
    lastError_ = "line not open";
    return std::nullopt;
  }
  gpiohandle_data data;
  std::memset(&data, 0, sizeof(data));
  if (::ioctl(fd_, GPIOHANDLE_GET_LINE_VALUES_IOCTL, &data) < 0) {
    lastError_ = std::string("read: ") + std::strerror(errno);
    return std::nullopt;
  }
  return data.values[0] != 0;
}

void GPIOInput::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
