/* @file TagReader.cpp
 * @brief PN532 bool/lastError results -> classified PeerError
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "core/PeerError.hpp"
#include "daemons/TagReader.hpp"

using namespace hearo::daemons;
using hearo::core::FailureClass;
using hearo::core::PeerError;

Pn532TagReader::Pn532TagReader(std::string device, std::uint8_t address,
                               std::chrono::milliseconds timeout,
                               std::unique_ptr<io::Pn532I2C> chip)
    : device_(std::move(device)), address_(address), timeout_(timeout), chip_(std::move(chip)) {}

void Pn532TagReader::init() {
  chip_->close();
  if (!chip_->open(device_, address_))
    throw PeerError(FailureClass::ResourceUnavailable, "HW_NOT_FOUND",
                    "PN532 on " + device_ + ": " + chip_->lastError());
}

std::optional<std::string> Pn532TagReader::readUid() {
  std::optional<std::string> uid;
  if (!chip_->readPassiveTarget(uid, timeout_))
    throw PeerError(FailureClass::Transient, "I2C_TIMEOUT", chip_->lastError());
  return uid;
}
