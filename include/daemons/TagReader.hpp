#pragma once
/** @file  TagReader.hpp
 *  @brief NFC reader seam used by the NFC state machine, plus the PN532 implementation.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Hearo headers
#include "io/Pn532I2C.hpp"

namespace hearo::daemons {

  /**
 * @class TagReader
 * @brief One read cycle per call; failures are thrown as core::PeerError.
 *
 *  * `init()`     : ResourceUnavailable / HW_NOT_FOUND when the reader is absent.
 *  * `readUid()`  : Transient / I2C_TIMEOUT on a bus failure; std::nullopt
 *                   simply means no tag in the field.
 */
  class TagReader {
  public:
    virtual ~TagReader() = default;

    virtual void init() = 0;
    virtual std::optional<std::string> readUid() = 0;
    virtual void close() = 0;
  };

  class Pn532TagReader : public TagReader {
  public:
    Pn532TagReader(std::string device, std::uint8_t address, std::chrono::milliseconds timeout,
                   std::unique_ptr<io::Pn532I2C> chip = std::make_unique<io::Pn532I2C>());

    void init() override;
    std::optional<std::string> readUid() override;
    void close() override { chip_->close(); }

  private:
    std::string device_;
    std::uint8_t address_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<io::Pn532I2C> chip_;
  };

} // namespace hearo::daemons
