#pragma once
/** @file  Pn532I2C.hpp
 *  @brief PN532 NFC controller spoken to through /dev/i2c-N.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hearo {
  namespace io {

    /**
 * @class Pn532I2C
 * @brief Minimal host side of the PN532 frame protocol (normal information frames).
 *
 *  * Every exchange is: write frame -> wait ready -> read ACK -> wait ready -> read reply.
 *  * "ready" is the status byte the PN532 prepends to every I2C read (0x01).
 *  * Only ISO14443A passive target listing is needed; UIDs are upper-case hex
 *    without separators ("04A1B2C3").
 *  * Reports failures through bool/optional + lastError(); never throws.
 */
    class Pn532I2C {
    public:
      static constexpr std::uint8_t kDefaultAddress = 0x24;

      Pn532I2C() = default;
      virtual ~Pn532I2C();

      //---public API-------------------------------------------
      /// Open the bus, select the slave, read the firmware version and enable SAM.
      virtual bool open(const std::string& device, std::uint8_t address = kDefaultAddress);

      /**
       * @brief One InListPassiveTarget cycle.
       * @param uid  set to the tag UID, or std::nullopt when no tag answered
       * @returns false on bus / protocol failure (uid untouched)
       */
      virtual bool readPassiveTarget(std::optional<std::string>& uid,
                                     std::chrono::milliseconds timeout);

      void close();

      bool isOpen() const { return fd_ >= 0; }
      const std::string& lastError() const { return lastError_; }
      std::uint32_t firmwareVersion() const { return firmware_; }

      //---non-copyable-----------------------------------------
      Pn532I2C(const Pn532I2C&) = delete;
      Pn532I2C& operator=(const Pn532I2C&) = delete;

    protected:
      std::string lastError_{};

    private:
      enum class Wait { Ready, Timeout, Failed };

      bool writeCommand(std::uint8_t cmd, const std::vector<std::uint8_t>& data);
      Wait waitReady(std::chrono::milliseconds timeout);
      bool readAck();
      std::optional<std::vector<std::uint8_t>> readResponse(std::uint8_t cmd);
      std::optional<std::vector<std::uint8_t>> exchange(std::uint8_t cmd,
                                                        const std::vector<std::uint8_t>& data,
                                                        std::chrono::milliseconds timeout);

      int fd_{ -1 };
      std::uint32_t firmware_{ 0 };
    };

  } // namespace io
} // namespace hearo
