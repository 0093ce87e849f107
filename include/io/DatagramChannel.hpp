#pragma once
/** @file  DatagramChannel.hpp
 *  @brief Non-blocking AF_UNIX datagram socket wrapper (poll under the hood).
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace hearo {
  namespace io {

    /**
 * @class DatagramChannel
 * @brief RAII wrapper around one AF_UNIX/SOCK_DGRAM file descriptor.
 *
 *  * One datagram == one message; no stream framing.
 *  * `bind()` unlinks a stale socket file left by a dead previous owner.
 *  * *Non-copyable*, but move-constructible.
 */

    class DatagramChannel {

    public:
      static constexpr std::size_t kMaxDatagram = 65535;

      //---ctr / dtr--------------------------------------------
      DatagramChannel() = default;
      virtual ~DatagramChannel(); // closes the fd and unlinks the bound path

      //---public API-------------------------------------------
      /// Create the socket and bind it to \p path, reclaiming any previous file.
      /// Clears lastError(); a non-empty one after success is a warning.
      virtual bool bind(const std::string& path);

      /// Fire one datagram at \p peerPath. Returns false on any socket error.
      virtual bool sendTo(const std::string& peerPath, const std::string& data);

      /// Wait up to \p timeout for one datagram; std::nullopt on timeout, signal or error.
      virtual std::optional<std::string> receive(std::chrono::milliseconds timeout);

      void close();

      const std::string& boundPath() const { return path_; }
      const std::string& lastError() const { return lastError_; }
      int fd() const { return fd_; }

      //---non-copyable-----------------------------------------
      DatagramChannel(const DatagramChannel&) = delete;
      DatagramChannel& operator=(const DatagramChannel&) = delete;

      //---mv and mv assign-------------------------------------
      DatagramChannel(DatagramChannel&& other) noexcept;
      DatagramChannel& operator=(DatagramChannel&& other) noexcept;

    protected:
      std::string lastError_{}; ///< errno text of the last failed call

    private:
      bool ensureSocket();

      int fd_{ -1 };       ///< socket fd (-1==closed)
      std::string path_{}; ///< bound path ("" == send-only)
    };
  } // namespace io
} // namespace hearo
