#pragma once
/** @file  Endpoint.hpp
 *  @brief Envelope transport: one bound datagram socket + best-effort send.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Hearo headers
#include "io/DatagramChannel.hpp"
#include "protocols/Envelope.hpp"

namespace hearo {
  namespace core {

    class Logger;

    /**
     * @class Endpoint
     * @brief Owns the process' receive address and speaks envelopes over it.
     *
     *  * `bind()` reclaims a stale path left by a previous lifetime.
     *  * `send()` never throws; a transport failure is logged, counted and
     *    reported through the return value.
     *  * `pump()` decodes everything that arrives within the wait budget;
     *    malformed datagrams are dropped with a warning.
     *  * The same socket sends and receives, so peers see our bound path as
     *    the datagram source.
     */
    class Endpoint {
    public:
      using Handler = std::function<void(protocols::Message&&)>;

      explicit Endpoint(Logger& log, std::unique_ptr<io::DatagramChannel> channel =
                                         std::make_unique<io::DatagramChannel>());
      virtual ~Endpoint() = default;

      //---public API------------------------------------------------------
      bool bind(const std::string& path);

      /// Encode and fire one envelope at \p to. @returns false if it was lost locally.
      virtual bool send(const std::string& to, const protocols::Message& msg);

      /**
       * @brief Deliver pending envelopes to \p handler.
       *
       * Blocks up to \p wait for the first datagram, then drains whatever is
       * already queued without waiting. @returns number of envelopes delivered.
       */
      std::size_t pump(const Handler& handler, std::chrono::milliseconds wait);

      const std::string& path() const { return channel_->boundPath(); }
      std::uint64_t sendFailures() const { return sendFailures_; }
      std::uint64_t dropped() const { return dropped_; }

      Endpoint(const Endpoint&) = delete;
      Endpoint& operator=(const Endpoint&) = delete;

    private:
      static constexpr std::size_t kMaxDrain = 64; ///< per pump, keeps the tick on time

      Logger& log_;
      std::unique_ptr<io::DatagramChannel> channel_;
      std::uint64_t sendFailures_{ 0 };
      std::uint64_t dropped_{ 0 };
    };

  } // namespace core
} // namespace hearo
