#pragma once
/** @file  CommandServer.hpp
 *  @brief Ack/result policy around CommandRegistry.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>

#include "core/CommandRegistry.hpp"
#include "protocols/Envelope.hpp"

namespace hearo {
  namespace protocols {
    class EnvelopeFactory;
  }

  namespace core {

    class Endpoint;
    class Logger;

    /**
     * @class CommandServer
     * @brief Runs one inbound command and answers it.
     *
     *  * unknown name      -> ack{ok:false, UNKNOWN_CMD}, no result
     *  * handler rejected  -> ack{ok:false, <code>}, no result
     *  * handler accepted  -> ack{ok:true}, then exactly one result
     *  * empty reply path  -> handler still runs, nothing is sent back
     *
     * A handler that throws is answered with ack ok plus a failed
     * INTERNAL_ERROR result.
     */
    class CommandServer {
    public:
      CommandServer(Endpoint& endpoint, protocols::EnvelopeFactory& factory,
                    const CommandRegistry& registry, Logger& log);

      void handle(const protocols::Command& cmd);

      std::uint64_t handled() const { return handled_; }

    private:
      void reply(const protocols::Command& cmd, const protocols::Message& msg);

      Endpoint& endpoint_;
      protocols::EnvelopeFactory& factory_;
      const CommandRegistry& registry_;
      Logger& log_;
      std::uint64_t handled_{ 0 };
    };

  } // namespace core
} // namespace hearo
