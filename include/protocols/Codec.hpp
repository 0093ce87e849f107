#pragma once
/** @file  Codec.hpp
 *  @brief JSON framing of envelopes (one envelope per datagram).
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// Hearo headers
#include "protocols/Envelope.hpp"

namespace hearo {
  namespace protocols {

    /// Compact JSON text for one envelope.
    std::string toWire(const Message& msg);

    /**
     * @brief Parse one datagram.
     *
     *  * Returns std::nullopt for invalid JSON, a missing/unknown `schema` or
     *    a body that lacks its mandatory fields; \p reason (if given) receives
     *    a one-line diagnostic.
     *  * Both the full schema ("hearo.ipc/event") and the bare kind ("event")
     *    are accepted; the correlation id is read from `corr`, `in-reply-to`
     *    or `correlates_to`.
     */
    std::optional<Message> fromWire(const std::string& raw, std::string* reason = nullptr);

  } // namespace protocols
} // namespace hearo
