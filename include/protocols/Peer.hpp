#pragma once
/** @file  Peer.hpp
 *  @brief Identities of the daemons that share the local event bus.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hearo {
  namespace protocols {

    enum class Peer : std::uint8_t { NFC, BD, LEDD, WSM, PLSM, POWD, HCSM, Count };
    static_assert(static_cast<std::uint8_t>(Peer::Count) == 7,
                  "Peer count changed please update code that depends on it");

    /// Short daemon name used in logs, ids and PING results ("nfcd", "bd", ...).
    inline const char* toString(Peer p) {
      switch (p) {
      case Peer::NFC:
        return "nfcd";
      case Peer::BD:
        return "bd";
      case Peer::LEDD:
        return "ledd";
      case Peer::WSM:
        return "wsm";
      case Peer::PLSM:
        return "plsm";
      case Peer::POWD:
        return "powd";
      case Peer::HCSM:
        return "hcsm";
      default:
        return "unknown";
      }
    }

    /// Prefix of every event the peer emits (`NFC` -> `NFC_EVENT_TAG_ADDED`).
    inline const char* eventPrefix(Peer p) {
      switch (p) {
      case Peer::NFC:
        return "NFC";
      case Peer::BD:
        return "BD";
      case Peer::LEDD:
        return "LEDD";
      case Peer::WSM:
        return "WSM";
      case Peer::PLSM:
        return "PLSM";
      case Peer::POWD:
        return "POWD";
      case Peer::HCSM:
        return "HCSM";
      default:
        return "UNKNOWN";
      }
    }

    inline constexpr std::array<Peer, 7> kAllPeers{ Peer::NFC,  Peer::BD,   Peer::LEDD, Peer::WSM,
                                                    Peer::PLSM, Peer::POWD, Peer::HCSM };

    /// Reverse of toString(); accepts the short daemon name.
    inline std::optional<Peer> peerFromName(std::string_view name) {
      for (auto p : kAllPeers) {
        if (name == toString(p))
          return p;
      }
      return std::nullopt;
    }

    /// `<PREFIX>_EVENT_DAEMON_STARTED` / `_STOPPED` / `_ERROR` for a peer.
    inline std::string lifecycleEvent(Peer p, std::string_view suffix) {
      return std::string(eventPrefix(p)) + "_EVENT_" + std::string(suffix);
    }

    /// Maps `NFC_EVENT_DAEMON_STARTED` back to Peer::NFC (nullopt if not a lifecycle name).
    inline std::optional<Peer> peerFromLifecycleEvent(std::string_view event,
                                                      std::string_view suffix) {
      for (auto p : kAllPeers) {
        if (event == lifecycleEvent(p, suffix))
          return p;
      }
      return std::nullopt;
    }

  } // namespace protocols
} // namespace hearo
