#pragma once
/** @file  Envelope.hpp
 *  @brief The four message kinds carried on the Hearo bus.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace hearo {
  namespace protocols {

    inline constexpr int kProtocolVersion = 1;

    enum class MessageKind { Event, Command, Ack, Result };

    /// Schema tag written on the wire ("hearo.ipc/event", ...).
    const char* schemaOf(MessageKind kind);

    /// Fields every envelope carries regardless of kind.
    struct Header {
      std::string id;             ///< process-unique, e.g. "evt-bd-12"
      std::int64_t timestamp{ 0 }; ///< ms since epoch
      int version{ kProtocolVersion };
    };

    struct ErrorInfo {
      std::string code;
      std::string message;

      bool operator==(const ErrorInfo&) const = default;
    };

    struct Event {
      Header header;
      std::string name;
      nlohmann::json payload = nlohmann::json::object();
    };

    /**
     * @brief Request addressed to one peer endpoint.
     *
     *  * Empty `replyEndpoint` means "do not answer"; the receiver executes the
     *    command but sends neither ack nor result.
     *  * `timeoutMs` is advisory, the receiver never enforces it.
     */
    struct Command {
      Header header;
      std::string name;
      nlohmann::json payload = nlohmann::json::object();
      std::string replyEndpoint;
      std::int64_t timeoutMs{ 1000 };
      std::string origin;
    };

    struct Ack {
      Header header;
      std::string correlatesTo;
      bool ok{ false };
      std::optional<ErrorInfo> error;
    };

    struct Result {
      Header header;
      std::string correlatesTo;
      bool ok{ false };
      nlohmann::json payload = nlohmann::json::object();
      std::optional<ErrorInfo> error;
    };

    using Message = std::variant<Event, Command, Ack, Result>;

    MessageKind kindOf(const Message& msg);
    const Header& headerOf(const Message& msg);

  } // namespace protocols
} // namespace hearo
