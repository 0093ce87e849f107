/* @file Envelope.cpp
 * @brief schema tags and variant accessors
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "protocols/Envelope.hpp"

namespace hearo {
  namespace protocols {

    const char* schemaOf(MessageKind kind) {
      switch (kind) {
      case MessageKind::Event:
        return "hearo.ipc/event";
      case MessageKind::Command:
        return "hearo.ipc/cmd";
      case MessageKind::Ack:
        return "hearo.ipc/ack";
      case MessageKind::Result:
        return "hearo.ipc/result";
      }
      return "hearo.ipc/unknown";
    }

    MessageKind kindOf(const Message& msg) {
      return static_cast<MessageKind>(msg.index());
    }

    const Header& headerOf(const Message& msg) {
      return std::visit([](const auto& m) -> const Header& { return m.header; }, msg);
    }

  } // namespace protocols
} // namespace hearo
