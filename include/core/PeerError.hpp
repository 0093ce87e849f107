#pragma once
/** @file  PeerError.hpp
 *  @brief Classified collaborator failure thrown into a peer FSM tick.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace hearo::core {

  enum class FailureClass { Transient, AuthIssue, ResourceUnavailable };

  inline const char* toString(FailureClass c) {
    switch (c) {
    case FailureClass::Transient:
      return "transient";
    case FailureClass::AuthIssue:
      return "auth_issue";
    case FailureClass::ResourceUnavailable:
      return "resource_unavailable";
    default:
      return "unknown";
    }
  }

  /**
   * @class PeerError
   * @brief Thrown by Wi-Fi control, playback backend, tag store and tag reader.
   *
   * `code()` is the machine code that ends up in `<PREFIX>_EVENT_ERROR`.
   */
  class PeerError : public std::runtime_error {
  public:
    PeerError(FailureClass cls, std::string code, const std::string& message)
        : std::runtime_error(message), cls_(cls), code_(std::move(code)) {}

    FailureClass cls() const { return cls_; }
    const std::string& code() const { return code_; }

  private:
    FailureClass cls_;
    std::string code_;
  };

} // namespace hearo::core
