#pragma once
/** @file  Names.hpp
 *  @brief Event and command names exchanged on the Hearo bus.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <string_view>

namespace hearo::protocols::names {

  // --- lifecycle suffixes (prefixed per peer, see Peer.hpp) ----------------
  inline constexpr std::string_view kDaemonStarted = "DAEMON_STARTED";
  inline constexpr std::string_view kDaemonStopped = "DAEMON_STOPPED";
  inline constexpr std::string_view kError = "ERROR";

  // --- common command suffixes ---------------------------------------------
  inline constexpr std::string_view kPing = "CMD_PING";
  inline constexpr std::string_view kSetDebug = "CMD_SET_DEBUG";

  // --- button daemon -------------------------------------------------------
  inline constexpr std::string_view kBdEventButton = "BD_EVENT_BUTTON";

  // --- NFC daemon ----------------------------------------------------------
  inline constexpr std::string_view kNfcEventReady = "NFC_EVENT_READY";
  inline constexpr std::string_view kNfcEventTagAdded = "NFC_EVENT_TAG_ADDED";
  inline constexpr std::string_view kNfcEventTagPresent = "NFC_EVENT_TAG_PRESENT";
  inline constexpr std::string_view kNfcEventTagRemoved = "NFC_EVENT_TAG_REMOVED";
  inline constexpr std::string_view kNfcCmdRestart = "NFC_CMD_RESTART";

  // --- Wi-Fi state machine -------------------------------------------------
  inline constexpr std::string_view kWsmEventWifiConnected = "WSM_EVENT_WIFI_CONNECTED";
  inline constexpr std::string_view kWsmEventWifiLost = "WSM_EVENT_WIFI_LOST";
  inline constexpr std::string_view kWsmEventApStarted = "WSM_EVENT_WIFI_AP_STARTED";
  inline constexpr std::string_view kWsmEventApStopped = "WSM_EVENT_WIFI_AP_STOPPED";
  inline constexpr std::string_view kWsmCommandStatus = "WSM_COMMAND_STATUS";

  // --- player state machine ------------------------------------------------
  inline constexpr std::string_view kPlsmEventAuthenticated = "PLSM_EVENT_AUTHENTICATED";
  inline constexpr std::string_view kPlsmEventAuthFailed = "PLSM_EVENT_AUTH_FAILED";
  inline constexpr std::string_view kPlsmEventAuthLost = "PLSM_EVENT_AUTH_LOST";
  inline constexpr std::string_view kPlsmEventDisconnected = "PLSM_EVENT_DISCONNECTED";
  inline constexpr std::string_view kPlsmEventTagResolved = "PLSM_EVENT_TAG_RESOLVED";
  inline constexpr std::string_view kPlsmEventTagUnknown = "PLSM_EVENT_TAG_UNKNOWN";
  inline constexpr std::string_view kPlsmEventPlayStarted = "PLSM_EVENT_PLAY_STARTED";
  inline constexpr std::string_view kPlsmEventPlayStopped = "PLSM_EVENT_PLAY_STOPPED";
  inline constexpr std::string_view kPlsmEventStateChanged = "PLSM_EVENT_STATE_CHANGED";
  inline constexpr std::string_view kPlsmEventPlaybackError = "PLSM_EVENT_PLAYBACK_ERROR";

  inline constexpr std::string_view kPlsmCommandPlayTag = "PLSM_COMMAND_PLAY_TAG";
  inline constexpr std::string_view kPlsmCommandStop = "PLSM_COMMAND_STOP";
  inline constexpr std::string_view kPlsmCommandNext = "PLSM_COMMAND_NEXT";
  inline constexpr std::string_view kPlsmCommandPrevious = "PLSM_COMMAND_PREVIOUS";
  inline constexpr std::string_view kPlsmCommandSeek = "PLSM_COMMAND_SEEK";
  inline constexpr std::string_view kPlsmCommandPlay = "PLSM_COMMAND_PLAY";
  inline constexpr std::string_view kPlsmCommandShutdown = "PLSM_COMMAND_SHUTDOWN";
  inline constexpr std::string_view kPlsmCommandStatus = "PLSM_COMMAND_STATUS";

  // --- power daemon --------------------------------------------------------
  inline constexpr std::string_view kPowdEventBatteryState = "POWD_EVENT_BATTERY_STATE";
  inline constexpr std::string_view kPowdEventBatteryCritical = "POWD_EVENT_BATTERY_CRITICAL";
  inline constexpr std::string_view kPowdCmdStatus = "POWD_CMD_STATUS";

  // --- central state machine -----------------------------------------------
  inline constexpr std::string_view kHcsmEventInitiated = "HCSM_EVENT_INITIATED";
  inline constexpr std::string_view kHcsmEventStateChanged = "HCSM_EVENT_STATE_CHANGED";
  inline constexpr std::string_view kHcsmEventShutdown = "HCSM_EVENT_SHUTDOWN";

  // --- error codes carried in ack/result `error.code` ----------------------
  inline constexpr std::string_view kErrUnknownCmd = "UNKNOWN_CMD";
  inline constexpr std::string_view kErrBadPayload = "BAD_PAYLOAD";
  inline constexpr std::string_view kErrInvalidLevel = "INVALID_LEVEL";

} // namespace hearo::protocols::names
