#ifndef DUPLEX_SESSION_SESSION_TYPES_HPP_
#define DUPLEX_SESSION_SESSION_TYPES_HPP_

#include <cstdint>

#include "duplex/protocol/message.hpp"

namespace duplex {
namespace session {

/**
 * SessionState - Control-plane lifecycle
 *
 * Idle -> Connecting -> Connected -> SessionStarting -> SessionActive
 *      -> SessionFinishing -> Finished
 *
 * Aborted and ConnectionLost are terminal failure states.
 */
enum class SessionState : uint8_t {
  kIdle = 0,
  kConnecting = 1,
  kConnected = 2,
  kSessionStarting = 3,
  kSessionActive = 4,
  kSessionFinishing = 5,
  kFinished = 6,
  kAborted = 7,
  kConnectionLost = 8,
};

/**
 * SessionError - Failure taxonomy surfaced to the caller
 */
enum class SessionError : uint8_t {
  kNone = 0,
  kMalformedFrame = 1,       // Truncated inbound frame, stream cannot resync
  kUnknownMessageType = 2,   // Unmapped type nibble, stream cannot resync
  kProtocolViolation = 3,    // Unexpected or missing handshake response
  kTransportError = 4,       // Channel read/write failure
  kServerReportedError = 5,  // Inbound Error frame (see ServerError)
  kConnectionLost = 6,       // Channel closed before the connection was finished
  kInvalidState = 7,         // Operation not allowed in the current state
  kEncodeFailed = 8,         // Outbound message rejected by the codec
};

/**
 * Vendor error carried by an inbound Error frame
 */
struct ServerError {
  uint32_t code = 0;
  protocol::Bytes payload;
};

const char* SessionStateToString(SessionState state);
const char* SessionErrorToString(SessionError error);

inline bool IsTerminal(SessionState state) {
  return state == SessionState::kFinished || state == SessionState::kAborted ||
         state == SessionState::kConnectionLost;
}

}  // namespace session
}  // namespace duplex

#endif  // DUPLEX_SESSION_SESSION_TYPES_HPP_
