#ifndef DUPLEX_SESSION_SESSION_STATE_MACHINE_HPP_
#define DUPLEX_SESSION_SESSION_STATE_MACHINE_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "duplex/hal/itransport.hpp"
#include "duplex/protocol/frame_codec.hpp"
#include "duplex/protocol/message.hpp"
#include "duplex/session/session_types.hpp"

namespace duplex {
namespace session {

/**
 * SessionStateMachine - Connection and session handshake driver
 *
 * Responsibilities:
 * - Send control frames (events 1, 100, 102, 2 and in-session events)
 * - Await the one response each handshake step expects (50, 150, 52)
 * - Track server-initiated session end (152/153) and server errors
 * - Classify failures into SessionError
 *
 * Handshake steps read the transport directly and must not overlap with a
 * running receive loop. OnServerMessage() is the receive loop's entry
 * point. CloseSession() may be called from the capture context while the
 * receive loop runs; the state is an atomic and both the client close and
 * the server finish are idempotent.
 */
class SessionStateMachine {
 public:
  /**
   * Construct a state machine
   * @param transport Channel to the service (not owned)
   * @param codec Frame codec (not owned)
   * @param handshake_timeout_ms How long each awaited response may take
   */
  SessionStateMachine(hal::ITransport& transport,
                      const protocol::FrameCodec& codec,
                      uint32_t handshake_timeout_ms);

  // Non-copyable, non-movable
  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;
  SessionStateMachine(SessionStateMachine&&) = delete;
  SessionStateMachine& operator=(SessionStateMachine&&) = delete;

  /**
   * Idle -> Connected: send StartConnection (1), await ConnectionStarted (50)
   * A frame that cannot be encoded (invalid ProtocolConfig) aborts with
   * kEncodeFailed.
   * @param payload Opaque request payload
   */
  SessionError OpenConnection(const protocol::Bytes& payload);

  /**
   * Connected -> SessionActive: send StartSession (100), await
   * SessionStarted (150)
   * @param session_id Session identifier chosen by the caller
   * @param payload Opaque session parameters
   */
  SessionError OpenSession(const std::string& session_id,
                           const protocol::Bytes& payload);

  /**
   * Send a client event inside the active session (e.g. SayHello 300)
   * Connection-level events are refused with kEncodeFailed and leave the
   * state unchanged.
   */
  SessionError SendSessionEvent(int32_t event, const protocol::Bytes& payload);

  /**
   * SessionActive -> SessionFinishing: send FinishSession (102)
   * Nothing is awaited. Returns kNone without sending if the session is
   * already finishing.
   */
  SessionError CloseSession();

  /**
   * -> Finished: send FinishConnection (2), await ConnectionFinished (52)
   * Closes an active session first. Returns kNone if already Finished.
   */
  SessionError CloseConnection();

  /**
   * Feed one inbound message observed by the receive loop
   * @return kServerReportedError for Error frames, kProtocolViolation for
   *         client-kind frames, kNone otherwise
   */
  SessionError OnServerMessage(const protocol::Message& msg);

  /**
   * The transport reported a terminal read failure
   * Becomes ConnectionLost unless the connection was already finished.
   */
  void OnTransportClosed();

  /**
   * Abort the session with an error detected outside the state machine
   * (e.g. an undecodable frame)
   */
  void Abort(SessionError error, const std::string& detail);

  /**
   * Fail with a transport read/write error
   *
   * The error is recorded first. If the transport is still open, FinishSession
   * and FinishConnection are then sent on a best-effort basis without waiting
   * for acknowledgement, and the machine ends in Aborted.
   * @return kTransportError
   */
  SessionError FailTransport(const std::string& detail);

  SessionState GetState() const { return state_.load(); }

  bool IsSessionActive() const {
    return state_.load() == SessionState::kSessionActive;
  }

  /**
   * True once the server ended the session (event 152 or 153)
   */
  bool IsServerFinished() const { return server_finished_.load(); }

  std::string GetSessionId() const;
  std::string GetConnectId() const;
  ServerError GetServerError() const;

  /**
   * Get the error that moved the machine into a terminal failure state
   */
  SessionError GetLastError() const;

  /**
   * Get a human-readable description of the last failure
   */
  std::string GetLastErrorDetail() const;

 private:
  SessionError SendControl(int32_t event, bool with_session,
                           const protocol::Bytes& payload);

  SessionError AwaitEvent(int32_t expected, const char* step,
                          protocol::Message& response);

  SessionError Fail(SessionState terminal, SessionError error,
                    const std::string& detail);

  // First error wins
  void RecordError(SessionError error, const std::string& detail);

  void EnterTerminal(SessionState terminal);

  void Teardown();

  bool Transition(SessionState from, SessionState to);

  hal::ITransport& transport_;
  const protocol::FrameCodec& codec_;
  const uint32_t handshake_timeout_ms_;

  std::atomic<SessionState> state_{SessionState::kIdle};
  std::atomic<bool> server_finished_{false};
  std::atomic<bool> tearing_down_{false};

  mutable std::mutex mutex_;
  std::string session_id_;
  std::string connect_id_;
  ServerError server_error_;
  SessionError last_error_ = SessionError::kNone;
  std::string last_error_detail_;
};

}  // namespace session
}  // namespace duplex

#endif  // DUPLEX_SESSION_SESSION_STATE_MACHINE_HPP_
