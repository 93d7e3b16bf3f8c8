#include "duplex/session/session_state_machine.hpp"

#include <iostream>

#include "duplex/protocol/events.hpp"

namespace duplex {
namespace session {

namespace {

const protocol::Bytes kEmptyJsonPayload = {'{', '}'};

SessionError FromCodecResult(protocol::CodecResult result) {
  switch (result) {
    case protocol::CodecResult::kSuccess:
      return SessionError::kNone;
    case protocol::CodecResult::kUnknownMessageType:
      return SessionError::kUnknownMessageType;
    default:
      return SessionError::kMalformedFrame;
  }
}

}  // namespace

const char* SessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "Idle";
    case SessionState::kConnecting:
      return "Connecting";
    case SessionState::kConnected:
      return "Connected";
    case SessionState::kSessionStarting:
      return "SessionStarting";
    case SessionState::kSessionActive:
      return "SessionActive";
    case SessionState::kSessionFinishing:
      return "SessionFinishing";
    case SessionState::kFinished:
      return "Finished";
    case SessionState::kAborted:
      return "Aborted";
    case SessionState::kConnectionLost:
      return "ConnectionLost";
    default:
      return "Unknown";
  }
}

const char* SessionErrorToString(SessionError error) {
  switch (error) {
    case SessionError::kNone:
      return "None";
    case SessionError::kMalformedFrame:
      return "Malformed frame";
    case SessionError::kUnknownMessageType:
      return "Unknown message type";
    case SessionError::kProtocolViolation:
      return "Protocol violation";
    case SessionError::kTransportError:
      return "Transport error";
    case SessionError::kServerReportedError:
      return "Server reported error";
    case SessionError::kConnectionLost:
      return "Connection lost";
    case SessionError::kInvalidState:
      return "Invalid state";
    case SessionError::kEncodeFailed:
      return "Encode failed";
    default:
      return "Unknown error";
  }
}

SessionStateMachine::SessionStateMachine(hal::ITransport& transport,
                                         const protocol::FrameCodec& codec,
                                         uint32_t handshake_timeout_ms)
    : transport_(transport),
      codec_(codec),
      handshake_timeout_ms_(handshake_timeout_ms) {}

SessionError SessionStateMachine::OpenConnection(
    const protocol::Bytes& payload) {
  if (!Transition(SessionState::kIdle, SessionState::kConnecting)) {
    return SessionError::kInvalidState;
  }

  SessionError error =
      SendControl(protocol::Event::kStartConnection, false, payload);
  if (error != SessionError::kNone) {
    return error;
  }

  protocol::Message response;
  error = AwaitEvent(protocol::Event::kConnectionStarted, "StartConnection",
                     response);
  if (error != SessionError::kNone) {
    return error;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_id_ = response.connect_id.value_or("");
  }
  state_.store(SessionState::kConnected);
  std::cout << "Connection started, connect id: " << GetConnectId() << std::endl;
  return SessionError::kNone;
}

SessionError SessionStateMachine::OpenSession(const std::string& session_id,
                                              const protocol::Bytes& payload) {
  if (session_id.empty()) {
    std::cerr << "StartSession rejected: empty session id" << std::endl;
    return SessionError::kEncodeFailed;
  }
  if (!Transition(SessionState::kConnected, SessionState::kSessionStarting)) {
    return SessionError::kInvalidState;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_ = session_id;
  }
  server_finished_.store(false);

  SessionError error =
      SendControl(protocol::Event::kStartSession, true, payload);
  if (error != SessionError::kNone) {
    return error;
  }

  protocol::Message response;
  error = AwaitEvent(protocol::Event::kSessionStarted, "StartSession", response);
  if (error != SessionError::kNone) {
    return error;
  }

  state_.store(SessionState::kSessionActive);
  std::cout << "Session started: " << session_id << std::endl;
  return SessionError::kNone;
}

SessionError SessionStateMachine::SendSessionEvent(
    int32_t event, const protocol::Bytes& payload) {
  if (state_.load() != SessionState::kSessionActive) {
    return SessionError::kInvalidState;
  }
  if (protocol::IsReservedEvent(event)) {
    std::cerr << "Event " << event << " is not a session event" << std::endl;
    return SessionError::kEncodeFailed;
  }
  return SendControl(event, true, payload);
}

SessionError SessionStateMachine::CloseSession() {
  SessionState expected = SessionState::kSessionActive;
  if (state_.compare_exchange_strong(expected,
                                     SessionState::kSessionFinishing)) {
    SessionError error = SendControl(protocol::Event::kFinishSession, true,
                                     kEmptyJsonPayload);
    if (error == SessionError::kNone) {
      std::cout << "FinishSession request is sent" << std::endl;
    }
    return error;
  }

  // Server finish and client close may arrive in either order
  if (expected == SessionState::kSessionFinishing ||
      expected == SessionState::kFinished) {
    return SessionError::kNone;
  }
  return SessionError::kInvalidState;
}

SessionError SessionStateMachine::CloseConnection() {
  SessionState state = state_.load();
  if (state == SessionState::kFinished) {
    return SessionError::kNone;
  }

  if (state == SessionState::kSessionActive) {
    SessionError error = CloseSession();
    if (error != SessionError::kNone) {
      return error;
    }
    state = state_.load();
  }

  if (state != SessionState::kConnected &&
      state != SessionState::kSessionFinishing) {
    return SessionError::kInvalidState;
  }

  SessionError error = SendControl(protocol::Event::kFinishConnection, false,
                                   kEmptyJsonPayload);
  if (error != SessionError::kNone) {
    return error;
  }

  protocol::Message response;
  error = AwaitEvent(protocol::Event::kConnectionFinished, "FinishConnection",
                     response);
  if (error != SessionError::kNone) {
    return error;
  }

  state_.store(SessionState::kFinished);
  std::cout << "Connection finished" << std::endl;
  return SessionError::kNone;
}

SessionError SessionStateMachine::OnServerMessage(
    const protocol::Message& msg) {
  switch (msg.kind) {
    case protocol::MessageKind::kError: {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        server_error_.code = msg.error_code.value_or(0);
        server_error_.payload = msg.payload;
      }
      return Fail(SessionState::kAborted, SessionError::kServerReportedError,
                  "server error code " +
                      std::to_string(msg.error_code.value_or(0)));
    }

    case protocol::MessageKind::kFullClient:
    case protocol::MessageKind::kAudioOnlyClient:
      return Fail(SessionState::kAborted, SessionError::kProtocolViolation,
                  std::string("unexpected ") +
                      protocol::MessageTypeRegistry::KindToString(msg.kind) +
                      " frame from server");

    case protocol::MessageKind::kFullServer:
      if (msg.event.has_value() && protocol::IsSessionEndEvent(*msg.event)) {
        SessionState expected = SessionState::kSessionActive;
        if (state_.compare_exchange_strong(expected,
                                           SessionState::kSessionFinishing) ||
            expected == SessionState::kSessionFinishing) {
          server_finished_.store(true);
          std::cout << "Session finished by server (event=" << *msg.event
                    << ")" << std::endl;
        }
      }
      return SessionError::kNone;

    default:
      return SessionError::kNone;
  }
}

void SessionStateMachine::OnTransportClosed() {
  SessionState state = state_.load();
  while (!IsTerminal(state)) {
    if (state_.compare_exchange_weak(state, SessionState::kConnectionLost)) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (last_error_ == SessionError::kNone) {
        last_error_ = SessionError::kConnectionLost;
        last_error_detail_ = "transport closed before connection finished";
      }
      std::cerr << "Connection lost in state " << SessionStateToString(state)
                << std::endl;
      return;
    }
  }
}

void SessionStateMachine::Abort(SessionError error, const std::string& detail) {
  Fail(SessionState::kAborted, error, detail);
}

SessionError SessionStateMachine::FailTransport(const std::string& detail) {
  RecordError(SessionError::kTransportError, detail);
  if (!tearing_down_.exchange(true)) {
    Teardown();
    tearing_down_.store(false);
  }
  EnterTerminal(SessionState::kAborted);
  return SessionError::kTransportError;
}

void SessionStateMachine::Teardown() {
  if (!transport_.IsOpen()) {
    return;
  }

  SessionState expected = SessionState::kSessionActive;
  if (state_.compare_exchange_strong(expected,
                                     SessionState::kSessionFinishing)) {
    SessionError error = SendControl(protocol::Event::kFinishSession, true,
                                     kEmptyJsonPayload);
    if (error != SessionError::kNone) {
      std::cerr << "Teardown: FinishSession failed: "
                << SessionErrorToString(error) << std::endl;
      return;
    }
  }

  const SessionState state = state_.load();
  if (state == SessionState::kConnected ||
      state == SessionState::kSessionFinishing) {
    SessionError error = SendControl(protocol::Event::kFinishConnection, false,
                                     kEmptyJsonPayload);
    if (error != SessionError::kNone) {
      std::cerr << "Teardown: FinishConnection failed: "
                << SessionErrorToString(error) << std::endl;
    }
  }
}

std::string SessionStateMachine::GetSessionId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_;
}

std::string SessionStateMachine::GetConnectId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connect_id_;
}

ServerError SessionStateMachine::GetServerError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return server_error_;
}

SessionError SessionStateMachine::GetLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::string SessionStateMachine::GetLastErrorDetail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_detail_;
}

SessionError SessionStateMachine::SendControl(int32_t event, bool with_session,
                                              const protocol::Bytes& payload) {
  protocol::Message msg;
  msg.kind = protocol::MessageKind::kFullClient;
  msg.flags = protocol::MessageFlags::kWithEvent;
  msg.event = event;
  if (with_session) {
    msg.session_id = GetSessionId();
  }
  msg.payload = payload;

  protocol::Bytes frame;
  protocol::FrameError frame_error;
  protocol::CodecResult result = codec_.Encode(msg, frame, &frame_error);
  if (result != protocol::CodecResult::kSuccess) {
    return Fail(SessionState::kAborted, SessionError::kEncodeFailed,
                "encode event " + std::to_string(event) + ": " +
                    protocol::FrameCodec::ResultToString(result) + " (" +
                    frame_error.field + ")");
  }

  hal::TransportResult sent = transport_.Send(frame);
  if (sent == hal::TransportResult::kSuccess) {
    return SessionError::kNone;
  }
  // Failures while tearing down go back to Teardown() only
  if (tearing_down_.load()) {
    return sent == hal::TransportResult::kClosed
               ? SessionError::kConnectionLost
               : SessionError::kTransportError;
  }
  if (sent == hal::TransportResult::kClosed) {
    return Fail(SessionState::kConnectionLost, SessionError::kConnectionLost,
                "transport closed while sending event " + std::to_string(event));
  }
  return FailTransport("send event " + std::to_string(event) +
                       " failed: " + transport_.GetLastError());
}

SessionError SessionStateMachine::AwaitEvent(int32_t expected, const char* step,
                                             protocol::Message& response) {
  protocol::Bytes frame;
  hal::TransportResult received =
      transport_.Receive(frame, handshake_timeout_ms_);
  switch (received) {
    case hal::TransportResult::kSuccess:
      break;
    case hal::TransportResult::kTimeout:
      return Fail(SessionState::kAborted, SessionError::kProtocolViolation,
                  std::string("timed out waiting for ") + step + " response");
    case hal::TransportResult::kClosed:
      return Fail(SessionState::kConnectionLost, SessionError::kConnectionLost,
                  std::string("transport closed waiting for ") + step +
                      " response");
    default:
      return FailTransport(std::string("read ") + step +
                           " response failed: " + transport_.GetLastError());
  }

  protocol::FrameError frame_error;
  protocol::CodecResult result =
      codec_.Decode(frame, response, nullptr, &frame_error);
  if (result != protocol::CodecResult::kSuccess) {
    return Fail(SessionState::kAborted, FromCodecResult(result),
                std::string("decode ") + step + " response: " +
                    protocol::FrameCodec::ResultToString(result) + " at " +
                    frame_error.field);
  }

  if (response.kind == protocol::MessageKind::kError) {
    return OnServerMessage(response);
  }
  if (response.kind != protocol::MessageKind::kFullServer) {
    return Fail(SessionState::kAborted, SessionError::kProtocolViolation,
                std::string("unexpected ") +
                    protocol::MessageTypeRegistry::KindToString(response.kind) +
                    " response for " + step);
  }
  if (!response.HasEvent(expected)) {
    const std::string got =
        response.event.has_value() ? std::to_string(*response.event) : "none";
    return Fail(SessionState::kAborted, SessionError::kProtocolViolation,
                "unexpected response event (" + got + ") for " + step +
                    " request");
  }
  return SessionError::kNone;
}

SessionError SessionStateMachine::Fail(SessionState terminal,
                                       SessionError error,
                                       const std::string& detail) {
  EnterTerminal(terminal);
  RecordError(error, detail);
  return error;
}

void SessionStateMachine::RecordError(SessionError error,
                                      const std::string& detail) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_error_ == SessionError::kNone) {
      last_error_ = error;
      last_error_detail_ = detail;
    }
  }
  std::cerr << "Session error (" << SessionErrorToString(error)
            << "): " << detail << std::endl;
}

void SessionStateMachine::EnterTerminal(SessionState terminal) {
  SessionState state = state_.load();
  while (!IsTerminal(state) &&
         !state_.compare_exchange_weak(state, terminal)) {
  }
}

bool SessionStateMachine::Transition(SessionState from, SessionState to) {
  SessionState expected = from;
  if (state_.compare_exchange_strong(expected, to)) {
    return true;
  }
  std::cerr << "Invalid transition " << SessionStateToString(expected)
            << " -> " << SessionStateToString(to) << std::endl;
  return false;
}

}  // namespace session
}  // namespace duplex
