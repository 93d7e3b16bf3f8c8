#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "duplex/protocol/events.hpp"
#include "duplex/protocol/frame_codec.hpp"
#include "duplex/session/session_state_machine.hpp"
#include "fake_transport.hpp"

namespace duplex {
namespace test {

using protocol::Bytes;
using protocol::Event;
using protocol::Message;
using protocol::MessageFlags;
using protocol::MessageKind;
using session::SessionError;
using session::SessionState;

class SessionStateMachineTest : public ::testing::Test {
 protected:
  static constexpr uint32_t kHandshakeTimeoutMs = 200;

  SessionStateMachineTest()
      : machine(transport, codec, kHandshakeTimeoutMs) {}

  Bytes Encode(const Message& msg) {
    Bytes frame;
    EXPECT_EQ(codec.Encode(msg, frame), protocol::CodecResult::kSuccess);
    return frame;
  }

  Message Decode(const Bytes& frame) {
    Message msg;
    EXPECT_EQ(codec.Decode(frame, msg), protocol::CodecResult::kSuccess);
    return msg;
  }

  static Message ServerEvent(int32_t event) {
    Message msg;
    msg.kind = MessageKind::kFullServer;
    msg.flags = MessageFlags::kWithEvent;
    msg.event = event;
    if (protocol::IsConnectEvent(event)) {
      msg.connect_id = "conn-1";
    } else if (!protocol::IsReservedEvent(event)) {
      msg.session_id = "session-1";
    }
    msg.payload = {'{', '}'};
    return msg;
  }

  static Message ServerError(uint32_t code, const std::string& body) {
    Message msg;
    msg.kind = MessageKind::kError;
    msg.error_code = code;
    msg.payload.assign(body.begin(), body.end());
    return msg;
  }

  void QueueEvent(int32_t event) { transport.QueueInbound(Encode(ServerEvent(event))); }

  void OpenActiveSession() {
    QueueEvent(Event::kConnectionStarted);
    QueueEvent(Event::kSessionStarted);
    ASSERT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kNone);
    ASSERT_EQ(machine.OpenSession("session-1", {'{', '}'}), SessionError::kNone);
    ASSERT_EQ(machine.GetState(), SessionState::kSessionActive);
  }

  FakeTransport transport;
  protocol::FrameCodec codec;
  session::SessionStateMachine machine;
};

// === Handshake ===

TEST_F(SessionStateMachineTest, OpenConnectionSendsStartConnection) {
  QueueEvent(Event::kConnectionStarted);
  EXPECT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kConnected);
  EXPECT_EQ(machine.GetConnectId(), "conn-1");

  auto sent = transport.SentFrames();
  ASSERT_EQ(sent.size(), 1u);
  Message request = Decode(sent[0]);
  EXPECT_EQ(request.kind, MessageKind::kFullClient);
  EXPECT_TRUE(request.HasEvent(Event::kStartConnection));
  EXPECT_FALSE(request.session_id.has_value());
}

TEST_F(SessionStateMachineTest, FullLifecycle) {
  OpenActiveSession();
  EXPECT_EQ(machine.GetSessionId(), "session-1");

  EXPECT_EQ(machine.CloseSession(), SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kSessionFinishing);

  EXPECT_EQ(machine.OnServerMessage(ServerEvent(Event::kSessionFinished)),
            SessionError::kNone);
  EXPECT_TRUE(machine.IsServerFinished());

  QueueEvent(Event::kConnectionFinished);
  EXPECT_EQ(machine.CloseConnection(), SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kFinished);
  EXPECT_EQ(machine.GetLastError(), SessionError::kNone);

  auto sent = transport.SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  EXPECT_TRUE(Decode(sent[1]).HasEvent(Event::kStartSession));
  Message finish_session = Decode(sent[2]);
  EXPECT_TRUE(finish_session.HasEvent(Event::kFinishSession));
  ASSERT_TRUE(finish_session.session_id.has_value());
  EXPECT_EQ(*finish_session.session_id, "session-1");
  Message finish_connection = Decode(sent[3]);
  EXPECT_TRUE(finish_connection.HasEvent(Event::kFinishConnection));
  EXPECT_FALSE(finish_connection.session_id.has_value());
}

TEST_F(SessionStateMachineTest, WrongConnectResponseStopsBeforeSession) {
  QueueEvent(Event::kConnectionFailed);
  EXPECT_EQ(machine.OpenConnection({'{', '}'}),
            SessionError::kProtocolViolation);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastError(), SessionError::kProtocolViolation);

  EXPECT_EQ(machine.OpenSession("session-1", {'{', '}'}),
            SessionError::kInvalidState);
  EXPECT_EQ(transport.SentCount(), 1u);
}

TEST_F(SessionStateMachineTest, WrongSessionResponse) {
  QueueEvent(Event::kConnectionStarted);
  QueueEvent(Event::kSessionFailed);
  ASSERT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kNone);
  EXPECT_EQ(machine.OpenSession("session-1", {'{', '}'}),
            SessionError::kProtocolViolation);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
}

TEST_F(SessionStateMachineTest, HandshakeTimeout) {
  EXPECT_EQ(machine.OpenConnection({'{', '}'}),
            SessionError::kProtocolViolation);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_FALSE(machine.GetLastErrorDetail().empty());
}

TEST_F(SessionStateMachineTest, ServerErrorDuringHandshake) {
  transport.QueueInbound(Encode(ServerError(45000002, "{\"error\":\"auth\"}")));
  EXPECT_EQ(machine.OpenConnection({'{', '}'}),
            SessionError::kServerReportedError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);

  session::ServerError error = machine.GetServerError();
  EXPECT_EQ(error.code, 45000002u);
  EXPECT_EQ(std::string(error.payload.begin(), error.payload.end()),
            "{\"error\":\"auth\"}");
}

TEST_F(SessionStateMachineTest, MalformedHandshakeResponse) {
  transport.QueueInbound({0x11, 0x94, 0x10});
  EXPECT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kMalformedFrame);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
}

TEST_F(SessionStateMachineTest, UnknownTypeHandshakeResponse) {
  transport.QueueInbound({0x11, 0x74, 0x10, 0x00});
  EXPECT_EQ(machine.OpenConnection({'{', '}'}),
            SessionError::kUnknownMessageType);
}

TEST_F(SessionStateMachineTest, TransportClosedDuringHandshake) {
  transport.Close();
  EXPECT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kConnectionLost);
  EXPECT_EQ(machine.GetState(), SessionState::kConnectionLost);
}

TEST_F(SessionStateMachineTest, SendFailure) {
  transport.SetSendResult(hal::TransportResult::kError);
  EXPECT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
}

TEST_F(SessionStateMachineTest, EmptySessionIdRejected) {
  QueueEvent(Event::kConnectionStarted);
  ASSERT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kNone);
  EXPECT_EQ(machine.OpenSession("", {'{', '}'}), SessionError::kEncodeFailed);
  EXPECT_EQ(machine.GetState(), SessionState::kConnected);
  EXPECT_EQ(transport.SentCount(), 1u);
}

TEST_F(SessionStateMachineTest, OperationsOutOfOrder) {
  EXPECT_EQ(machine.OpenSession("session-1", {}), SessionError::kInvalidState);
  EXPECT_EQ(machine.CloseSession(), SessionError::kInvalidState);
  EXPECT_EQ(machine.CloseConnection(), SessionError::kInvalidState);
  EXPECT_EQ(machine.SendSessionEvent(Event::kSayHello, {}),
            SessionError::kInvalidState);
  EXPECT_EQ(machine.GetState(), SessionState::kIdle);
  EXPECT_EQ(transport.SentCount(), 0u);
}

// === Active session ===

TEST_F(SessionStateMachineTest, SendSessionEvent) {
  OpenActiveSession();
  EXPECT_EQ(machine.SendSessionEvent(Event::kSayHello, {'h', 'i'}),
            SessionError::kNone);

  Message hello = Decode(transport.SentFrames().back());
  EXPECT_TRUE(hello.HasEvent(Event::kSayHello));
  ASSERT_TRUE(hello.session_id.has_value());
  EXPECT_EQ(*hello.session_id, "session-1");
  EXPECT_EQ(hello.payload, (Bytes{'h', 'i'}));

  // Connection events cannot be sent as session events
  EXPECT_EQ(machine.SendSessionEvent(Event::kFinishConnection, {}),
            SessionError::kEncodeFailed);
  EXPECT_EQ(machine.GetState(), SessionState::kSessionActive);
}

TEST_F(SessionStateMachineTest, CloseSessionIsIdempotent) {
  OpenActiveSession();
  EXPECT_EQ(machine.CloseSession(), SessionError::kNone);
  EXPECT_EQ(machine.CloseSession(), SessionError::kNone);
  EXPECT_EQ(transport.SentCount(), 3u);
}

TEST_F(SessionStateMachineTest, ServerFinishBeforeClientClose) {
  OpenActiveSession();
  EXPECT_EQ(machine.OnServerMessage(ServerEvent(Event::kSessionFailed)),
            SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kSessionFinishing);
  EXPECT_TRUE(machine.IsServerFinished());

  EXPECT_EQ(machine.CloseSession(), SessionError::kNone);
  EXPECT_EQ(transport.SentCount(), 2u);

  QueueEvent(Event::kConnectionFinished);
  EXPECT_EQ(machine.CloseConnection(), SessionError::kNone);
  EXPECT_EQ(machine.CloseConnection(), SessionError::kNone);
  EXPECT_EQ(transport.SentCount(), 3u);
}

TEST_F(SessionStateMachineTest, CloseConnectionClosesActiveSession) {
  OpenActiveSession();
  QueueEvent(Event::kConnectionFinished);
  EXPECT_EQ(machine.CloseConnection(), SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kFinished);

  auto sent = transport.SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  EXPECT_TRUE(Decode(sent[2]).HasEvent(Event::kFinishSession));
  EXPECT_TRUE(Decode(sent[3]).HasEvent(Event::kFinishConnection));
}

TEST_F(SessionStateMachineTest, ServerErrorAbortsSession) {
  OpenActiveSession();
  EXPECT_EQ(machine.OnServerMessage(ServerError(55000001, "busy")),
            SessionError::kServerReportedError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastError(), SessionError::kServerReportedError);
  EXPECT_EQ(machine.GetServerError().code, 55000001u);
}

TEST_F(SessionStateMachineTest, ClientKindFromServerIsViolation) {
  OpenActiveSession();
  Message echo;
  echo.kind = MessageKind::kAudioOnlyClient;
  EXPECT_EQ(machine.OnServerMessage(echo), SessionError::kProtocolViolation);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
}

TEST_F(SessionStateMachineTest, OrdinaryServerEventsKeepSessionActive) {
  OpenActiveSession();
  EXPECT_EQ(machine.OnServerMessage(ServerEvent(Event::kAsrResponse)),
            SessionError::kNone);
  EXPECT_EQ(machine.GetState(), SessionState::kSessionActive);
  EXPECT_FALSE(machine.IsServerFinished());
}

TEST_F(SessionStateMachineTest, TransportClosedWhileActive) {
  OpenActiveSession();
  machine.OnTransportClosed();
  EXPECT_EQ(machine.GetState(), SessionState::kConnectionLost);
  EXPECT_EQ(machine.GetLastError(), SessionError::kConnectionLost);
}

TEST_F(SessionStateMachineTest, TransportClosedAfterFinishIsNormal) {
  OpenActiveSession();
  QueueEvent(Event::kConnectionFinished);
  ASSERT_EQ(machine.CloseConnection(), SessionError::kNone);

  machine.OnTransportClosed();
  EXPECT_EQ(machine.GetState(), SessionState::kFinished);
  EXPECT_EQ(machine.GetLastError(), SessionError::kNone);
}

// === Transport failures ===

TEST_F(SessionStateMachineTest, WriteFailureClosesBeforeAbort) {
  OpenActiveSession();
  transport.FailNextSends(1, hal::TransportResult::kError);

  EXPECT_EQ(machine.SendSessionEvent(Event::kSayHello, {'h', 'i'}),
            SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastError(), SessionError::kTransportError);

  // StartConnection, StartSession, then the best-effort close
  auto sent = transport.SentFrames();
  ASSERT_EQ(sent.size(), 4u);
  EXPECT_TRUE(Decode(sent[2]).HasEvent(Event::kFinishSession));
  EXPECT_TRUE(Decode(sent[3]).HasEvent(Event::kFinishConnection));
}

TEST_F(SessionStateMachineTest, WriteFailureKeepsOriginalError) {
  OpenActiveSession();
  transport.SetSendResult(hal::TransportResult::kError);

  EXPECT_EQ(machine.SendSessionEvent(Event::kSayHello, {}),
            SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastError(), SessionError::kTransportError);
  EXPECT_NE(machine.GetLastErrorDetail().find("send event 300"),
            std::string::npos);
  EXPECT_EQ(transport.SentCount(), 2u);
}

TEST_F(SessionStateMachineTest, ReadFailureKeepsReadError) {
  OpenActiveSession();
  transport.SetSendResult(hal::TransportResult::kError);

  // The close attempt fails too, but the read error is reported
  EXPECT_EQ(machine.FailTransport("read failed: reset"),
            SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastErrorDetail(), "read failed: reset");
}

TEST_F(SessionStateMachineTest, HandshakeReadFailure) {
  transport.SetReceiveResult(hal::TransportResult::kError);
  EXPECT_EQ(machine.OpenConnection({'{', '}'}), SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(transport.SentCount(), 1u);
}

TEST_F(SessionStateMachineTest, ExternalTransportFailure) {
  OpenActiveSession();
  EXPECT_EQ(machine.FailTransport("read failed: reset"),
            SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(machine.GetLastErrorDetail(), "read failed: reset");
  EXPECT_EQ(transport.SentCount(), 4u);
}

TEST_F(SessionStateMachineTest, TransportFailureOnClosedTransportSendsNothing) {
  OpenActiveSession();
  transport.Close();
  EXPECT_EQ(machine.FailTransport("read failed"), SessionError::kTransportError);
  EXPECT_EQ(machine.GetState(), SessionState::kAborted);
  EXPECT_EQ(transport.SentCount(), 2u);
}

// === Encode failures ===

TEST_F(SessionStateMachineTest, EncodeFailureAbortsHandshake) {
  protocol::ProtocolConfig config;
  config.header_size = static_cast<protocol::HeaderSize>(0);
  protocol::FrameCodec invalid_codec(config);
  session::SessionStateMachine invalid(transport, invalid_codec,
                                       kHandshakeTimeoutMs);

  EXPECT_EQ(invalid.OpenConnection({'{', '}'}), SessionError::kEncodeFailed);
  EXPECT_EQ(invalid.GetState(), SessionState::kAborted);
  EXPECT_EQ(invalid.GetLastError(), SessionError::kEncodeFailed);
  EXPECT_EQ(transport.SentCount(), 0u);
}

TEST(SessionNamesTest, ToString) {
  EXPECT_STREQ(session::SessionStateToString(SessionState::kSessionActive),
               "SessionActive");
  EXPECT_STREQ(session::SessionErrorToString(SessionError::kProtocolViolation),
               "Protocol violation");
  EXPECT_TRUE(session::IsTerminal(SessionState::kConnectionLost));
  EXPECT_FALSE(session::IsTerminal(SessionState::kSessionFinishing));
}

}  // namespace test
}  // namespace duplex

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
