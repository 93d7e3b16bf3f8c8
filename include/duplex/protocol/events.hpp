#ifndef DUPLEX_PROTOCOL_EVENTS_HPP_
#define DUPLEX_PROTOCOL_EVENTS_HPP_

#include <cstdint>

namespace duplex {
namespace protocol {

/**
 * Event numbers used by the dialogue service
 *
 * Client events (sent):
 * - 1   StartConnection
 * - 2   FinishConnection
 * - 100 StartSession
 * - 102 FinishSession
 * - 200 TaskRequest (uplink audio)
 * - 300 SayHello
 * - 500 ChatTTSText
 *
 * Server events (received):
 * - 50  ConnectionStarted
 * - 51  ConnectionFailed
 * - 52  ConnectionFinished
 * - 150 SessionStarted
 * - 152 SessionFinished
 * - 153 SessionFailed
 * - 450 ASRInfo (user started speaking, drop pending playback)
 * - 451 ASRResponse
 */
struct Event {
  static constexpr int32_t kStartConnection = 1;
  static constexpr int32_t kFinishConnection = 2;
  static constexpr int32_t kConnectionStarted = 50;
  static constexpr int32_t kConnectionFailed = 51;
  static constexpr int32_t kConnectionFinished = 52;

  static constexpr int32_t kStartSession = 100;
  static constexpr int32_t kFinishSession = 102;
  static constexpr int32_t kSessionStarted = 150;
  static constexpr int32_t kSessionFinished = 152;
  static constexpr int32_t kSessionFailed = 153;

  static constexpr int32_t kTaskRequest = 200;
  static constexpr int32_t kSayHello = 300;
  static constexpr int32_t kAsrInfo = 450;
  static constexpr int32_t kAsrResponse = 451;
  static constexpr int32_t kChatTtsText = 500;
};

/**
 * Connection-lifecycle events never carry a session id
 */
inline bool IsReservedEvent(int32_t event) {
  return event == Event::kStartConnection ||
         event == Event::kFinishConnection ||
         event == Event::kConnectionStarted ||
         event == Event::kConnectionFailed ||
         event == Event::kConnectionFinished;
}

/**
 * Connection responses carry a connect id instead of a session id
 */
inline bool IsConnectEvent(int32_t event) {
  return event == Event::kConnectionStarted ||
         event == Event::kConnectionFailed ||
         event == Event::kConnectionFinished;
}

inline bool IsSessionEndEvent(int32_t event) {
  return event == Event::kSessionFinished || event == Event::kSessionFailed;
}

}  // namespace protocol
}  // namespace duplex

#endif  // DUPLEX_PROTOCOL_EVENTS_HPP_
