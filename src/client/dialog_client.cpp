#include "duplex/client/dialog_client.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "duplex/audio/sample_format.hpp"
#include "duplex/protocol/events.hpp"

namespace duplex {
namespace client {

using session::SessionError;
using session::SessionState;

ClientConfig GetDefaultClientConfig() {
  ClientConfig config;
  config.capture.sample_rate = 16000;
  config.capture.channels = 1;
  config.capture.block_samples = 160;
  config.playback.sample_rate = 24000;
  config.playback.channels = 1;
  config.playback.block_samples = 512;
  config.max_buffered_seconds = 100;
  config.handshake_timeout_ms = 5000;  // 5 seconds
  config.receive_poll_ms = 100;
  return config;
}

DialogClient::DialogClient(hal::ITransport& transport,
                           const ClientConfig& config)
    : config_(config),
      transport_(transport),
      codec_(config.protocol),
      audio_config_(config.protocol),
      session_(transport, codec_, config.handshake_timeout_ms),
      playback_buffer_(audio::AudioRingBuffer::CapacityFor(
                           config.playback.sample_rate,
                           config.max_buffered_seconds) *
                       config.playback.channels) {
  audio_config_.serialization = protocol::Serialization::kRaw;
}

DialogClient::~DialogClient() {
  SessionError error = Disconnect();
  if (error != SessionError::kNone) {
    std::cerr << "Dialog client closed with error: "
              << session::SessionErrorToString(error) << std::endl;
  }
  StopReceiving();
}

void DialogClient::SetCompressor(const hal::ICompressor* compressor) {
  codec_.SetCompressor(compressor);
}

SessionError DialogClient::Connect(const protocol::Bytes& payload) {
  connected_.store(true);
  return session_.OpenConnection(payload);
}

SessionError DialogClient::StartSession(const std::string& session_id,
                                        const protocol::Bytes& payload) {
  stop_requested_.store(false);
  capture_halted_.store(false);
  return session_.OpenSession(session_id, payload);
}

SessionError DialogClient::StartReceiving() {
  if (receive_thread_.joinable()) {
    return SessionError::kNone;
  }
  if (!session_.IsSessionActive()) {
    std::cerr << "Cannot start receiving in state "
              << session::SessionStateToString(session_.GetState())
              << std::endl;
    return SessionError::kInvalidState;
  }

  {
    std::lock_guard<std::mutex> lock(end_mutex_);
    receive_done_ = false;
  }
  running_.store(true);
  receive_thread_ = std::thread(&DialogClient::ReceiveLoopMain, this);
  return SessionError::kNone;
}

SessionError DialogClient::Disconnect() {
  if (!connected_.exchange(false)) {
    return SessionError::kNone;
  }

  if (session_.IsSessionActive()) {
    SessionError error = session_.CloseSession();
    if (error != SessionError::kNone) {
      std::cerr << "FinishSession failed: "
                << session::SessionErrorToString(error) << std::endl;
    }
  }

  if (receive_thread_.joinable()) {
    // Let the receive loop consume the server's SessionFinished
    if (session_.GetState() == SessionState::kSessionFinishing &&
        !WaitForSessionEnd(config_.handshake_timeout_ms)) {
      std::cerr << "Timed out waiting for the session to finish" << std::endl;
    }
    StopReceiving();
  }

  SessionError result = SessionError::kNone;
  const SessionState state = session_.GetState();
  if (state == SessionState::kConnected ||
      state == SessionState::kSessionFinishing) {
    result = session_.CloseConnection();
  } else if (state != SessionState::kFinished &&
             state != SessionState::kIdle) {
    result = session_.GetLastError();
  }

  transport_.Close();
  std::cout << "Dialog client disconnected ("
            << session::SessionStateToString(session_.GetState()) << ")"
            << std::endl;
  return result;
}

SessionError DialogClient::SayHello(const protocol::Bytes& payload) {
  return session_.SendSessionEvent(protocol::Event::kSayHello, payload);
}

SessionError DialogClient::ChatTtsText(const protocol::Bytes& payload) {
  return session_.SendSessionEvent(protocol::Event::kChatTtsText, payload);
}

SessionError DialogClient::OnCaptureBlock(const int16_t* samples,
                                          std::size_t count) {
  if (capture_halted_.load()) {
    return SessionError::kInvalidState;
  }
  if (stop_requested_.load()) {
    capture_halted_.store(true);
    return session_.CloseSession();
  }
  if (!session_.IsSessionActive()) {
    return SessionError::kInvalidState;
  }

  protocol::Message msg;
  msg.kind = protocol::MessageKind::kAudioOnlyClient;
  msg.flags = protocol::MessageFlags::kWithEvent;
  msg.event = protocol::Event::kTaskRequest;
  msg.session_id = session_.GetSessionId();
  audio::PackPcm16Le(samples, count, msg.payload);

  protocol::Bytes frame;
  protocol::FrameError frame_error;
  protocol::CodecResult encoded =
      codec_.Encode(msg, audio_config_, frame, &frame_error);
  if (encoded != protocol::CodecResult::kSuccess) {
    audio_blocks_skipped_++;
    std::cerr << "Failed to encode audio block: "
              << protocol::FrameCodec::ResultToString(encoded) << " ("
              << frame_error.field << ")" << std::endl;
    return SessionError::kEncodeFailed;
  }

  hal::TransportResult sent = transport_.Send(frame);
  if (sent != hal::TransportResult::kSuccess) {
    audio_blocks_skipped_++;
    capture_halted_.store(true);
    if (sent == hal::TransportResult::kClosed) {
      session_.OnTransportClosed();
      return SessionError::kConnectionLost;
    }
    return session_.FailTransport("send audio block failed: " +
                                  transport_.GetLastError());
  }

  audio_blocks_sent_++;
  return SessionError::kNone;
}

std::size_t DialogClient::FillPlayback(float* out, std::size_t count) {
  const std::size_t pulled = playback_buffer_.Pull(out, count);
  std::fill(out + pulled, out + count, 0.0f);
  return pulled;
}

void DialogClient::RequestStop() {
  stop_requested_.store(true);
}

bool DialogClient::PollEvent(protocol::Message& out) {
  return event_queue_.TryPop(out);
}

bool DialogClient::WaitForSessionEnd(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(end_mutex_);
  if (timeout_ms == 0) {
    end_cv_.wait(lock, [this] { return receive_done_; });
    return true;
  }
  return end_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this] { return receive_done_; });
}

SessionState DialogClient::GetState() const {
  return session_.GetState();
}

SessionError DialogClient::GetLastError() const {
  return session_.GetLastError();
}

std::string DialogClient::GetLastErrorDetail() const {
  return session_.GetLastErrorDetail();
}

session::ServerError DialogClient::GetServerError() const {
  return session_.GetServerError();
}

ClientStats DialogClient::GetStats() const {
  ClientStats stats;
  stats.audio_blocks_sent = audio_blocks_sent_.load();
  stats.audio_blocks_skipped = audio_blocks_skipped_.load();
  stats.frames_received = frames_received_.load();
  stats.audio_samples_received = audio_samples_received_.load();
  stats.samples_dropped =
      static_cast<std::size_t>(playback_buffer_.DroppedSamples());
  stats.events_dropped = events_dropped_.load();
  stats.decode_errors = decode_errors_.load();
  return stats;
}

void DialogClient::ReceiveLoopMain() {
  std::cout << "Receive loop started" << std::endl;

  protocol::Bytes frame;
  while (running_.load()) {
    hal::TransportResult received =
        transport_.Receive(frame, config_.receive_poll_ms);
    if (received == hal::TransportResult::kTimeout) {
      // Another thread may have failed the session
      if (session::IsTerminal(session_.GetState())) {
        break;
      }
      continue;
    }
    if (received == hal::TransportResult::kClosed) {
      if (running_.load()) {
        session_.OnTransportClosed();
      }
      break;
    }
    if (received == hal::TransportResult::kError) {
      session_.FailTransport("read failed: " + transport_.GetLastError());
      break;
    }

    frames_received_++;

    protocol::Message msg;
    protocol::FrameError frame_error;
    protocol::CodecResult decoded =
        codec_.Decode(frame, msg, nullptr, &frame_error);
    if (decoded != protocol::CodecResult::kSuccess) {
      decode_errors_++;
      // The stream cannot be resynchronized after a bad frame
      session_.Abort(decoded == protocol::CodecResult::kUnknownMessageType
                         ? SessionError::kUnknownMessageType
                         : SessionError::kMalformedFrame,
                     std::string(protocol::FrameCodec::ResultToString(decoded)) +
                         " at " + frame_error.field + " (offset " +
                         std::to_string(frame_error.offset) + ")");
      transport_.Close();
      break;
    }

    if (!HandleMessage(msg)) {
      break;
    }
  }

  running_.store(false);
  {
    std::lock_guard<std::mutex> lock(end_mutex_);
    receive_done_ = true;
  }
  end_cv_.notify_all();
  std::cout << "Receive loop stopped ("
            << session::SessionStateToString(session_.GetState()) << ")"
            << std::endl;
}

bool DialogClient::HandleMessage(const protocol::Message& msg) {
  switch (msg.kind) {
    case protocol::MessageKind::kAudioOnlyServer: {
      const std::size_t count = audio::UnpackFloat32Le(
          msg.payload.data(), msg.payload.size(), downlink_samples_);
      playback_buffer_.Push(downlink_samples_.data(), count);
      audio_samples_received_ += count;
      return true;
    }

    case protocol::MessageKind::kFullServer:
    case protocol::MessageKind::kFrontEndResult: {
      // The user started talking over the reply
      if (msg.HasEvent(protocol::Event::kAsrInfo)) {
        playback_buffer_.Clear();
      }
      SessionError error = session_.OnServerMessage(msg);
      QueueEvent(msg);
      if (error != SessionError::kNone) {
        return false;
      }
      // Only a FullServer 152/153 ends the session
      return !(msg.kind == protocol::MessageKind::kFullServer &&
               msg.event.has_value() &&
               protocol::IsSessionEndEvent(*msg.event));
    }

    case protocol::MessageKind::kError:
      QueueEvent(msg);
      return session_.OnServerMessage(msg) == SessionError::kNone;

    default:
      return session_.OnServerMessage(msg) == SessionError::kNone;
  }
}

void DialogClient::QueueEvent(const protocol::Message& msg) {
  if (!event_queue_.Push(msg)) {
    events_dropped_++;
  }
}

void DialogClient::StopReceiving() {
  running_.store(false);
  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }
}

std::unique_ptr<DialogClient> CreateDialogClient(hal::ITransport& transport,
                                                 const ClientConfig& config) {
  return std::make_unique<DialogClient>(transport, config);
}

}  // namespace client
}  // namespace duplex
