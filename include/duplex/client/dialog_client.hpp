#ifndef DUPLEX_CLIENT_DIALOG_CLIENT_HPP_
#define DUPLEX_CLIENT_DIALOG_CLIENT_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "duplex/audio/audio_ring_buffer.hpp"
#include "duplex/client/client_types.hpp"
#include "duplex/core/spsc_ring_buffer.hpp"
#include "duplex/hal/icompressor.hpp"
#include "duplex/hal/itransport.hpp"
#include "duplex/protocol/frame_codec.hpp"
#include "duplex/protocol/message.hpp"
#include "duplex/session/session_state_machine.hpp"

namespace duplex {
namespace client {

/**
 * DialogClient - Full-duplex voice dialogue client
 *
 * Responsibilities:
 * - Run the connection and session handshakes
 * - Stream capture blocks to the service (capture context)
 * - Receive downlink frames on a dedicated thread, buffer synthesized
 *   audio and queue control events for the application
 * - Feed the playback device from the buffer (playback context)
 * - Tear the connection down in order
 *
 * The transport is borrowed and must outlive the client.
 */
class DialogClient {
 public:
  static constexpr std::size_t kEventQueueCapacity = 256;

  /**
   * Construct a dialogue client
   * @param transport Channel to the service (not owned)
   * @param config Client configuration
   */
  explicit DialogClient(hal::ITransport& transport,
                        const ClientConfig& config = GetDefaultClientConfig());

  /**
   * Destructor - stops the receive loop and disconnects
   */
  ~DialogClient();

  // Non-copyable, non-movable
  DialogClient(const DialogClient&) = delete;
  DialogClient& operator=(const DialogClient&) = delete;
  DialogClient(DialogClient&&) = delete;
  DialogClient& operator=(DialogClient&&) = delete;

  /**
   * Install a payload compressor (not owned); call before Connect()
   */
  void SetCompressor(const hal::ICompressor* compressor);

  /**
   * Open the connection (StartConnection / ConnectionStarted)
   * @param payload Opaque connection parameters
   */
  session::SessionError Connect(const protocol::Bytes& payload = {'{', '}'});

  /**
   * Open a session (StartSession / SessionStarted)
   * @param session_id Session identifier, must not be empty
   * @param payload Opaque session parameters
   */
  session::SessionError StartSession(const std::string& session_id,
                                     const protocol::Bytes& payload);

  /**
   * Start the receive loop thread; requires an active session
   */
  session::SessionError StartReceiving();

  /**
   * Finish the session and the connection, stop the receive loop and close
   * the transport. Safe to call more than once.
   * @return kNone on an orderly close, otherwise the failure
   */
  session::SessionError Disconnect();

  /**
   * Ask the service to greet the user (event 300)
   */
  session::SessionError SayHello(const protocol::Bytes& payload);

  /**
   * Send text for the service to speak (event 500)
   */
  session::SessionError ChatTtsText(const protocol::Bytes& payload);

  /**
   * Capture sink: send one PCM16 block (event 200, raw serialization)
   * Called from the capture context. Never waits on the receive loop.
   * @param samples Interleaved PCM16 samples
   * @param count Number of samples
   * @return kNone if the block was sent, kInvalidState if the session is
   *         not active or the sink has halted, otherwise the send failure.
   *         A failed write tears the session down and halts the sink.
   */
  session::SessionError OnCaptureBlock(const int16_t* samples,
                                       std::size_t count);

  /**
   * Playback source: fill one device block
   * Missing samples are zero-filled.
   * @param out Destination, count samples long
   * @param count Number of samples wanted
   * @return Number of buffered samples written before the padding
   */
  std::size_t FillPlayback(float* out, std::size_t count);

  /**
   * Cooperative stop: the next capture block sends FinishSession instead
   * of audio and the sink halts
   */
  void RequestStop();

  /**
   * Take the oldest queued control event (FullServer / FrontEndResult /
   * Error frames). Single consumer.
   * @return true if an event was taken
   */
  bool PollEvent(protocol::Message& out);

  /**
   * Wait until the receive loop ends (session end, failure or close)
   * @param timeout_ms Maximum wait (0 = infinite)
   * @return true if the loop has ended
   */
  bool WaitForSessionEnd(uint32_t timeout_ms = 0);

  session::SessionState GetState() const;
  session::SessionError GetLastError() const;
  std::string GetLastErrorDetail() const;
  session::ServerError GetServerError() const;

  const ClientConfig& GetConfig() const { return config_; }

  ClientStats GetStats() const;

 private:
  /**
   * Receive loop thread
   */
  void ReceiveLoopMain();

  /**
   * Route one decoded frame
   * @return false when the receive loop must end
   */
  bool HandleMessage(const protocol::Message& msg);

  void QueueEvent(const protocol::Message& msg);

  void StopReceiving();

  ClientConfig config_;
  hal::ITransport& transport_;

  protocol::FrameCodec codec_;
  protocol::ProtocolConfig audio_config_;
  session::SessionStateMachine session_;

  audio::AudioRingBuffer playback_buffer_;
  core::SpscRingBuffer<protocol::Message, kEventQueueCapacity> event_queue_;

  // State
  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> capture_halted_{false};

  // Receive loop
  std::thread receive_thread_;
  std::mutex end_mutex_;
  std::condition_variable end_cv_;
  bool receive_done_ = false;
  std::vector<float> downlink_samples_;

  // Statistics
  std::atomic<std::size_t> audio_blocks_sent_{0};
  std::atomic<std::size_t> audio_blocks_skipped_{0};
  std::atomic<std::size_t> frames_received_{0};
  std::atomic<std::size_t> audio_samples_received_{0};
  std::atomic<std::size_t> events_dropped_{0};
  std::atomic<std::size_t> decode_errors_{0};
};

/**
 * Create dialogue client
 */
std::unique_ptr<DialogClient> CreateDialogClient(
    hal::ITransport& transport,
    const ClientConfig& config = GetDefaultClientConfig());

}  // namespace client
}  // namespace duplex

#endif  // DUPLEX_CLIENT_DIALOG_CLIENT_HPP_
