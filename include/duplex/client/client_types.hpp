#ifndef DUPLEX_CLIENT_CLIENT_TYPES_HPP_
#define DUPLEX_CLIENT_CLIENT_TYPES_HPP_

#include <cstddef>
#include <cstdint>

#include "duplex/protocol/protocol_config.hpp"

namespace duplex {
namespace client {

/**
 * AudioConfig - Block format of one audio device
 */
struct AudioConfig {
  uint32_t sample_rate;
  uint16_t channels;
  uint32_t block_samples;  // Samples per device callback
};

/**
 * ClientConfig - Configuration for DialogClient
 */
struct ClientConfig {
  protocol::ProtocolConfig protocol;
  AudioConfig capture;   // PCM16 little-endian uplink
  AudioConfig playback;  // float32 little-endian downlink
  uint32_t max_buffered_seconds;
  uint32_t handshake_timeout_ms;  // 0 = wait forever
  uint32_t receive_poll_ms;       // Receive loop wake-up interval
};

/**
 * Defaults used by the dialogue service:
 * 16 kHz mono capture in 160-sample blocks, 24 kHz mono playback in
 * 512-sample blocks, 100 seconds of playback buffering
 */
ClientConfig GetDefaultClientConfig();

/**
 * ClientStats - Snapshot of DialogClient counters
 */
struct ClientStats {
  std::size_t audio_blocks_sent;
  std::size_t audio_blocks_skipped;
  std::size_t frames_received;
  std::size_t audio_samples_received;
  std::size_t samples_dropped;  // Playback overflow (latest wins)
  std::size_t events_dropped;   // Event queue full
  std::size_t decode_errors;
};

}  // namespace client
}  // namespace duplex

#endif  // DUPLEX_CLIENT_CLIENT_TYPES_HPP_
