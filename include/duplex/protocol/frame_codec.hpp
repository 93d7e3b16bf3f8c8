#ifndef DUPLEX_PROTOCOL_FRAME_CODEC_HPP_
#define DUPLEX_PROTOCOL_FRAME_CODEC_HPP_

#include <cstddef>
#include <cstdint>

#include "duplex/hal/icompressor.hpp"
#include "duplex/protocol/message.hpp"
#include "duplex/protocol/protocol_config.hpp"

namespace duplex {
namespace protocol {

/**
 * Result of an encode or decode operation
 */
enum class CodecResult : uint8_t {
  kSuccess = 0,
  kMalformedFrame = 1,      // Input ended inside a field
  kUnknownMessageType = 2,  // Type nibble has no registry entry
  kPayloadTooLarge = 3,     // Length does not fit the 32-bit length field
  kInvalidMessage = 4,      // Optional field presence contradicts kind/flags/event
  kInvalidConfig = 5,       // Header nibble out of range or header size 0
  kCompressionFailed = 6,
};

/**
 * Where an encode or decode operation stopped
 */
struct FrameError {
  const char* field = "";   // Field being written or read
  std::size_t offset = 0;   // Byte offset of that field in the frame
};

/**
 * FrameCodec - Byte-exact encoder/decoder for dialogue frames
 *
 * Frame layout (multi-byte fields big-endian):
 * - byte0: version << 4 | header size in words
 * - byte1: type code << 4 | flags
 * - byte2: serialization << 4 | compression
 * - zero padding up to header size * 4 bytes
 * - [audio-only kinds with sequence flags] int32 sequence
 * - [Error kind] uint32 error code
 * - [WithEvent] int32 event
 *     - [event not in {1,2,50,51,52}] uint32 length + session id
 *     - [event in {50,51,52}] uint32 length + connect id
 * - uint32 payload length + payload
 *
 * The codec holds no per-call state; one instance may encode and decode
 * from several threads at once.
 */
class FrameCodec {
 public:
  /**
   * Construct a codec
   * @param config Header nibbles used by Encode(msg, out)
   */
  explicit FrameCodec(const ProtocolConfig& config = ProtocolConfig());

  /**
   * Install a payload compressor (not owned, may be nullptr)
   * Must be called before the codec is shared between threads.
   */
  void SetCompressor(const hal::ICompressor* compressor);

  /**
   * Encode a message with the codec's own configuration
   */
  CodecResult Encode(const Message& msg, Bytes& out,
                     FrameError* error = nullptr) const;

  /**
   * Encode a message
   * @param msg Message to encode
   * @param config Header nibbles for this frame
   * @param out Output frame (replaced)
   * @param error Optional failure location
   * @return kSuccess or the reason the message was rejected
   */
  CodecResult Encode(const Message& msg, const ProtocolConfig& config,
                     Bytes& out, FrameError* error = nullptr) const;

  /**
   * Decode one frame
   * @param data Frame bytes
   * @param size Number of bytes
   * @param msg Output message (valid only on kSuccess)
   * @param header Optional output: header nibbles announced by the sender
   * @param error Optional failure location
   * @return kSuccess, kMalformedFrame, kUnknownMessageType or kCompressionFailed
   */
  CodecResult Decode(const uint8_t* data, std::size_t size, Message& msg,
                     ProtocolConfig* header = nullptr,
                     FrameError* error = nullptr) const;

  CodecResult Decode(const Bytes& frame, Message& msg,
                     ProtocolConfig* header = nullptr,
                     FrameError* error = nullptr) const;

  /**
   * Get error message for result
   */
  static const char* ResultToString(CodecResult result);

 private:
  CodecResult Validate(const Message& msg, FrameError* error) const;

  ProtocolConfig config_;
  const hal::ICompressor* compressor_ = nullptr;
};

}  // namespace protocol
}  // namespace duplex

#endif  // DUPLEX_PROTOCOL_FRAME_CODEC_HPP_
