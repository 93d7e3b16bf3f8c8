#ifndef DUPLEX_PROTOCOL_MESSAGE_HPP_
#define DUPLEX_PROTOCOL_MESSAGE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace duplex {
namespace protocol {

using Bytes = std::vector<uint8_t>;

/**
 * Logical message kinds carried in the high nibble of header byte 1
 */
enum class MessageKind : uint8_t {
  kFullClient = 0,
  kAudioOnlyClient = 1,
  kFullServer = 2,
  kAudioOnlyServer = 3,
  kFrontEndResult = 4,
  kError = 5,
};

/**
 * Flag bits carried in the low nibble of header byte 1
 *
 * The low two bits encode sequence semantics, bit 2 signals that an
 * event number follows. WithEvent combines with any sequence value.
 */
struct MessageFlags {
  static constexpr uint8_t kNoSeq = 0b0000;
  static constexpr uint8_t kPositiveSeq = 0b0001;
  static constexpr uint8_t kLastNoSeq = 0b0010;
  static constexpr uint8_t kNegativeSeq = 0b0011;
  static constexpr uint8_t kWithEvent = 0b0100;

  static constexpr uint8_t kSequenceMask = 0b0011;
  static constexpr uint8_t kNibbleMask = 0b1111;
};

/**
 * MessageTypeRegistry - Fixed bidirectional kind <-> wire code table
 *
 * Wire codes:
 * - FullClient      0001
 * - AudioOnlyClient 0010
 * - FullServer      1001
 * - AudioOnlyServer 1011
 * - FrontEndResult  1100
 * - Error           1111
 *
 * Both tables are built once at static initialization and never change.
 */
class MessageTypeRegistry {
 public:
  static constexpr std::size_t kKindCount = 6;

  /**
   * Look up the 4-bit wire code of a kind
   * @param kind Message kind
   * @param code Output wire code (valid only if true is returned)
   * @return true if the kind has a wire code
   */
  static bool ToWireCode(MessageKind kind, uint8_t& code);

  /**
   * Look up the kind registered for a 4-bit wire code
   * @param code Wire code (only the low nibble is considered)
   * @return Kind, or nullopt if the code is unmapped
   */
  static std::optional<MessageKind> FromWireCode(uint8_t code);

  /**
   * Get a printable name for a kind
   */
  static const char* KindToString(MessageKind kind);
};

/**
 * Sequence presence policy
 *
 * True iff the sequence bits are PositiveSeq (01) or NegativeSeq (11).
 * This is the only predicate the encoder and the decoder consult.
 */
inline bool ContainsSequence(uint8_t flags) {
  const uint8_t bits = flags & MessageFlags::kSequenceMask;
  return bits == MessageFlags::kPositiveSeq || bits == MessageFlags::kNegativeSeq;
}

inline bool ContainsEvent(uint8_t flags) {
  return (flags & MessageFlags::kWithEvent) == MessageFlags::kWithEvent;
}

// Only audio-only frames reserve room for a sequence number on the wire.
inline bool CarriesSequenceField(MessageKind kind) {
  return kind == MessageKind::kAudioOnlyClient ||
         kind == MessageKind::kAudioOnlyServer;
}

/**
 * Message - One logical protocol unit
 *
 * Optional fields are present exactly when the kind, flags and event
 * require them (see FrameCodec for the checks).
 */
struct Message {
  MessageKind kind = MessageKind::kFullClient;
  uint8_t flags = MessageFlags::kNoSeq;
  std::optional<int32_t> event;
  std::optional<std::string> session_id;
  std::optional<std::string> connect_id;
  std::optional<int32_t> sequence;
  std::optional<uint32_t> error_code;
  Bytes payload;

  bool HasEvent(int32_t value) const {
    return event.has_value() && *event == value;
  }

  bool operator==(const Message& other) const {
    return kind == other.kind && flags == other.flags &&
           event == other.event && session_id == other.session_id &&
           connect_id == other.connect_id && sequence == other.sequence &&
           error_code == other.error_code && payload == other.payload;
  }

  bool operator!=(const Message& other) const { return !(*this == other); }
};

}  // namespace protocol
}  // namespace duplex

#endif  // DUPLEX_PROTOCOL_MESSAGE_HPP_
