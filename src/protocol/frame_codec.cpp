#include "duplex/protocol/frame_codec.hpp"

#include <limits>
#include <string>
#include <utility>

#include "duplex/protocol/events.hpp"

namespace duplex {
namespace protocol {

namespace {

constexpr std::size_t kFixedHeaderBytes = 3;
constexpr uint64_t kMaxFieldLength = std::numeric_limits<uint32_t>::max();

void AppendU32Be(Bytes& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void AppendI32Be(Bytes& out, int32_t v) {
  AppendU32Be(out, static_cast<uint32_t>(v));
}

void AppendLengthPrefixed(Bytes& out, const uint8_t* data, std::size_t size) {
  AppendU32Be(out, static_cast<uint32_t>(size));
  out.insert(out.end(), data, data + size);
}

CodecResult Fail(CodecResult result, FrameError* error, const char* field,
                 std::size_t offset) {
  if (error != nullptr) {
    error->field = field;
    error->offset = offset;
  }
  return result;
}

/**
 * Bounds-checked cursor over an inbound frame
 *
 * Every read names the field it is reading so that a truncated frame can
 * be reported precisely.
 */
class FrameReader {
 public:
  FrameReader(const uint8_t* data, std::size_t size, FrameError* error)
      : data_(data), size_(size), error_(error) {}

  bool Need(std::size_t n, const char* field) {
    if (size_ - offset_ < n) {
      Fail(CodecResult::kMalformedFrame, error_, field, offset_);
      return false;
    }
    return true;
  }

  bool ReadU8(uint8_t& value, const char* field) {
    if (!Need(1, field)) {
      return false;
    }
    value = data_[offset_++];
    return true;
  }

  bool ReadU32(uint32_t& value, const char* field) {
    if (!Need(4, field)) {
      return false;
    }
    const uint8_t* p = data_ + offset_;
    value = (static_cast<uint32_t>(p[0]) << 24) |
            (static_cast<uint32_t>(p[1]) << 16) |
            (static_cast<uint32_t>(p[2]) << 8) |
            static_cast<uint32_t>(p[3]);
    offset_ += 4;
    return true;
  }

  bool ReadI32(int32_t& value, const char* field) {
    uint32_t raw = 0;
    if (!ReadU32(raw, field)) {
      return false;
    }
    value = static_cast<int32_t>(raw);
    return true;
  }

  bool Skip(std::size_t n, const char* field) {
    if (!Need(n, field)) {
      return false;
    }
    offset_ += n;
    return true;
  }

  bool ReadString(std::string& value, const char* length_field,
                  const char* field) {
    uint32_t length = 0;
    if (!ReadU32(length, length_field) || !Need(length, field)) {
      return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return true;
  }

  bool ReadBytes(Bytes& value, const char* length_field, const char* field) {
    uint32_t length = 0;
    if (!ReadU32(length, length_field) || !Need(length, field)) {
      return false;
    }
    value.assign(data_ + offset_, data_ + offset_ + length);
    offset_ += length;
    return true;
  }

  std::size_t Offset() const { return offset_; }

 private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t offset_ = 0;
  FrameError* error_;
};

}  // namespace

FrameCodec::FrameCodec(const ProtocolConfig& config) : config_(config) {}

void FrameCodec::SetCompressor(const hal::ICompressor* compressor) {
  compressor_ = compressor;
}

CodecResult FrameCodec::Encode(const Message& msg, Bytes& out,
                               FrameError* error) const {
  return Encode(msg, config_, out, error);
}

CodecResult FrameCodec::Validate(const Message& msg, FrameError* error) const {
  if ((msg.flags & ~MessageFlags::kNibbleMask) != 0) {
    return Fail(CodecResult::kInvalidMessage, error, "flags", 1);
  }

  const bool has_event = ContainsEvent(msg.flags);
  if (has_event != msg.event.has_value()) {
    return Fail(CodecResult::kInvalidMessage, error, "event", 0);
  }

  const bool has_sequence =
      CarriesSequenceField(msg.kind) && ContainsSequence(msg.flags);
  if (has_sequence != msg.sequence.has_value()) {
    return Fail(CodecResult::kInvalidMessage, error, "sequence", 0);
  }

  const bool has_error_code = msg.kind == MessageKind::kError;
  if (has_error_code != msg.error_code.has_value()) {
    return Fail(CodecResult::kInvalidMessage, error, "error_code", 0);
  }

  const bool needs_session = has_event && !IsReservedEvent(*msg.event);
  if (needs_session) {
    if (!msg.session_id.has_value() || msg.session_id->empty()) {
      return Fail(CodecResult::kInvalidMessage, error, "session_id", 0);
    }
  } else if (msg.session_id.has_value()) {
    return Fail(CodecResult::kInvalidMessage, error, "session_id", 0);
  }

  const bool needs_connect = has_event && IsConnectEvent(*msg.event);
  if (needs_connect != msg.connect_id.has_value()) {
    return Fail(CodecResult::kInvalidMessage, error, "connect_id", 0);
  }

  if (needs_session && msg.session_id->size() > kMaxFieldLength) {
    return Fail(CodecResult::kPayloadTooLarge, error, "session_id", 0);
  }
  if (needs_connect && msg.connect_id->size() > kMaxFieldLength) {
    return Fail(CodecResult::kPayloadTooLarge, error, "connect_id", 0);
  }

  return CodecResult::kSuccess;
}

CodecResult FrameCodec::Encode(const Message& msg, const ProtocolConfig& config,
                               Bytes& out, FrameError* error) const {
  if (!config.IsValid()) {
    return Fail(CodecResult::kInvalidConfig, error, "header", 0);
  }

  uint8_t type_code = 0;
  if (!MessageTypeRegistry::ToWireCode(msg.kind, type_code)) {
    return Fail(CodecResult::kUnknownMessageType, error, "message_type", 1);
  }

  CodecResult result = Validate(msg, error);
  if (result != CodecResult::kSuccess) {
    return result;
  }

  // Compression runs before the payload length is known
  const Bytes* payload = &msg.payload;
  Bytes compressed;
  if (compressor_ != nullptr && config.compression != Compression::kNone &&
      !msg.payload.empty()) {
    if (!compressor_->Compress(msg.payload.data(), msg.payload.size(),
                               compressed)) {
      return Fail(CodecResult::kCompressionFailed, error, "payload", 0);
    }
    payload = &compressed;
  }
  if (payload->size() > kMaxFieldLength) {
    return Fail(CodecResult::kPayloadTooLarge, error, "payload", 0);
  }

  const std::size_t header_bytes = config.HeaderBytes();
  out.clear();
  out.reserve(header_bytes + 28 + payload->size());

  out.push_back(static_cast<uint8_t>(
      (static_cast<uint8_t>(config.version) << 4) |
      static_cast<uint8_t>(config.header_size)));
  out.push_back(static_cast<uint8_t>((type_code << 4) | msg.flags));
  out.push_back(static_cast<uint8_t>(
      (static_cast<uint8_t>(config.serialization) << 4) |
      static_cast<uint8_t>(config.compression)));
  out.resize(header_bytes, 0);

  if (msg.sequence.has_value()) {
    AppendI32Be(out, *msg.sequence);
  }

  if (msg.error_code.has_value()) {
    AppendU32Be(out, *msg.error_code);
  }

  if (msg.event.has_value()) {
    AppendI32Be(out, *msg.event);
    if (msg.session_id.has_value()) {
      const std::string& id = *msg.session_id;
      AppendLengthPrefixed(out, reinterpret_cast<const uint8_t*>(id.data()),
                           id.size());
    }
    if (msg.connect_id.has_value()) {
      const std::string& id = *msg.connect_id;
      AppendLengthPrefixed(out, reinterpret_cast<const uint8_t*>(id.data()),
                           id.size());
    }
  }

  AppendLengthPrefixed(out, payload->data(), payload->size());
  return CodecResult::kSuccess;
}

CodecResult FrameCodec::Decode(const Bytes& frame, Message& msg,
                               ProtocolConfig* header,
                               FrameError* error) const {
  return Decode(frame.data(), frame.size(), msg, header, error);
}

CodecResult FrameCodec::Decode(const uint8_t* data, std::size_t size,
                               Message& msg, ProtocolConfig* header,
                               FrameError* error) const {
  FrameReader reader(data, size, error);
  Message decoded;

  uint8_t version_and_size = 0;
  if (!reader.ReadU8(version_and_size, "version_and_header_size")) {
    return CodecResult::kMalformedFrame;
  }

  uint8_t type_and_flags = 0;
  if (!reader.ReadU8(type_and_flags, "message_type_and_flags")) {
    return CodecResult::kMalformedFrame;
  }
  const auto kind = MessageTypeRegistry::FromWireCode(type_and_flags >> 4);
  if (!kind.has_value()) {
    return Fail(CodecResult::kUnknownMessageType, error, "message_type", 1);
  }
  decoded.kind = *kind;
  decoded.flags = type_and_flags & MessageFlags::kNibbleMask;

  uint8_t serialization_and_compression = 0;
  if (!reader.ReadU8(serialization_and_compression,
                     "serialization_and_compression")) {
    return CodecResult::kMalformedFrame;
  }

  ProtocolConfig announced;
  announced.version = static_cast<Version>(version_and_size >> 4);
  announced.header_size = static_cast<HeaderSize>(version_and_size & 0x0F);
  announced.serialization =
      static_cast<Serialization>(serialization_and_compression >> 4);
  announced.compression =
      static_cast<Compression>(serialization_and_compression & 0x0F);

  const std::size_t header_bytes = announced.HeaderBytes();
  if (header_bytes < kFixedHeaderBytes) {
    return Fail(CodecResult::kMalformedFrame, error, "header_size", 0);
  }
  if (!reader.Skip(header_bytes - kFixedHeaderBytes, "header_padding")) {
    return CodecResult::kMalformedFrame;
  }

  if (CarriesSequenceField(decoded.kind) && ContainsSequence(decoded.flags)) {
    int32_t sequence = 0;
    if (!reader.ReadI32(sequence, "sequence")) {
      return CodecResult::kMalformedFrame;
    }
    decoded.sequence = sequence;
  }

  if (decoded.kind == MessageKind::kError) {
    uint32_t code = 0;
    if (!reader.ReadU32(code, "error_code")) {
      return CodecResult::kMalformedFrame;
    }
    decoded.error_code = code;
  }

  if (ContainsEvent(decoded.flags)) {
    int32_t event = 0;
    if (!reader.ReadI32(event, "event")) {
      return CodecResult::kMalformedFrame;
    }
    decoded.event = event;

    if (!IsReservedEvent(event)) {
      std::string session_id;
      if (!reader.ReadString(session_id, "session_id_length", "session_id")) {
        return CodecResult::kMalformedFrame;
      }
      decoded.session_id = std::move(session_id);
    }

    if (IsConnectEvent(event)) {
      std::string connect_id;
      if (!reader.ReadString(connect_id, "connect_id_length", "connect_id")) {
        return CodecResult::kMalformedFrame;
      }
      decoded.connect_id = std::move(connect_id);
    }
  }

  const std::size_t payload_offset = reader.Offset();
  if (!reader.ReadBytes(decoded.payload, "payload_length", "payload")) {
    return CodecResult::kMalformedFrame;
  }

  if (compressor_ != nullptr && announced.compression != Compression::kNone &&
      !decoded.payload.empty()) {
    Bytes inflated;
    if (!compressor_->Decompress(decoded.payload.data(),
                                 decoded.payload.size(), inflated)) {
      return Fail(CodecResult::kCompressionFailed, error, "payload",
                  payload_offset);
    }
    decoded.payload = std::move(inflated);
  }

  if (header != nullptr) {
    *header = announced;
  }
  msg = std::move(decoded);
  return CodecResult::kSuccess;
}

const char* FrameCodec::ResultToString(CodecResult result) {
  switch (result) {
    case CodecResult::kSuccess:
      return "Success";
    case CodecResult::kMalformedFrame:
      return "Malformed frame";
    case CodecResult::kUnknownMessageType:
      return "Unknown message type";
    case CodecResult::kPayloadTooLarge:
      return "Payload too large";
    case CodecResult::kInvalidMessage:
      return "Invalid message";
    case CodecResult::kInvalidConfig:
      return "Invalid protocol configuration";
    case CodecResult::kCompressionFailed:
      return "Compression failed";
    default:
      return "Unknown error";
  }
}

}  // namespace protocol
}  // namespace duplex
