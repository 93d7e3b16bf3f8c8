#include "duplex/protocol/message.hpp"

#include <array>

namespace duplex {
namespace protocol {

namespace {

constexpr uint8_t kUnmapped = 0xFF;

// Indexed by MessageKind
constexpr std::array<uint8_t, MessageTypeRegistry::kKindCount> kKindToCode = {
    0b0001,  // kFullClient
    0b0010,  // kAudioOnlyClient
    0b1001,  // kFullServer
    0b1011,  // kAudioOnlyServer
    0b1100,  // kFrontEndResult
    0b1111,  // kError
};

std::array<uint8_t, 16> BuildCodeToKind() {
  std::array<uint8_t, 16> table;
  table.fill(kUnmapped);
  for (std::size_t kind = 0; kind < kKindToCode.size(); ++kind) {
    table[kKindToCode[kind]] = static_cast<uint8_t>(kind);
  }
  return table;
}

const std::array<uint8_t, 16> kCodeToKind = BuildCodeToKind();

}  // namespace

bool MessageTypeRegistry::ToWireCode(MessageKind kind, uint8_t& code) {
  const auto index = static_cast<std::size_t>(kind);
  if (index >= kKindToCode.size()) {
    return false;
  }
  code = kKindToCode[index];
  return true;
}

std::optional<MessageKind> MessageTypeRegistry::FromWireCode(uint8_t code) {
  const uint8_t kind = kCodeToKind[code & MessageFlags::kNibbleMask];
  if (kind == kUnmapped) {
    return std::nullopt;
  }
  return static_cast<MessageKind>(kind);
}

const char* MessageTypeRegistry::KindToString(MessageKind kind) {
  switch (kind) {
    case MessageKind::kFullClient:
      return "FullClient";
    case MessageKind::kAudioOnlyClient:
      return "AudioOnlyClient";
    case MessageKind::kFullServer:
      return "FullServer";
    case MessageKind::kAudioOnlyServer:
      return "AudioOnlyServer";
    case MessageKind::kFrontEndResult:
      return "FrontEndResult";
    case MessageKind::kError:
      return "Error";
    default:
      return "Unknown";
  }
}

}  // namespace protocol
}  // namespace duplex
