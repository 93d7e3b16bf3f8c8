/**
 * Frame Dump Example - Shows the wire layout of dialogue frames
 */

#include <cstdio>
#include <iostream>
#include <string>

#include "duplex/protocol/events.hpp"
#include "duplex/protocol/frame_codec.hpp"

namespace {

void Dump(const char* title, const duplex::protocol::Bytes& frame) {
  std::cout << title << " (" << frame.size() << " bytes):" << std::endl
            << " ";
  for (std::size_t i = 0; i < frame.size(); ++i) {
    char hex[4];
    std::snprintf(hex, sizeof(hex), " %02x", frame[i]);
    std::cout << hex;
    if (i % 16 == 15 && i + 1 < frame.size()) {
      std::cout << std::endl << " ";
    }
  }
  std::cout << std::endl;
}

}  // namespace

int main() {
  using duplex::protocol::Event;
  using duplex::protocol::FrameCodec;
  using duplex::protocol::Message;
  using duplex::protocol::MessageFlags;
  using duplex::protocol::MessageKind;

  std::cout << "Duplex Frame Dump Example" << std::endl;
  std::cout << "=========================" << std::endl;

  FrameCodec codec;
  duplex::protocol::Bytes frame;

  Message start;
  start.kind = MessageKind::kFullClient;
  start.flags = MessageFlags::kWithEvent;
  start.event = Event::kStartConnection;
  start.payload = {'{', '}'};
  if (codec.Encode(start, frame) == duplex::protocol::CodecResult::kSuccess) {
    Dump("StartConnection", frame);
  }

  Message audio;
  audio.kind = MessageKind::kAudioOnlyClient;
  audio.flags = MessageFlags::kWithEvent | MessageFlags::kPositiveSeq;
  audio.event = Event::kTaskRequest;
  audio.session_id = "s1";
  audio.sequence = 7;
  audio.payload = {0x01, 0x02};
  duplex::protocol::ProtocolConfig raw;
  raw.serialization = duplex::protocol::Serialization::kRaw;
  if (codec.Encode(audio, raw, frame) == duplex::protocol::CodecResult::kSuccess) {
    Dump("Audio block (sequence 7)", frame);
  }

  // Decode it back and report every field
  Message decoded;
  duplex::protocol::ProtocolConfig header;
  duplex::protocol::FrameError error;
  duplex::protocol::CodecResult result =
      codec.Decode(frame, decoded, &header, &error);
  if (result != duplex::protocol::CodecResult::kSuccess) {
    std::cerr << "Decode failed: " << FrameCodec::ResultToString(result)
              << " at " << error.field << std::endl;
    return 1;
  }
  std::cout << "\nDecoded:" << std::endl;
  std::cout << "  kind: "
            << duplex::protocol::MessageTypeRegistry::KindToString(decoded.kind)
            << std::endl;
  std::cout << "  header bytes: " << header.HeaderBytes() << std::endl;
  std::cout << "  sequence: " << decoded.sequence.value_or(0) << std::endl;
  std::cout << "  event: " << decoded.event.value_or(0) << std::endl;
  std::cout << "  session id: " << decoded.session_id.value_or("") << std::endl;
  std::cout << "  payload: " << decoded.payload.size() << " bytes" << std::endl;

  // A truncated frame names the field it stopped in
  result = codec.Decode(frame.data(), 13, decoded, nullptr, &error);
  std::cout << "\nTruncated to 13 bytes: " << FrameCodec::ResultToString(result)
            << " (" << error.field << " at offset " << error.offset << ")"
            << std::endl;

  return 0;
}
