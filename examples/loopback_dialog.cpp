/**
 * Loopback Dialog Example - Runs a dialogue against an in-process service
 *
 * The simulated service answers the handshakes, acknowledges recognized
 * speech and replies with a synthesized tone. The client streams capture
 * blocks at device cadence and drains playback blocks on its own clock.
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "duplex/audio/sample_format.hpp"
#include "duplex/client/dialog_client.hpp"
#include "duplex/platform/stream_socket_transport.hpp"
#include "duplex/protocol/events.hpp"

namespace {

using duplex::protocol::Event;
using duplex::protocol::Message;
using duplex::protocol::MessageFlags;
using duplex::protocol::MessageKind;

constexpr int kCaptureBlocks = 50;  // 0.5 s at 16 kHz / 160

void Reply(duplex::hal::ITransport& transport,
           const duplex::protocol::FrameCodec& codec, const Message& msg) {
  duplex::protocol::Bytes frame;
  if (codec.Encode(msg, frame) != duplex::protocol::CodecResult::kSuccess ||
      transport.Send(frame) != duplex::hal::TransportResult::kSuccess) {
    std::cerr << "[service] failed to reply" << std::endl;
  }
}

Message ServerEvent(int32_t event, const std::string& session_id) {
  Message msg;
  msg.kind = MessageKind::kFullServer;
  msg.flags = MessageFlags::kWithEvent;
  msg.event = event;
  if (duplex::protocol::IsConnectEvent(event)) {
    msg.connect_id = "loopback";
  } else if (!duplex::protocol::IsReservedEvent(event)) {
    msg.session_id = session_id;
  }
  msg.payload = {'{', '}'};
  return msg;
}

/**
 * Simulated service main loop
 */
void ServiceMain(duplex::hal::ITransport& transport) {
  duplex::protocol::FrameCodec codec;
  std::string session_id;
  int audio_blocks = 0;

  while (true) {
    duplex::protocol::Bytes frame;
    if (transport.Receive(frame, 2000) != duplex::hal::TransportResult::kSuccess) {
      return;
    }
    Message msg;
    if (codec.Decode(frame, msg) != duplex::protocol::CodecResult::kSuccess) {
      std::cerr << "[service] undecodable frame" << std::endl;
      return;
    }

    if (msg.kind == MessageKind::kAudioOnlyClient) {
      // Answer every 20 blocks of speech with a short tone
      if (++audio_blocks % 20 == 0) {
        Reply(transport, codec, ServerEvent(Event::kAsrInfo, session_id));

        std::vector<float> tone(2400);
        for (std::size_t i = 0; i < tone.size(); ++i) {
          tone[i] = 0.2f * std::sin(2.0f * 3.14159265f * 440.0f *
                                    static_cast<float>(i) / 24000.0f);
        }
        Message audio;
        audio.kind = MessageKind::kAudioOnlyServer;
        duplex::audio::PackFloat32Le(tone.data(), tone.size(), audio.payload);
        Reply(transport, codec, audio);

        Message text = ServerEvent(Event::kAsrResponse, session_id);
        const std::string body = "{\"results\":[{\"text\":\"hello\"}]}";
        text.payload.assign(body.begin(), body.end());
        Reply(transport, codec, text);
      }
      continue;
    }

    if (!msg.event.has_value()) {
      continue;
    }
    switch (*msg.event) {
      case Event::kStartConnection:
        Reply(transport, codec, ServerEvent(Event::kConnectionStarted, ""));
        break;
      case Event::kStartSession:
        session_id = msg.session_id.value_or("");
        Reply(transport, codec, ServerEvent(Event::kSessionStarted, session_id));
        break;
      case Event::kSayHello:
        Reply(transport, codec, ServerEvent(Event::kAsrResponse, session_id));
        break;
      case Event::kFinishSession:
        Reply(transport, codec, ServerEvent(Event::kSessionFinished, session_id));
        break;
      case Event::kFinishConnection:
        Reply(transport, codec, ServerEvent(Event::kConnectionFinished, ""));
        return;
      default:
        break;
    }
  }
}

}  // namespace

int main() {
  std::cout << "Duplex Loopback Dialog Example" << std::endl;
  std::cout << "==============================" << std::endl;

  std::unique_ptr<duplex::platform::StreamSocketTransport> client_end;
  std::unique_ptr<duplex::platform::StreamSocketTransport> service_end;
  if (!duplex::platform::StreamSocketTransport::CreatePair(client_end,
                                                           service_end)) {
    return 1;
  }
  std::thread service(ServiceMain, std::ref(*service_end));

  auto client = duplex::client::CreateDialogClient(*client_end);
  const duplex::client::ClientConfig& config = client->GetConfig();

  duplex::session::SessionError error = client->Connect();
  if (error == duplex::session::SessionError::kNone) {
    error = client->StartSession("loopback-session", {'{', '}'});
  }
  if (error == duplex::session::SessionError::kNone) {
    error = client->StartReceiving();
  }
  if (error != duplex::session::SessionError::kNone) {
    std::cerr << "Setup failed: " << duplex::session::SessionErrorToString(error)
              << " (" << client->GetLastErrorDetail() << ")" << std::endl;
    client_end->Close();
    service.join();
    return 1;
  }

  std::atomic<bool> playing{true};
  std::atomic<std::size_t> played{0};
  std::thread playback([&] {
    std::vector<float> block(config.playback.block_samples);
    const auto period = std::chrono::microseconds(
        1000000ULL * config.playback.block_samples / config.playback.sample_rate);
    while (playing.load()) {
      played += client->FillPlayback(block.data(), block.size());
      std::this_thread::sleep_for(period);
    }
  });

  std::vector<int16_t> capture(config.capture.block_samples, 0);
  const auto capture_period = std::chrono::microseconds(
      1000000ULL * config.capture.block_samples / config.capture.sample_rate);
  for (int i = 0; i < kCaptureBlocks; ++i) {
    if (client->OnCaptureBlock(capture.data(), capture.size()) !=
        duplex::session::SessionError::kNone) {
      break;
    }
    std::this_thread::sleep_for(capture_period);
  }
  client->RequestStop();
  if (client->OnCaptureBlock(capture.data(), capture.size()) !=
      duplex::session::SessionError::kNone) {
    std::cerr << "FinishSession could not be sent" << std::endl;
  }

  if (!client->WaitForSessionEnd(2000)) {
    std::cerr << "Session did not finish in time" << std::endl;
  }
  Message event;
  while (client->PollEvent(event)) {
    std::cout << "Event " << event.event.value_or(0) << ": "
              << std::string(event.payload.begin(), event.payload.end())
              << std::endl;
  }

  error = client->Disconnect();
  playing.store(false);
  playback.join();
  service.join();

  auto stats = client->GetStats();
  std::cout << "\nClient stats:" << std::endl;
  std::cout << "  Audio blocks sent: " << stats.audio_blocks_sent << std::endl;
  std::cout << "  Frames received: " << stats.frames_received << std::endl;
  std::cout << "  Samples received: " << stats.audio_samples_received << std::endl;
  std::cout << "  Samples played: " << played.load() << std::endl;
  std::cout << "  Samples dropped: " << stats.samples_dropped << std::endl;
  std::cout << "Result: " << duplex::session::SessionErrorToString(error)
            << std::endl;

  return error == duplex::session::SessionError::kNone ? 0 : 1;
}
