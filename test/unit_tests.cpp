#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "duplex/audio/audio_ring_buffer.hpp"
#include "duplex/audio/sample_format.hpp"
#include "duplex/core/spsc_ring_buffer.hpp"
#include "duplex/platform/linux_eventfd.hpp"
#include "duplex/protocol/events.hpp"
#include "duplex/protocol/message.hpp"

namespace duplex {
namespace test {

// === Message Type Registry Tests ===

TEST(MessageTypeRegistryTest, WireCodes) {
  struct Entry {
    protocol::MessageKind kind;
    uint8_t code;
  };
  const Entry entries[] = {
      {protocol::MessageKind::kFullClient, 0b0001},
      {protocol::MessageKind::kAudioOnlyClient, 0b0010},
      {protocol::MessageKind::kFullServer, 0b1001},
      {protocol::MessageKind::kAudioOnlyServer, 0b1011},
      {protocol::MessageKind::kFrontEndResult, 0b1100},
      {protocol::MessageKind::kError, 0b1111},
  };

  for (const Entry& entry : entries) {
    uint8_t code = 0;
    ASSERT_TRUE(protocol::MessageTypeRegistry::ToWireCode(entry.kind, code));
    EXPECT_EQ(code, entry.code);

    auto kind = protocol::MessageTypeRegistry::FromWireCode(entry.code);
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, entry.kind);
  }
}

TEST(MessageTypeRegistryTest, UnmappedCodes) {
  const uint8_t unmapped[] = {0x0, 0x3, 0x4, 0x5, 0x6, 0x7, 0x8, 0xA, 0xD, 0xE};
  for (uint8_t code : unmapped) {
    EXPECT_FALSE(protocol::MessageTypeRegistry::FromWireCode(code).has_value())
        << "code " << static_cast<int>(code);
  }
}

TEST(MessageTypeRegistryTest, KindNames) {
  EXPECT_STREQ(protocol::MessageTypeRegistry::KindToString(
                   protocol::MessageKind::kFullClient),
               "FullClient");
  EXPECT_STREQ(protocol::MessageTypeRegistry::KindToString(
                   protocol::MessageKind::kError),
               "Error");
}

// === Sequence Presence Policy Tests ===

TEST(SequencePolicyTest, LowBitsDecide) {
  EXPECT_FALSE(protocol::ContainsSequence(protocol::MessageFlags::kNoSeq));
  EXPECT_TRUE(protocol::ContainsSequence(protocol::MessageFlags::kPositiveSeq));
  EXPECT_FALSE(protocol::ContainsSequence(protocol::MessageFlags::kLastNoSeq));
  EXPECT_TRUE(protocol::ContainsSequence(protocol::MessageFlags::kNegativeSeq));
}

TEST(SequencePolicyTest, EventBitIsIndependent) {
  for (uint8_t flags = 0; flags < 16; ++flags) {
    const uint8_t low = flags & 0b0011;
    EXPECT_EQ(protocol::ContainsSequence(flags), low == 0b01 || low == 0b11)
        << "flags " << static_cast<int>(flags);
    EXPECT_EQ(protocol::ContainsEvent(flags), (flags & 0b0100) != 0);
  }
}

TEST(SequencePolicyTest, OnlyAudioKindsCarrySequence) {
  EXPECT_TRUE(protocol::CarriesSequenceField(
      protocol::MessageKind::kAudioOnlyClient));
  EXPECT_TRUE(protocol::CarriesSequenceField(
      protocol::MessageKind::kAudioOnlyServer));
  EXPECT_FALSE(
      protocol::CarriesSequenceField(protocol::MessageKind::kFullClient));
  EXPECT_FALSE(
      protocol::CarriesSequenceField(protocol::MessageKind::kFullServer));
  EXPECT_FALSE(protocol::CarriesSequenceField(protocol::MessageKind::kError));
}

// === Event Table Tests ===

TEST(EventTest, ReservedAndConnectEvents) {
  for (int32_t event : {1, 2, 50, 51, 52}) {
    EXPECT_TRUE(protocol::IsReservedEvent(event)) << event;
  }
  for (int32_t event : {100, 102, 150, 152, 200, 300, 450, 500}) {
    EXPECT_FALSE(protocol::IsReservedEvent(event)) << event;
  }

  EXPECT_FALSE(protocol::IsConnectEvent(1));
  EXPECT_FALSE(protocol::IsConnectEvent(2));
  EXPECT_TRUE(protocol::IsConnectEvent(50));
  EXPECT_TRUE(protocol::IsConnectEvent(51));
  EXPECT_TRUE(protocol::IsConnectEvent(52));

  EXPECT_TRUE(protocol::IsSessionEndEvent(152));
  EXPECT_TRUE(protocol::IsSessionEndEvent(153));
  EXPECT_FALSE(protocol::IsSessionEndEvent(150));
}

// === SPSC Ring Buffer Tests ===

class SpscRingBufferTest : public ::testing::Test {
 protected:
  struct TestMessage {
    uint64_t seq_id;
    int32_t event;
    std::string session_id;
  };

  static constexpr std::size_t kCapacity = 16;
};

TEST_F(SpscRingBufferTest, BasicPushPop) {
  core::SpscRingBuffer<TestMessage, kCapacity> queue;

  TestMessage msg{1, 150, "session"};
  EXPECT_TRUE(queue.Push(msg));
  EXPECT_FALSE(queue.Empty());
  EXPECT_EQ(queue.Size(), 1u);

  TestMessage* peeked = queue.Peek();
  ASSERT_NE(peeked, nullptr);
  EXPECT_EQ(peeked->seq_id, 1u);
  EXPECT_EQ(peeked->session_id, "session");

  EXPECT_TRUE(queue.Pop());
  EXPECT_TRUE(queue.Empty());
  EXPECT_EQ(queue.Size(), 0u);
}

TEST_F(SpscRingBufferTest, PushPopMultiple) {
  core::SpscRingBuffer<TestMessage, kCapacity> queue;

  // Fill the queue
  for (uint64_t i = 0; i < kCapacity; ++i) {
    EXPECT_TRUE(queue.Push(TestMessage{i, static_cast<int32_t>(i + 100), ""}));
  }

  EXPECT_TRUE(queue.Full());
  EXPECT_EQ(queue.Size(), kCapacity);

  // Try to push one more (should fail)
  EXPECT_FALSE(queue.Push(TestMessage{100, 200, ""}));

  // Empty the queue
  for (uint64_t i = 0; i < kCapacity; ++i) {
    TestMessage* msg = queue.Peek();
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->seq_id, i);
    EXPECT_TRUE(queue.Pop());
  }

  EXPECT_TRUE(queue.Empty());
  EXPECT_FALSE(queue.Pop());
  EXPECT_EQ(queue.Peek(), nullptr);
}

TEST_F(SpscRingBufferTest, TryPopMovesElement) {
  core::SpscRingBuffer<TestMessage, kCapacity> queue;
  EXPECT_TRUE(queue.Push(TestMessage{7, 451, "asr"}));

  TestMessage out{0, 0, ""};
  EXPECT_TRUE(queue.TryPop(out));
  EXPECT_EQ(out.seq_id, 7u);
  EXPECT_EQ(out.event, 451);
  EXPECT_EQ(out.session_id, "asr");
  EXPECT_FALSE(queue.TryPop(out));
}

TEST_F(SpscRingBufferTest, WrapAround) {
  core::SpscRingBuffer<TestMessage, 4> queue;

  for (uint64_t round = 0; round < 10; ++round) {
    EXPECT_TRUE(queue.Push(TestMessage{round * 2, 0, ""}));
    EXPECT_TRUE(queue.Push(TestMessage{round * 2 + 1, 0, ""}));

    TestMessage out{0, 0, ""};
    ASSERT_TRUE(queue.TryPop(out));
    EXPECT_EQ(out.seq_id, round * 2);
    ASSERT_TRUE(queue.TryPop(out));
    EXPECT_EQ(out.seq_id, round * 2 + 1);
  }
  EXPECT_TRUE(queue.Empty());
}

TEST_F(SpscRingBufferTest, DestructorReleasesElements) {
  auto tracker = std::make_shared<int>(0);
  {
    core::SpscRingBuffer<std::shared_ptr<int>, 8> queue;
    EXPECT_TRUE(queue.Push(tracker));
    EXPECT_TRUE(queue.Push(tracker));
    EXPECT_EQ(tracker.use_count(), 3);
  }
  EXPECT_EQ(tracker.use_count(), 1);
}

// === Sample Format Tests ===

TEST(SampleFormatTest, PackPcm16LittleEndian) {
  const int16_t samples[] = {1, -1, 0x1234};
  std::vector<uint8_t> bytes;
  audio::PackPcm16Le(samples, 3, bytes);

  const std::vector<uint8_t> expected = {0x01, 0x00, 0xFF, 0xFF, 0x34, 0x12};
  EXPECT_EQ(bytes, expected);
}

TEST(SampleFormatTest, UnpackFloat32LittleEndian) {
  // 1.0f = 0x3F800000, -2.0f = 0xC0000000
  const uint8_t bytes[] = {0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0xC0};
  std::vector<float> samples;
  ASSERT_EQ(audio::UnpackFloat32Le(bytes, sizeof(bytes), samples), 2u);
  EXPECT_FLOAT_EQ(samples[0], 1.0f);
  EXPECT_FLOAT_EQ(samples[1], -2.0f);
}

TEST(SampleFormatTest, PartialTrailingSampleIgnored) {
  const uint8_t bytes[] = {0x00, 0x00, 0x80, 0x3F, 0x12, 0x34};
  std::vector<float> samples;
  EXPECT_EQ(audio::UnpackFloat32Le(bytes, sizeof(bytes), samples), 1u);
  EXPECT_EQ(samples.size(), 1u);
}

TEST(SampleFormatTest, PackFloat32MatchesUnpack) {
  const float samples[] = {0.25f, -0.5f, 0.0f};
  std::vector<uint8_t> bytes;
  audio::PackFloat32Le(samples, 3, bytes);
  ASSERT_EQ(bytes.size(), 12u);
  EXPECT_EQ(bytes[0], 0x00);
  EXPECT_EQ(bytes[3], 0x3E);  // 0.25f = 0x3E800000

  std::vector<float> decoded;
  ASSERT_EQ(audio::UnpackFloat32Le(bytes.data(), bytes.size(), decoded), 3u);
  EXPECT_FLOAT_EQ(decoded[1], -0.5f);
}

// === Audio Ring Buffer Tests ===

class AudioRingBufferTest : public ::testing::Test {
 protected:
  static std::vector<float> Ramp(float start, std::size_t count) {
    std::vector<float> samples(count);
    for (std::size_t i = 0; i < count; ++i) {
      samples[i] = start + static_cast<float>(i);
    }
    return samples;
  }

  static constexpr std::size_t kCapacity = 8;
  audio::AudioRingBuffer ring{kCapacity};
};

TEST_F(AudioRingBufferTest, PushPullInOrder) {
  auto input = Ramp(0.0f, 5);
  ring.Push(input.data(), input.size());
  EXPECT_EQ(ring.Size(), 5u);

  float out[5] = {};
  ASSERT_EQ(ring.Pull(out, 5), 5u);
  for (std::size_t i = 0; i < 5; ++i) {
    EXPECT_FLOAT_EQ(out[i], static_cast<float>(i));
  }
  EXPECT_TRUE(ring.Empty());
}

TEST_F(AudioRingBufferTest, UnderflowReturnsAvailable) {
  auto input = Ramp(10.0f, 3);
  ring.Push(input.data(), input.size());

  float out[6] = {};
  EXPECT_EQ(ring.Pull(out, 6), 3u);
  EXPECT_FLOAT_EQ(out[2], 12.0f);
  EXPECT_EQ(ring.Pull(out, 6), 0u);
}

TEST_F(AudioRingBufferTest, OverflowKeepsNewest) {
  auto input = Ramp(0.0f, kCapacity + 3);
  ring.Push(input.data(), 6);
  ring.Push(input.data() + 6, input.size() - 6);

  EXPECT_EQ(ring.Size(), kCapacity);
  EXPECT_EQ(ring.DroppedSamples(), 3u);

  float out[kCapacity] = {};
  ASSERT_EQ(ring.Pull(out, kCapacity), kCapacity);
  for (std::size_t i = 0; i < kCapacity; ++i) {
    EXPECT_FLOAT_EQ(out[i], static_cast<float>(i + 3));
  }
}

TEST_F(AudioRingBufferTest, OversizedBlockKeepsItsTail) {
  auto head = Ramp(100.0f, 2);
  ring.Push(head.data(), head.size());

  auto block = Ramp(0.0f, kCapacity * 2);
  ring.Push(block.data(), block.size());

  EXPECT_EQ(ring.Size(), kCapacity);
  EXPECT_EQ(ring.DroppedSamples(), 2u + kCapacity);

  float out[kCapacity] = {};
  ASSERT_EQ(ring.Pull(out, kCapacity), kCapacity);
  EXPECT_FLOAT_EQ(out[0], static_cast<float>(kCapacity));
  EXPECT_FLOAT_EQ(out[kCapacity - 1], static_cast<float>(kCapacity * 2 - 1));
}

TEST_F(AudioRingBufferTest, WrapAroundPreservesOrder) {
  float out[kCapacity] = {};
  float next = 0.0f;
  float expected = 0.0f;

  for (int round = 0; round < 20; ++round) {
    auto input = Ramp(next, 5);
    next += 5.0f;
    ring.Push(input.data(), input.size());

    ASSERT_EQ(ring.Pull(out, 5), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
      EXPECT_FLOAT_EQ(out[i], expected);
      expected += 1.0f;
    }
  }
  EXPECT_EQ(ring.DroppedSamples(), 0u);
}

TEST_F(AudioRingBufferTest, ClearDropsEverything) {
  auto input = Ramp(0.0f, 6);
  ring.Push(input.data(), input.size());
  ring.Clear();

  EXPECT_TRUE(ring.Empty());
  float out[4] = {};
  EXPECT_EQ(ring.Pull(out, 4), 0u);

  // Still usable after a clear
  ring.Push(input.data(), 2);
  EXPECT_EQ(ring.Pull(out, 4), 2u);
}

TEST(AudioRingBufferCapacityTest, ZeroCapacityDropsAll) {
  audio::AudioRingBuffer ring(0);
  const float samples[] = {1.0f, 2.0f};
  ring.Push(samples, 2);

  float out[2] = {};
  EXPECT_EQ(ring.Pull(out, 2), 0u);
  EXPECT_EQ(ring.DroppedSamples(), 2u);
}

TEST(AudioRingBufferCapacityTest, CapacityForPlaybackDefaults) {
  EXPECT_EQ(audio::AudioRingBuffer::CapacityFor(24000, 100), 2400000u);
  audio::AudioRingBuffer ring(audio::AudioRingBuffer::CapacityFor(16000, 1));
  EXPECT_EQ(ring.Capacity(), 16000u);
}

// === EventFd Signal Tests ===

TEST(LinuxEventFdSignalTest, NotifyIsLevelTriggeredUntilReset) {
  platform::LinuxEventFdSignal signal;
  EXPECT_FALSE(signal.IsValid());
  EXPECT_FALSE(signal.Notify());

  ASSERT_TRUE(signal.Create());
  EXPECT_TRUE(signal.IsValid());
  EXPECT_GE(signal.GetNativeHandle(), 0);

  EXPECT_FALSE(signal.Wait(10));
  EXPECT_TRUE(signal.Notify());

  // Every poller sees the signal until it is reset
  EXPECT_TRUE(signal.Wait(10));
  EXPECT_TRUE(signal.Wait(10));

  EXPECT_TRUE(signal.Reset());
  EXPECT_FALSE(signal.Wait(10));
}

// === Main ===

}  // namespace test
}  // namespace duplex

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
