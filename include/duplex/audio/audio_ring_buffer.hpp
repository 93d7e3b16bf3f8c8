#ifndef DUPLEX_AUDIO_AUDIO_RING_BUFFER_HPP_
#define DUPLEX_AUDIO_AUDIO_RING_BUFFER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace duplex {
namespace audio {

/**
 * AudioRingBuffer - Fixed-capacity circular store of float samples
 *
 * Bridges the network receive loop (producer) and the playback device
 * callback (consumer), which run on independent clocks.
 *
 * Key characteristics:
 * - Latest wins: on overflow the oldest samples are discarded so that
 *   exactly the newest Capacity() samples remain
 * - Non-blocking: Pull() returns what is there and never waits for data
 * - No allocation after construction
 * - One mutex guards indices and storage, held only for the copy
 *
 * Indices are monotonically increasing 64-bit counters; the slot of an
 * index is index % capacity.
 */
class AudioRingBuffer {
 public:
  /**
   * Construct a buffer
   * @param capacity Maximum number of buffered samples
   */
  explicit AudioRingBuffer(std::size_t capacity);

  // Non-copyable, non-movable
  AudioRingBuffer(const AudioRingBuffer&) = delete;
  AudioRingBuffer& operator=(const AudioRingBuffer&) = delete;
  AudioRingBuffer(AudioRingBuffer&&) = delete;
  AudioRingBuffer& operator=(AudioRingBuffer&&) = delete;

  ~AudioRingBuffer() = default;

  /**
   * Capacity for a sample rate and a maximum buffered duration
   */
  static constexpr std::size_t CapacityFor(uint32_t sample_rate,
                                           uint32_t max_buffered_seconds) {
    return static_cast<std::size_t>(sample_rate) * max_buffered_seconds;
  }

  /**
   * Append samples to the tail (Producer)
   * Discards the oldest samples if the result would exceed capacity.
   * @param samples Sample data
   * @param count Number of samples
   */
  void Push(const float* samples, std::size_t count);

  /**
   * Remove up to max_count samples from the head (Consumer)
   * @param out Destination, at least max_count samples long
   * @param max_count Number of samples wanted
   * @return Number of samples written to out (may be less than max_count)
   */
  std::size_t Pull(float* out, std::size_t max_count);

  /**
   * Drop every buffered sample
   */
  void Clear();

  std::size_t Size() const;
  bool Empty() const;

  std::size_t Capacity() const { return capacity_; }

  /**
   * Total samples discarded by overflow since construction
   */
  uint64_t DroppedSamples() const {
    return dropped_samples_.load(std::memory_order_relaxed);
  }

 private:
  void CopyIn(uint64_t index, const float* src, std::size_t count);
  void CopyOut(uint64_t index, float* dst, std::size_t count) const;

  const std::size_t capacity_;
  std::vector<float> storage_;

  // Guarded by mutex_
  uint64_t write_idx_ = 0;
  uint64_t read_idx_ = 0;
  mutable std::mutex mutex_;

  std::atomic<uint64_t> dropped_samples_{0};
};

}  // namespace audio
}  // namespace duplex

#endif  // DUPLEX_AUDIO_AUDIO_RING_BUFFER_HPP_
