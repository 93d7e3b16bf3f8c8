#include "duplex/audio/audio_ring_buffer.hpp"

#include <algorithm>
#include <cstring>

namespace duplex {
namespace audio {

AudioRingBuffer::AudioRingBuffer(std::size_t capacity)
    : capacity_(capacity), storage_(capacity, 0.0f) {}

void AudioRingBuffer::Push(const float* samples, std::size_t count) {
  if (count == 0) {
    return;
  }
  if (capacity_ == 0) {
    dropped_samples_.fetch_add(count, std::memory_order_relaxed);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t dropped = 0;

  // Only the newest capacity_ samples of an oversized block can survive
  if (count >= capacity_) {
    dropped += (write_idx_ - read_idx_) + (count - capacity_);
    samples += count - capacity_;
    count = capacity_;
    read_idx_ = write_idx_;
  }

  const std::size_t used = static_cast<std::size_t>(write_idx_ - read_idx_);
  const std::size_t free_space = capacity_ - used;
  if (count > free_space) {
    read_idx_ += count - free_space;
    dropped += count - free_space;
  }

  CopyIn(write_idx_, samples, count);
  write_idx_ += count;

  if (dropped != 0) {
    dropped_samples_.fetch_add(dropped, std::memory_order_relaxed);
  }
}

std::size_t AudioRingBuffer::Pull(float* out, std::size_t max_count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t available = static_cast<std::size_t>(write_idx_ - read_idx_);
  const std::size_t count = std::min(available, max_count);
  if (count == 0) {
    return 0;
  }

  CopyOut(read_idx_, out, count);
  read_idx_ += count;
  return count;
}

void AudioRingBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  read_idx_ = write_idx_;
}

std::size_t AudioRingBuffer::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(write_idx_ - read_idx_);
}

bool AudioRingBuffer::Empty() const {
  return Size() == 0;
}

void AudioRingBuffer::CopyIn(uint64_t index, const float* src,
                             std::size_t count) {
  const std::size_t start = static_cast<std::size_t>(index % capacity_);
  const std::size_t first = std::min(count, capacity_ - start);
  std::memcpy(storage_.data() + start, src, first * sizeof(float));
  if (first < count) {
    std::memcpy(storage_.data(), src + first, (count - first) * sizeof(float));
  }
}

void AudioRingBuffer::CopyOut(uint64_t index, float* dst,
                              std::size_t count) const {
  const std::size_t start = static_cast<std::size_t>(index % capacity_);
  const std::size_t first = std::min(count, capacity_ - start);
  std::memcpy(dst, storage_.data() + start, first * sizeof(float));
  if (first < count) {
    std::memcpy(dst + first, storage_.data(), (count - first) * sizeof(float));
  }
}

}  // namespace audio
}  // namespace duplex
