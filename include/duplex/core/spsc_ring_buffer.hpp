#ifndef DUPLEX_CORE_SPSC_RING_BUFFER_HPP_
#define DUPLEX_CORE_SPSC_RING_BUFFER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <utility>

namespace duplex {
namespace core {

/**
 * SPSC Ring Buffer - Single Producer Single Consumer Lock-Free Queue
 *
 * Hands decoded control messages from the receive loop (producer) to the
 * application thread (consumer) without a lock.
 *
 * Key characteristics:
 * - Lock-free: Uses atomic operations only
 * - SPSC: Single Producer, Single Consumer
 * - Bounded: Fixed capacity, storage embedded in the object
 * - Elements are constructed on push and destroyed on pop
 *
 * Memory ordering:
 * - Producer writes data, then updates write_idx (release)
 * - Consumer reads write_idx, then reads data (acquire)
 * - This ensures data is visible only after the index update
 *
 * @tparam T The element type
 * @tparam Capacity The fixed capacity of the queue (must be power of 2 for efficient modulo)
 */
template <typename T, std::size_t Capacity>
class SpscRingBuffer {
 public:
  static_assert(Capacity > 0, "Capacity must be positive");
  static_assert((Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");

  SpscRingBuffer() = default;

  // Non-copyable, non-movable
  SpscRingBuffer(const SpscRingBuffer&) = delete;
  SpscRingBuffer& operator=(const SpscRingBuffer&) = delete;
  SpscRingBuffer(SpscRingBuffer&&) = delete;
  SpscRingBuffer& operator=(SpscRingBuffer&&) = delete;

  ~SpscRingBuffer();

  /**
   * Push an element to the back of the queue (Producer only)
   * @param item The item to push
   * @return true if pushed successfully, false if queue is full
   */
  bool Push(const T& item);

  /**
   * Move an element to the back of the queue (Producer only)
   * @param item The item to push
   * @return true if pushed successfully, false if queue is full
   */
  bool Push(T&& item);

  /**
   * Peek at the front element without removing it (Consumer only)
   * @return Pointer to the front element, nullptr if queue is empty
   */
  T* Peek() const;

  /**
   * Pop the front element (Consumer only)
   * @return true if popped successfully, false if queue is empty
   */
  bool Pop();

  /**
   * Move the front element out and pop it (Consumer only)
   * @param out Receives the element
   * @return true if an element was taken, false if queue is empty
   */
  bool TryPop(T& out);

  /**
   * Check if the queue is empty
   */
  bool Empty() const;

  /**
   * Check if the queue is full
   */
  bool Full() const;

  /**
   * Get the number of elements in the queue
   */
  std::size_t Size() const;

  static constexpr std::size_t kCapacity = Capacity;

 private:
  template <typename U>
  bool Emplace(U&& item);

  T* GetElementPtr(uint64_t index) const;

  alignas(T) unsigned char storage_[sizeof(T) * Capacity];

  // Write index (Producer only) - using uint64_t to avoid wrap-around issues
  alignas(64) std::atomic<uint64_t> write_idx_{0};

  // Read index (Consumer only)
  alignas(64) std::atomic<uint64_t> read_idx_{0};
};

// Template implementation

template <typename T, std::size_t Capacity>
SpscRingBuffer<T, Capacity>::~SpscRingBuffer() {
  while (Pop()) {
  }
}

template <typename T, std::size_t Capacity>
template <typename U>
bool SpscRingBuffer<T, Capacity>::Emplace(U&& item) {
  const uint64_t current_write = write_idx_.load(std::memory_order_relaxed);
  const uint64_t current_read = read_idx_.load(std::memory_order_acquire);

  // Check if full: write index has caught up to read index (with capacity offset)
  if (current_write - current_read >= kCapacity) {
    return false;
  }

  T* slot = GetElementPtr(current_write);
  new (slot) T(std::forward<U>(item));

  // Signal the new element to consumers (release semantics)
  write_idx_.store(current_write + 1, std::memory_order_release);
  return true;
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::Push(const T& item) {
  return Emplace(item);
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::Push(T&& item) {
  return Emplace(std::move(item));
}

template <typename T, std::size_t Capacity>
T* SpscRingBuffer<T, Capacity>::Peek() const {
  const uint64_t current_read = read_idx_.load(std::memory_order_relaxed);
  const uint64_t current_write = write_idx_.load(std::memory_order_acquire);

  if (current_write == current_read) {
    return nullptr;
  }

  return GetElementPtr(current_read);
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::Pop() {
  const uint64_t current_read = read_idx_.load(std::memory_order_relaxed);
  const uint64_t current_write = write_idx_.load(std::memory_order_acquire);

  if (current_write == current_read) {
    return false;
  }

  T* slot = GetElementPtr(current_read);
  slot->~T();

  // Advance read index (release)
  read_idx_.store(current_read + 1, std::memory_order_release);
  return true;
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::TryPop(T& out) {
  T* front = Peek();
  if (front == nullptr) {
    return false;
  }
  out = std::move(*front);
  return Pop();
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::Empty() const {
  return write_idx_.load(std::memory_order_acquire) ==
         read_idx_.load(std::memory_order_acquire);
}

template <typename T, std::size_t Capacity>
bool SpscRingBuffer<T, Capacity>::Full() const {
  const uint64_t write = write_idx_.load(std::memory_order_relaxed);
  const uint64_t read = read_idx_.load(std::memory_order_acquire);
  return (write - read) >= kCapacity;
}

template <typename T, std::size_t Capacity>
std::size_t SpscRingBuffer<T, Capacity>::Size() const {
  const uint64_t write = write_idx_.load(std::memory_order_acquire);
  const uint64_t read = read_idx_.load(std::memory_order_acquire);
  return static_cast<std::size_t>(write - read);
}

template <typename T, std::size_t Capacity>
T* SpscRingBuffer<T, Capacity>::GetElementPtr(uint64_t index) const {
  // Power of 2 capacity allows efficient modulo with bitwise AND
  const std::size_t offset =
      static_cast<std::size_t>(index & (kCapacity - 1)) * sizeof(T);
  return std::launder(reinterpret_cast<T*>(
      const_cast<unsigned char*>(storage_) + offset));
}

}  // namespace core
}  // namespace duplex

#endif  // DUPLEX_CORE_SPSC_RING_BUFFER_HPP_
