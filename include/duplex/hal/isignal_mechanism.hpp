#ifndef DUPLEX_HAL_ISIGNAL_MECHANISM_HPP_
#define DUPLEX_HAL_ISIGNAL_MECHANISM_HPP_

#include <cstdint>

namespace duplex {
namespace hal {

/**
 * ISignalMechanism - Platform-agnostic wakeup signal
 *
 * Used to interrupt a thread blocked on I/O, e.g. a receive loop waiting
 * for the next frame when the transport is closed from another thread.
 * The native handle can be polled together with the I/O descriptor.
 */
class ISignalMechanism {
 public:
  virtual ~ISignalMechanism() = default;

  /**
   * Raise the signal
   * @return true if notification succeeded
   */
  virtual bool Notify() = 0;

  /**
   * Wait for signal to be raised
   * @param timeout_ms Maximum time to wait in milliseconds (0 = infinite)
   * @return true if signaled, false if timeout
   */
  virtual bool Wait(uint32_t timeout_ms = 0) = 0;

  /**
   * Reset the signal (clear pending notifications)
   * @return true if reset succeeded
   */
  virtual bool Reset() = 0;

  /**
   * Get file descriptor or handle (platform-specific)
   * @return Native handle for polling/selecting
   */
  virtual int GetNativeHandle() const = 0;

  /**
   * Check if the mechanism is valid/open
   */
  virtual bool IsValid() const = 0;

  /**
   * Get the last error message
   */
  virtual const char* GetLastError() const = 0;
};

}  // namespace hal
}  // namespace duplex

#endif  // DUPLEX_HAL_ISIGNAL_MECHANISM_HPP_
