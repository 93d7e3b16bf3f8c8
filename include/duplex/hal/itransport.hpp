#ifndef DUPLEX_HAL_ITRANSPORT_HPP_
#define DUPLEX_HAL_ITRANSPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace duplex {
namespace hal {

/**
 * Result of a transport operation
 */
enum class TransportResult : uint8_t {
  kSuccess = 0,
  kTimeout = 1,  // Receive only: nothing arrived in time
  kClosed = 2,   // Channel closed locally or by the peer
  kError = 3,    // Read/write failure
};

inline const char* TransportResultToString(TransportResult result) {
  switch (result) {
    case TransportResult::kSuccess:
      return "Success";
    case TransportResult::kTimeout:
      return "Timed out";
    case TransportResult::kClosed:
      return "Transport closed";
    case TransportResult::kError:
      return "Transport error";
    default:
      return "Unknown transport result";
  }
}

/**
 * ITransport - Duplex binary message channel
 *
 * Message boundaries are preserved: one Send() is delivered as exactly one
 * Receive() frame on the other side.
 *
 * Threading contract:
 * - Send() may be called from several threads; frames never interleave
 * - Receive() is called from one thread at a time
 * - Close() may be called from any thread and wakes a blocked Receive()
 */
class ITransport {
 public:
  virtual ~ITransport() = default;

  /**
   * Send one binary message
   * @param data Message bytes
   * @param size Number of bytes
   * @return kSuccess, kClosed or kError
   */
  virtual TransportResult Send(const uint8_t* data, std::size_t size) = 0;

  TransportResult Send(const std::vector<uint8_t>& message) {
    return Send(message.data(), message.size());
  }

  /**
   * Receive one binary message
   * @param message Output buffer (replaced)
   * @param timeout_ms Maximum time to wait in milliseconds (0 = infinite)
   * @return kSuccess, kTimeout, kClosed or kError
   */
  virtual TransportResult Receive(std::vector<uint8_t>& message,
                                  uint32_t timeout_ms = 0) = 0;

  /**
   * Close the channel; further operations return kClosed
   */
  virtual void Close() = 0;

  /**
   * Check if the channel is open
   */
  virtual bool IsOpen() const = 0;

  /**
   * Get the last error message
   * @return Error description, empty if none
   */
  virtual std::string GetLastError() const = 0;
};

}  // namespace hal
}  // namespace duplex

#endif  // DUPLEX_HAL_ITRANSPORT_HPP_
