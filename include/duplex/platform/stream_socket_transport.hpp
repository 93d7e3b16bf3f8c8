#ifndef DUPLEX_PLATFORM_STREAM_SOCKET_TRANSPORT_HPP_
#define DUPLEX_PLATFORM_STREAM_SOCKET_TRANSPORT_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "duplex/hal/itransport.hpp"
#include "duplex/platform/linux_eventfd.hpp"

namespace duplex {
namespace platform {

/**
 * StreamSocketTransport - Message channel over a connected stream socket
 *
 * Each message travels as [u32 big-endian length][bytes]. The transport
 * owns the descriptor it is given. Close() shuts the socket down and
 * raises an eventfd so that a Receive() blocked in another thread returns
 * kClosed immediately; the descriptor itself is released by the destructor.
 */
class StreamSocketTransport : public hal::ITransport {
 public:
  static constexpr uint32_t kMaxMessageSize = 16 * 1024 * 1024;

  /**
   * Adopt a connected stream socket
   * @param fd Socket descriptor (ownership transferred)
   */
  explicit StreamSocketTransport(int fd);

  ~StreamSocketTransport() override;

  // Non-copyable, non-movable
  StreamSocketTransport(const StreamSocketTransport&) = delete;
  StreamSocketTransport& operator=(const StreamSocketTransport&) = delete;
  StreamSocketTransport(StreamSocketTransport&&) = delete;
  StreamSocketTransport& operator=(StreamSocketTransport&&) = delete;

  /**
   * Create two transports connected to each other (AF_UNIX socketpair)
   * @param first Output: one end
   * @param second Output: the other end
   * @return true on success
   */
  static bool CreatePair(std::unique_ptr<StreamSocketTransport>& first,
                         std::unique_ptr<StreamSocketTransport>& second);

  using hal::ITransport::Send;

  hal::TransportResult Send(const uint8_t* data, std::size_t size) override;

  hal::TransportResult Receive(std::vector<uint8_t>& message,
                               uint32_t timeout_ms = 0) override;

  void Close() override;

  bool IsOpen() const override;

  std::string GetLastError() const override;

 private:
  /**
   * Wait until the socket is readable
   * @param timeout_ms Poll timeout (-1 = infinite)
   */
  hal::TransportResult WaitReadable(int timeout_ms);

  hal::TransportResult ReadExact(uint8_t* out, std::size_t size);
  hal::TransportResult WriteAll(const uint8_t* data, std::size_t size);

  void SetError(const std::string& error);

  int fd_;
  std::atomic<bool> open_{false};
  LinuxEventFdSignal close_signal_;

  std::mutex send_mutex_;
  std::mutex receive_mutex_;

  mutable std::mutex error_mutex_;
  std::string last_error_;
};

}  // namespace platform
}  // namespace duplex

#endif  // DUPLEX_PLATFORM_STREAM_SOCKET_TRANSPORT_HPP_
