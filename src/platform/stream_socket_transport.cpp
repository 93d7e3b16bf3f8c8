#include "duplex/platform/stream_socket_transport.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace duplex {
namespace platform {

namespace {

void WriteU32Be(uint8_t out[4], uint32_t v) {
  out[0] = (v >> 24) & 0xFF;
  out[1] = (v >> 16) & 0xFF;
  out[2] = (v >> 8) & 0xFF;
  out[3] = v & 0xFF;
}

uint32_t ReadU32Be(const uint8_t in[4]) {
  return (static_cast<uint32_t>(in[0]) << 24) |
         (static_cast<uint32_t>(in[1]) << 16) |
         (static_cast<uint32_t>(in[2]) << 8) |
         static_cast<uint32_t>(in[3]);
}

}  // namespace

StreamSocketTransport::StreamSocketTransport(int fd) : fd_(fd) {
  if (fd_ < 0) {
    SetError("invalid socket descriptor");
    return;
  }
  if (!close_signal_.Create()) {
    SetError(std::string("eventfd failed: ") + close_signal_.GetLastError());
    return;
  }
  open_.store(true);
}

StreamSocketTransport::~StreamSocketTransport() {
  Close();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool StreamSocketTransport::CreatePair(
    std::unique_ptr<StreamSocketTransport>& first,
    std::unique_ptr<StreamSocketTransport>& second) {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
    std::cerr << "Failed to create socket pair: " << strerror(errno) << std::endl;
    return false;
  }

  first = std::make_unique<StreamSocketTransport>(fds[0]);
  second = std::make_unique<StreamSocketTransport>(fds[1]);
  return first->IsOpen() && second->IsOpen();
}

hal::TransportResult StreamSocketTransport::Send(const uint8_t* data,
                                                 std::size_t size) {
  if (!open_.load()) {
    return hal::TransportResult::kClosed;
  }
  if (size > kMaxMessageSize) {
    SetError("message too large: " + std::to_string(size) + " bytes");
    return hal::TransportResult::kError;
  }

  uint8_t header[4];
  WriteU32Be(header, static_cast<uint32_t>(size));

  std::lock_guard<std::mutex> lock(send_mutex_);
  hal::TransportResult result = WriteAll(header, sizeof(header));
  if (result != hal::TransportResult::kSuccess) {
    return result;
  }
  if (size == 0) {
    return hal::TransportResult::kSuccess;
  }
  return WriteAll(data, size);
}

hal::TransportResult StreamSocketTransport::Receive(
    std::vector<uint8_t>& message, uint32_t timeout_ms) {
  if (!open_.load()) {
    return hal::TransportResult::kClosed;
  }

  std::lock_guard<std::mutex> lock(receive_mutex_);

  // Only the wait for the first byte is bounded; once a frame has started
  // it is read to the end.
  const int timeout = timeout_ms == 0 ? -1 : static_cast<int>(timeout_ms);
  hal::TransportResult result = WaitReadable(timeout);
  if (result != hal::TransportResult::kSuccess) {
    return result;
  }

  uint8_t header[4];
  result = ReadExact(header, sizeof(header));
  if (result != hal::TransportResult::kSuccess) {
    return result;
  }

  const uint32_t size = ReadU32Be(header);
  if (size > kMaxMessageSize) {
    SetError("incoming message too large: " + std::to_string(size) + " bytes");
    return hal::TransportResult::kError;
  }

  message.resize(size);
  if (size == 0) {
    return hal::TransportResult::kSuccess;
  }
  return ReadExact(message.data(), size);
}

void StreamSocketTransport::Close() {
  if (!open_.exchange(false)) {
    return;
  }
  ::shutdown(fd_, SHUT_RDWR);
  close_signal_.Notify();
}

bool StreamSocketTransport::IsOpen() const {
  return open_.load();
}

std::string StreamSocketTransport::GetLastError() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

hal::TransportResult StreamSocketTransport::WaitReadable(int timeout_ms) {
  struct pollfd pfds[2];
  pfds[0].fd = fd_;
  pfds[0].events = POLLIN;
  pfds[0].revents = 0;
  pfds[1].fd = close_signal_.GetNativeHandle();
  pfds[1].events = POLLIN;
  pfds[1].revents = 0;

  while (true) {
    int ret = ::poll(pfds, 2, timeout_ms);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetError(std::string("poll failed: ") + strerror(errno));
      return hal::TransportResult::kError;
    }
    if (ret == 0) {
      return hal::TransportResult::kTimeout;
    }
    if ((pfds[1].revents & POLLIN) != 0 || !open_.load()) {
      return hal::TransportResult::kClosed;
    }
    // POLLHUP/POLLERR are reported by the following recv()
    return hal::TransportResult::kSuccess;
  }
}

hal::TransportResult StreamSocketTransport::ReadExact(uint8_t* out,
                                                      std::size_t size) {
  std::size_t offset = 0;
  while (offset < size) {
    ssize_t n = ::recv(fd_, out + offset, size - offset, 0);
    if (n > 0) {
      offset += static_cast<std::size_t>(n);
      continue;
    }
    if (n == 0) {
      open_.store(false);
      return hal::TransportResult::kClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (!open_.load()) {
      return hal::TransportResult::kClosed;
    }
    SetError(std::string("recv failed: ") + strerror(errno));
    return hal::TransportResult::kError;
  }
  return hal::TransportResult::kSuccess;
}

hal::TransportResult StreamSocketTransport::WriteAll(const uint8_t* data,
                                                     std::size_t size) {
  std::size_t offset = 0;
  while (offset < size) {
    ssize_t n = ::send(fd_, data + offset, size - offset, MSG_NOSIGNAL);
    if (n > 0) {
      offset += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (!open_.load() || errno == EPIPE || errno == ECONNRESET) {
      return hal::TransportResult::kClosed;
    }
    SetError(std::string("send failed: ") + strerror(errno));
    return hal::TransportResult::kError;
  }
  return hal::TransportResult::kSuccess;
}

void StreamSocketTransport::SetError(const std::string& error) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = error;
}

}  // namespace platform
}  // namespace duplex
