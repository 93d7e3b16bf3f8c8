#ifndef DUPLEX_PLATFORM_LINUX_EVENTFD_HPP_
#define DUPLEX_PLATFORM_LINUX_EVENTFD_HPP_

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <string>

#include "duplex/hal/isignal_mechanism.hpp"

namespace duplex {
namespace platform {

/**
 * LinuxEventFdSignal - Linux eventfd-based wakeup signal
 *
 * Features:
 * - Level-triggered until Reset(): stays readable once notified, so every
 *   poller sharing the descriptor observes it
 * - Non-blocking descriptor, safe to poll alongside sockets
 */
class LinuxEventFdSignal : public hal::ISignalMechanism {
 public:
  LinuxEventFdSignal() : fd_(-1), valid_(false) {}

  ~LinuxEventFdSignal() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  LinuxEventFdSignal(const LinuxEventFdSignal&) = delete;
  LinuxEventFdSignal& operator=(const LinuxEventFdSignal&) = delete;

  bool Create() {
    fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd_ < 0) {
      last_error_ = strerror(errno);
      return false;
    }

    valid_ = true;
    return true;
  }

  bool Notify() override {
    if (!valid_) {
      return false;
    }

    uint64_t value = 1;
    ssize_t written = ::write(fd_, &value, sizeof(value));
    if (written != sizeof(value)) {
      last_error_ = strerror(errno);
      return false;
    }
    return true;
  }

  bool Wait(uint32_t timeout_ms) override {
    if (!valid_) {
      return false;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int timeout = timeout_ms == 0 ? -1 : static_cast<int>(timeout_ms);
    int ret = ::poll(&pfd, 1, timeout);
    return ret > 0 && (pfd.revents & POLLIN) != 0;
  }

  bool Reset() override {
    if (!valid_) {
      return false;
    }

    uint64_t value;
    while (::read(fd_, &value, sizeof(value)) == sizeof(value)) {
      // Drain all pending values
    }
    return true;
  }

  int GetNativeHandle() const override {
    return fd_;
  }

  bool IsValid() const override {
    return valid_ && fd_ >= 0;
  }

  const char* GetLastError() const override {
    return last_error_.c_str();
  }

 private:
  int fd_;
  bool valid_;
  std::string last_error_;
};

}  // namespace platform
}  // namespace duplex

#endif  // DUPLEX_PLATFORM_LINUX_EVENTFD_HPP_
