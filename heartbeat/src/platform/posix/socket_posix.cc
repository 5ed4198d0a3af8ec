// Copyright (c) 2025 <Your Name>
/**
 * @file socket_posix.cc
 * @brief POSIX (Linux/macOS) TCP implementation of ISocket interface
 */
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "heartbeat/platform/socket_interface.hpp"
#include "platform/common/socket_utils.hpp"

namespace heartbeat {
namespace platform {

namespace {
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() : sock_(-1) {}
  explicit SocketPosix(int fd) : sock_(fd) {}

  ~SocketPosix() override { Close(); }

  bool Initialize() override {
    sock_ = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock_ < 0) {
      CaptureErrno("socket creation failed");
      return false;
    }
#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(sock_, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    return true;
  }

  bool Bind(uint16_t port) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    int one = 1;
    if (setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
      CaptureErrno("setsockopt(SO_REUSEADDR) failed");
      return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      CaptureErrno("bind failed");
      return false;
    }

    return true;
  }

  bool Listen(int backlog) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }
    if (listen(sock_, backlog) < 0) {
      CaptureErrno("listen failed");
      return false;
    }
    return true;
  }

  std::unique_ptr<ISocket> Accept() override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return nullptr;
    }
    int fd = accept(sock_, nullptr, nullptr);
    if (fd < 0) {
      CaptureErrno("accept failed");
      return nullptr;
    }
    SetNoDelay(fd);
    return std::unique_ptr<ISocket>(new SocketPosix(fd));
  }

  bool Connect(const Endpoint& to, int timeout_ms) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    std::string resolve_err;
    if (!EndpointToSockaddr(to, &addr, &resolve_err)) {
      SetError(resolve_err);
      return false;
    }

    if (!SetNonBlocking(true)) return false;
    int rc = connect(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
      CaptureErrno("connect to " + to.ToString() + " failed");
      return false;
    }
    if (rc < 0) {
      if (!WaitWritable(static_cast<int64_t>(timeout_ms) * 1000)) {
        if (GetLastError().empty()) {
          SetError("connect to " + to.ToString() + " timed out");
        }
        return false;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (getsockopt(sock_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        CaptureErrno("getsockopt(SO_ERROR) failed");
        return false;
      }
      if (so_error != 0) {
        errno = so_error;
        CaptureErrno("connect to " + to.ToString() + " failed");
        return false;
      }
    }
    if (!SetNonBlocking(false)) return false;
    SetNoDelay(sock_);
    return true;
  }

  bool WaitReadable(int64_t timeout_us) override {
    return Poll(POLLIN, timeout_us);
  }

  bool WaitWritable(int64_t timeout_us) override {
    return Poll(POLLOUT, timeout_us);
  }

  bool Receive(std::vector<uint8_t>* data, size_t max_size) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    data->resize(max_size);
    ssize_t n = recv(sock_, data->data(), max_size, 0);

    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        data->clear();
        return true;
      }
      CaptureErrno("recv failed");
      return false;
    }

    if (n == 0) {
      SetError("Connection closed");
      return false;
    }

    data->resize(static_cast<size_t>(n));
    return true;
  }

  bool SendAll(const uint8_t* data, size_t size) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    size_t off = 0;
    while (off < size) {
      ssize_t sent = send(sock_, data + off, size - off, kSendFlags);
      if (sent < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          if (!WaitWritable(1000000)) return false;
          continue;
        }
        CaptureErrno("send failed");
        return false;
      }
      off += static_cast<size_t>(sent);
    }
    return true;
  }

  bool SetNonBlocking(bool enabled) override {
    int flags = fcntl(sock_, F_GETFL, 0);
    if (flags < 0) {
      CaptureErrno("fcntl(F_GETFL) failed");
      return false;
    }
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(sock_, F_SETFL, flags) < 0) {
      CaptureErrno("fcntl(F_SETFL) failed");
      return false;
    }
    return true;
  }

  void Shutdown() override {
    if (sock_ >= 0) {
      shutdown(sock_, SHUT_RDWR);
    }
  }

  void Close() override {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
  }

  std::string GetLastError() const override {
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
  }

  bool IsValid() const override { return sock_ >= 0; }

  int NativeHandle() const override { return sock_; }

  Endpoint LocalEndpoint() const override {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (sock_ < 0 ||
        getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return Endpoint();
    }
    return SockaddrToEndpoint(addr);
  }

  Endpoint RemoteEndpoint() const override {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (sock_ < 0 ||
        getpeername(sock_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return Endpoint();
    }
    return SockaddrToEndpoint(addr);
  }

 private:
  bool Poll(short events, int64_t timeout_us) {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = events;

    int ready = poll(&pfd, 1, static_cast<int>(timeout_us / 1000));

    if (ready < 0) {
      if (errno != EINTR) CaptureErrno("poll failed");
      return false;
    }

    // Errors and hang-ups count as ready so the next call reports them.
    return ready > 0 && (pfd.revents & (events | POLLERR | POLLHUP));
  }

  static void SetNoDelay(int fd) {
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  }

  void SetError(const std::string& text) {
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = text;
  }

  void CaptureErrno(const std::string& context) {
    int err = errno;
    std::ostringstream oss;
    oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
    SetError(oss.str());
  }

  int sock_;
  mutable std::mutex err_mtx_;
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::unique_ptr<ISocket>(new SocketPosix());
}

}  // namespace platform
}  // namespace heartbeat
