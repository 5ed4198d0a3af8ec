// Copyright (c) 2025 <Your Name>
/**
 * @file conn.cc
 * @brief Plain TCP connection and the dial helper.
 */
#include "heartbeat/conn.hpp"

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "heartbeat/tls_context.hpp"

namespace heartbeat {

namespace {

// Poll granularity for readers so Close() is observed promptly.
constexpr int64_t kReadPollUs = 200000;

class PlainConn : public Conn {
 public:
  explicit PlainConn(std::unique_ptr<platform::ISocket> socket)
      : socket_(std::move(socket)),
        local_(socket_->LocalEndpoint()),
        remote_(socket_->RemoteEndpoint()) {}

  ~PlainConn() override {
    Close();
    socket_->Close();
  }

  bool Write(const std::vector<uint8_t>& data) override {
    std::lock_guard<std::mutex> lk(write_mtx_);
    if (closed_.load()) {
      SetError("use of closed connection");
      return false;
    }
    if (!socket_->SendAll(data.data(), data.size())) {
      SetError(socket_->GetLastError());
      return false;
    }
    return true;
  }

  bool ReadFull(uint8_t* buf, size_t n) override {
    size_t got = 0;
    std::vector<uint8_t> chunk;
    while (got < n) {
      if (closed_.load()) {
        SetError("use of closed connection");
        return false;
      }
      if (!socket_->WaitReadable(kReadPollUs)) continue;
      if (!socket_->Receive(&chunk, n - got)) {
        SetError(closed_.load() ? "use of closed connection"
                                : socket_->GetLastError());
        return false;
      }
      std::memcpy(buf + got, chunk.data(), chunk.size());
      got += chunk.size();
    }
    return true;
  }

  void Close() override {
    if (!closed_.exchange(true)) {
      socket_->Shutdown();
    }
  }

  bool IsClosed() const override { return closed_.load(); }
  platform::Endpoint LocalEndpoint() const override { return local_; }
  platform::Endpoint RemoteEndpoint() const override { return remote_; }

  std::string GetLastError() const override {
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
  }

 private:
  void SetError(const std::string& text) {
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = text;
  }

  std::unique_ptr<platform::ISocket> socket_;
  platform::Endpoint local_;
  platform::Endpoint remote_;
  std::atomic<bool> closed_{false};
  std::mutex write_mtx_;
  mutable std::mutex err_mtx_;
  std::string last_error_;
};

}  // namespace

std::unique_ptr<Conn> NewPlainConn(std::unique_ptr<platform::ISocket> socket) {
  return std::unique_ptr<Conn>(new PlainConn(std::move(socket)));
}

std::unique_ptr<Conn> Dial(const platform::Endpoint& to, const TlsContext* tls,
                           int timeout_ms, std::string* err) {
  auto socket = platform::CreatePlatformSocket();
  if (!socket->Initialize()) {
    if (err) *err = "socket initialization failed: " + socket->GetLastError();
    return nullptr;
  }
  if (!socket->Connect(to, timeout_ms)) {
    if (err) *err = socket->GetLastError();
    return nullptr;
  }
  if (tls == nullptr) {
    return NewPlainConn(std::move(socket));
  }
  std::string hs_err;
  auto conn = tls->Handshake(std::move(socket), to.address, timeout_ms, &hs_err);
  if (!conn && err) {
    *err = "TLS handshake with " + to.ToString() + " failed: " + hs_err;
  }
  return conn;
}

}  // namespace heartbeat
