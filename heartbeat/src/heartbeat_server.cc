// Copyright (c) 2025 <Your Name>
/**
 * @file heartbeat_server.cc
 * @brief Heartbeat responder implementation (TCP/IPv4, optional TLS).
 */
#include "heartbeat/heartbeat_server.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "heartbeat/conn.hpp"
#include "heartbeat/platform/default_time_source.hpp"
#include "heartbeat/platform/socket_interface.hpp"
#include "heartbeat/tls_context.hpp"
#include "internal/connection_tracker.hpp"

namespace heartbeat {

namespace {

class StatsTracker {
 public:
  void IncConnectionsAccepted() {
    connections_accepted_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRequestsReceived() {
    requests_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncResponsesSent() {
    responses_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncHandshakeFailures() {
    handshake_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncUnknownMethods() {
    unknown_methods_.fetch_add(1, std::memory_order_relaxed);
  }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ServerStats Snapshot(uint64_t active_connections) const {
    ServerStats stats;
    stats.connections_accepted =
        connections_accepted_.load(std::memory_order_relaxed);
    stats.active_connections = active_connections;
    stats.requests_received =
        requests_received_.load(std::memory_order_relaxed);
    stats.responses_sent = responses_sent_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    stats.handshake_failures =
        handshake_failures_.load(std::memory_order_relaxed);
    stats.unknown_methods = unknown_methods_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> connections_accepted_{0};
  std::atomic<uint64_t> requests_received_{0};
  std::atomic<uint64_t> responses_sent_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> handshake_failures_{0};
  std::atomic<uint64_t> unknown_methods_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

}  // namespace

class HeartbeatServer::Impl {
 public:
  Impl() = default;
  ~Impl() { Stop(); }

  bool Start(uint16_t port, TimeSource* time_source, const Options& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;

    time_source_ =
        time_source ? time_source : &platform::GetDefaultTimeSource();
    log_callback_ = options.LogSink();
    on_ping_ = options.OnPing();
    handshake_timeout_ms_ = options.HandshakeTimeoutMs();

    tls_.reset();
    if (options.UseTls()) {
      std::string err;
      tls_ = TlsContext::Create(TlsContext::Role::kServer, options.Tls(), &err);
      if (!tls_) {
        RecordError("TLS setup failed: " + err);
        return false;
      }
    }

    if (!CreateListener(port, options.Backlog())) {
      return false;
    }
    port_.store(listener_->LocalEndpoint().port);

    if (log_callback_) {
      std::ostringstream oss;
      oss << "[HeartbeatServer] listening on port " << port_.load() << " ("
          << options << ")";
      log_callback_(oss.str());
    }

    running_.store(true);
    thread_ = std::thread([this]() { AcceptLoop(); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
      thread_.join();
    }
    if (listener_) {
      listener_->Close();
      listener_.reset();
    }
    connections_.CloseAll();
    port_.store(0);
  }

  uint16_t Port() const { return port_.load(); }

  ServerStats GetStats() const {
    return stats_.Snapshot(connections_.ActiveCount());
  }

 private:
  /** Creates the TCP listener bound to port. */
  bool CreateListener(uint16_t port, int backlog) {
    listener_ = platform::CreatePlatformSocket();
    if (!listener_->Initialize()) {
      RecordError("Socket initialization failed: " +
                  listener_->GetLastError());
      listener_.reset();
      return false;
    }
    if (!listener_->Bind(port) || !listener_->Listen(backlog)) {
      RecordError("Socket bind/listen failed: " + listener_->GetLastError());
      listener_->Close();
      listener_.reset();
      return false;
    }
    return true;
  }

  /**
   * Accept loop: hands each connection to its own worker. TLS handshakes
   * run on the worker so a slow client cannot hold up other accepts.
   */
  void AcceptLoop() {
    while (running_.load()) {
      connections_.PruneFinished();
      if (!listener_->WaitReadable(/*timeout_us=*/200000)) continue;
      std::unique_ptr<platform::ISocket> sock = listener_->Accept();
      if (!sock) {
        RecordError("Accept failed: " + listener_->GetLastError());
        continue;
      }
      if (!tls_) {
        stats_.IncConnectionsAccepted();
        std::shared_ptr<Conn> conn = NewPlainConn(std::move(sock));
        connections_.Add(conn, [this](internal::ConnectionTracker::Entry* e) {
          Serve(e->conn.get());
          e->done.store(true);
        });
        continue;
      }
      connections_.Add(nullptr, [this, pending = std::move(sock)](
                                    internal::ConnectionTracker::Entry*
                                        e) mutable {
        std::shared_ptr<Conn> conn = AcceptTls(std::move(pending));
        if (conn && internal::ConnectionTracker::Attach(e, conn)) {
          stats_.IncConnectionsAccepted();
          Serve(conn.get());
        }
        e->done.store(true);
      });
    }
  }

  /** Runs the server side of the TLS handshake. */
  std::shared_ptr<Conn> AcceptTls(std::unique_ptr<platform::ISocket> sock) {
    std::string err;
    const std::string peer = sock->RemoteEndpoint().ToString();
    std::shared_ptr<Conn> conn =
        tls_->Handshake(std::move(sock), "", handshake_timeout_ms_, &err);
    if (!conn) {
      stats_.IncHandshakeFailures();
      if (running_.load()) {
        RecordError("TLS handshake with " + peer + " failed: " + err);
      }
    }
    return conn;
  }

  /** Reads requests from one connection until EOF or Stop(). */
  void Serve(Conn* conn) {
    const std::string peer = conn->RemoteEndpoint().ToString();
    while (running_.load()) {
      Frame req;
      std::string err;
      if (!ReadFrame(conn, &req, &err)) {
        if (running_.load() && !conn->IsClosed() &&
            err != "Connection closed") {
          stats_.IncRecvErrors();
          RecordError("Receive from " + peer + " failed: " + err);
        }
        break;
      }
      if (req.kind != Frame::Kind::kRequest) {
        stats_.IncRecvErrors();
        RecordError("Unexpected response frame from " + peer);
        break;
      }
      stats_.IncRequestsReceived();

      Frame resp = HandleRequest(req);
      if (!WriteFrame(conn, resp, &err)) {
        stats_.IncSendErrors();
        RecordError("Send to " + peer + " failed: " + err);
        break;
      }
      stats_.IncResponsesSent();
    }
    conn->Close();
  }

  /** Dispatches one request and builds its response frame. */
  Frame HandleRequest(const Frame& req) {
    Frame resp;
    resp.kind = Frame::Kind::kResponse;
    resp.seq = req.seq;

    if (req.name != kPingMethod) {
      stats_.IncUnknownMethods();
      resp.name = "rpc: can't find method " + req.name;
      return resp;
    }

    PingRequest ping;
    if (!PingRequest::Parse(req.body, &ping)) {
      stats_.IncRecvErrors();
      resp.name = "malformed PingRequest";
      return resp;
    }
    if (on_ping_) on_ping_(ping);

    PingResponse pong;
    pong.server_time = time_source_->Now().ToNanos();
    resp.body = PingResponse::Serialize(pong);
    return resp;
  }

  void RecordError(const std::string& msg);

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};
  std::unique_ptr<platform::ISocket> listener_;
  std::shared_ptr<TlsContext> tls_;
  std::mutex start_stop_mtx_;

  TimeSource* time_source_{nullptr};
  int handshake_timeout_ms_{Options::kDefaultHandshakeTimeoutMs};
  Options::PingCallback on_ping_;
  Options::LogCallback log_callback_;
  StatsTracker stats_;
  internal::ConnectionTracker connections_;
};

void HeartbeatServer::Impl::RecordError(const std::string& msg) {
  if (log_callback_) {
    log_callback_("[HeartbeatServer] " + msg);
  }
  stats_.SetLastError(msg);
}

HeartbeatServer::HeartbeatServer() : impl_(new Impl) {}
HeartbeatServer::~HeartbeatServer() = default;

bool HeartbeatServer::Start(uint16_t port, TimeSource* time_source,
                            const Options& options) {
  return impl_->Start(port, time_source, options);
}
void HeartbeatServer::Stop() { impl_->Stop(); }
uint16_t HeartbeatServer::Port() const { return impl_->Port(); }
ServerStats HeartbeatServer::GetStats() const { return impl_->GetStats(); }

}  // namespace heartbeat
