// Copyright (c) 2025 <Your Name>
#include "internal/rpc_conn.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "heartbeat/heartbeat_types.hpp"

namespace rpcclient {
namespace internal {

bool Call::WaitFor(std::chrono::nanoseconds timeout) const {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, timeout, [this]() { return done_; });
}

void Call::Wait() const {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this]() { return done_; });
}

bool Call::Done() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return done_;
}

bool Call::Ok() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return done_ && error_.empty();
}

std::string Call::Error() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return error_;
}

std::vector<uint8_t> Call::Reply() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return reply_;
}

void Call::Complete(const std::string& error, std::vector<uint8_t> reply) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (done_) return;
    done_ = true;
    error_ = error;
    reply_ = std::move(reply);
  }
  cv_.notify_all();
}

RpcConn::RpcConn(std::unique_ptr<heartbeat::Conn> conn,
                 LogCallback log_callback)
    : conn_(std::move(conn)), log_callback_(std::move(log_callback)) {
  recv_thread_ = std::thread(&RpcConn::ReceiveLoop, this);
}

RpcConn::~RpcConn() { Close(); }

std::shared_ptr<Call> RpcConn::Go(const std::string& method,
                                  std::vector<uint8_t> body) {
  auto call = std::make_shared<Call>();
  heartbeat::Frame req;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shutdown_) {
      call->Complete(shutdown_error_, {});
      return call;
    }
    req.seq = ++seq_;
    pending_[req.seq] = call;
  }
  req.kind = heartbeat::Frame::Kind::kRequest;
  req.name = method;
  req.body = std::move(body);

  std::string err;
  if (!heartbeat::WriteFrame(conn_.get(), req, &err)) {
    std::shared_ptr<Call> failed;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = pending_.find(req.seq);
      if (it != pending_.end()) {
        failed = it->second;
        pending_.erase(it);
      }
    }
    // The receive loop may already have failed it during shutdown.
    if (failed) failed->Complete(err.empty() ? kErrShutdown : err, {});
  }
  return call;
}

void RpcConn::Close() {
  {
    std::lock_guard<std::mutex> lk(close_mtx_);
    if (closed_) return;
    closed_ = true;
  }
  conn_->Close();
  if (recv_thread_.joinable()) {
    recv_thread_.join();
  }
  Terminate(kErrShutdown);
}

bool RpcConn::IsShutdown() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return shutdown_;
}

heartbeat::platform::Endpoint RpcConn::LocalEndpoint() const {
  return conn_->LocalEndpoint();
}

heartbeat::platform::Endpoint RpcConn::RemoteEndpoint() const {
  return conn_->RemoteEndpoint();
}

void RpcConn::ReceiveLoop() {
  for (;;) {
    heartbeat::Frame resp;
    std::string err;
    if (!heartbeat::ReadFrame(conn_.get(), &resp, &err)) {
      if (!conn_->IsClosed() && err != "Connection closed") {
        LogError("receive failed: " + err);
      }
      Terminate(conn_->IsClosed() || err.empty() ? kErrShutdown : err);
      return;
    }
    if (resp.kind != heartbeat::Frame::Kind::kResponse) {
      LogError("unexpected request frame from server");
      Terminate("protocol error: unexpected request frame");
      conn_->Close();
      return;
    }

    std::shared_ptr<Call> call;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = pending_.find(resp.seq);
      if (it != pending_.end()) {
        call = it->second;
        pending_.erase(it);
      }
    }
    if (!call) {
      LogError("response for unknown call seq=" + std::to_string(resp.seq));
      continue;
    }
    call->Complete(resp.name, std::move(resp.body));
  }
}

void RpcConn::Terminate(const std::string& error) {
  std::map<uint64_t, std::shared_ptr<Call>> pending;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!shutdown_) {
      shutdown_ = true;
      shutdown_error_ = error;
    }
    pending.swap(pending_);
  }
  for (auto& kv : pending) {
    kv.second->Complete(error, {});
  }
}

void RpcConn::LogError(const std::string& msg) {
  if (log_callback_) {
    log_callback_("[RpcConn " + conn_->RemoteEndpoint().ToString() + "] " +
                  msg);
  }
}

}  // namespace internal
}  // namespace rpcclient
