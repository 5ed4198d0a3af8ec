// Copyright (c) 2025 <Your Name>
/**
 * @file client.cc
 * @brief Client dial-retry state machine and heartbeat loop.
 */
#include "rpcclient/client.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "heartbeat/heartbeat_types.hpp"
#include "internal/rpc_conn.hpp"
#include "rpcclient/client_registry.hpp"
#include "rpcclient/dialer.hpp"
#include "rpcclient/offset_estimator.hpp"
#include "rpcclient/offset_monitor.hpp"

namespace rpcclient {

std::ostream& operator<<(std::ostream& os, Client::State s) {
  switch (s) {
    case Client::State::kDialing:
      return os << "Dialing";
    case Client::State::kVerifying:
      return os << "Verifying";
    case Client::State::kReady:
      return os << "Ready";
    case Client::State::kClosed:
      return os << "Closed";
  }
  return os << "Unknown";
}

Client::Client(std::string addr, const RetryOptions& retry,
               ClientRegistry* registry, heartbeat::TimeSource* clock,
               OffsetMonitor* monitor, std::shared_ptr<Dialer> dialer,
               const Options& options)
    : addr_(std::move(addr)),
      retry_(retry),
      registry_(registry),
      clock_(clock),
      monitor_(monitor),
      dialer_(std::move(dialer)),
      interval_(options.HeartbeatInterval()),
      log_callback_(options.LogSink()) {
  ready_future_ = ready_promise_.get_future().share();
  closed_future_ = closed_promise_.get_future().share();
}

Client::~Client() { JoinTask(); }

std::string Client::LocalAddr() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return local_addr_;
}

bool Client::IsConnected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return rpc_ != nullptr && !closed_;
}

bool Client::IsHealthy() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return healthy_;
}

bool Client::IsClosed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

Client::State Client::GetState() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

heartbeat::RemoteOffset Client::RemoteOffset() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return offset_;
}

bool Client::WaitReady(std::chrono::milliseconds timeout) const {
  return ready_future_.wait_for(timeout) == std::future_status::ready;
}

bool Client::WaitClosed(std::chrono::milliseconds timeout) const {
  return closed_future_.wait_for(timeout) == std::future_status::ready;
}

void Client::Close() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_) return;
  }
  // The registry marks us closed under both locks; only the winner of a
  // concurrent Close() gets true here.
  if (!registry_->Remove(this)) return;
  ReleaseTransport();
}

bool Client::MarkClosedLocked() {
  if (closed_) return false;
  closed_ = true;
  healthy_ = false;
  state_ = State::kClosed;
  closed_promise_.set_value();
  return true;
}

void Client::ReleaseTransport() {
  std::shared_ptr<internal::RpcConn> rpc;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rpc = std::move(rpc_);
    rpc_.reset();
  }
  wake_cv_.notify_all();
  if (rpc) rpc->Close();
  Log("closed");
}

void Client::Start() { task_ = std::thread(&Client::Run, this); }

bool Client::TaskDone() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return task_done_;
}

void Client::JoinTask() {
  if (!task_.joinable()) return;
  if (task_.get_id() == std::this_thread::get_id()) {
    task_.detach();
    return;
  }
  task_.join();
}

void Client::Run() {
  RetryOptions retry = retry_;
  if (retry.tag.empty()) retry.tag = "connection attempt";

  RetryResult result = RetryWithBackoff(
      retry, [this](std::string* err) { return Connect(err); },
      [this](std::chrono::milliseconds d) { return WaitUnlessClosed(d); },
      [this](const std::string& msg) { Log(msg); });

  if (result.success) {
    if (!IsClosed()) HeartbeatLoop();
  } else if (!result.stopped) {
    Log("failed to connect: " + result.error);
    Close();
  }

  std::lock_guard<std::mutex> lk(mtx_);
  task_done_ = true;
}

RetryStatus Client::Connect(std::string* err) {
  if (IsClosed()) return RetryStatus::kBreak;

  std::string dial_err;
  std::unique_ptr<heartbeat::Conn> conn = dialer_->Dial(addr_, &dial_err);
  if (!conn) {
    *err = dial_err.empty() ? "dial failed" : dial_err;
    return RetryStatus::kContinue;
  }

  auto rpc =
      std::make_shared<internal::RpcConn>(std::move(conn), log_callback_);
  {
    std::unique_lock<std::mutex> lk(mtx_);
    if (closed_) {
      lk.unlock();
      rpc->Close();
      return RetryStatus::kBreak;
    }
    rpc_ = rpc;
    local_addr_ = rpc->LocalEndpoint().ToString();
    state_ = State::kVerifying;
  }

  std::string hb_err;
  if (!Heartbeat(&hb_err)) {
    DropTransport(rpc);
    if (IsClosed()) return RetryStatus::kBreak;
    *err = "heartbeat failed: " + hb_err;
    return RetryStatus::kContinue;
  }

  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_) return RetryStatus::kBreak;
    state_ = State::kReady;
    if (!ready_fired_) {
      ready_fired_ = true;
      ready_promise_.set_value();
    }
  }
  Log("connected");
  return RetryStatus::kBreak;
}

void Client::DropTransport(const std::shared_ptr<internal::RpcConn>& rpc) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (rpc_ == rpc) {
      rpc_.reset();
      healthy_ = false;
      if (!closed_) state_ = State::kDialing;
    }
  }
  rpc->Close();
}

void Client::HeartbeatLoop() {
  Log("starting heartbeat");
  while (WaitUnlessClosed(interval_)) {
    std::string err;
    if (!Heartbeat(&err)) {
      if (!IsClosed()) Log("heartbeat failed: " + err + "; recycling...");
      Close();
      return;
    }
  }
}

bool Client::Heartbeat(std::string* err) {
  std::shared_ptr<internal::RpcConn> rpc;
  heartbeat::PingRequest req;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rpc = rpc_;
    req.offset = offset_;
    req.addr = local_addr_;
  }
  if (!rpc) {
    *err = internal::kErrShutdown;
    return false;
  }

  const std::chrono::milliseconds timeout = 2 * interval_;
  const int64_t send_time = clock_->NowNanos();
  std::shared_ptr<internal::Call> call = rpc->Go(
      heartbeat::kPingMethod, heartbeat::PingRequest::Serialize(req));

  if (!call->WaitFor(timeout)) {
    heartbeat::RemoteOffset inf = heartbeat::InfiniteOffset();
    inf.measured_at = clock_->NowNanos();
    bool closed = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      healthy_ = false;
      offset_ = inf;
      closed = closed_;
    }
    if (!closed && monitor_) monitor_->UpdateOffset(addr_, inf);
    std::ostringstream oss;
    oss << "unhealthy after " << interval_.count() << "ms";
    Log(oss.str());

    // No cancellation: the outcome of the late call decides the round.
    call->Wait();
    if (!call->Ok()) {
      *err = call->Error();
      return false;
    }
    return true;
  }

  // A reply inside the timeout is a timing sample even when the call
  // failed; an error reply carries no server time and counts as zero.
  const int64_t receive_time = clock_->NowNanos();
  heartbeat::PingResponse resp;
  std::string call_err;
  if (!call->Ok()) {
    call_err = call->Error();
  } else if (!heartbeat::PingResponse::Parse(call->Reply(), &resp)) {
    call_err = "malformed PingResponse";
  }

  const heartbeat::RemoteOffset measured =
      EstimateRemoteOffset(send_time, receive_time, resp.server_time);
  bool closed = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    closed = closed_;
    if (!closed) {
      healthy_ = true;
      offset_ = measured;
    }
  }
  if (!closed && monitor_) monitor_->UpdateOffset(addr_, measured);
  if (!call_err.empty()) {
    *err = call_err;
    return false;
  }
  return true;
}

bool Client::WaitUnlessClosed(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mtx_);
  return !wake_cv_.wait_for(lk, d, [this]() { return closed_; });
}

void Client::Log(const std::string& msg) const {
  if (log_callback_) {
    log_callback_("[Client " + addr_ + "] " + msg);
  }
}

}  // namespace rpcclient
