// Copyright (c) 2025 <Your Name>
#include "rpcclient/client_registry.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "heartbeat/platform/default_time_source.hpp"
#include "rpcclient/dialer.hpp"

namespace rpcclient {

ClientRegistry::ClientRegistry(heartbeat::TimeSource* clock,
                               OffsetMonitor* monitor, const Options& options)
    : clock_(clock ? clock : &heartbeat::platform::GetDefaultTimeSource()),
      monitor_(monitor),
      options_(options),
      dialer_(options.Transport()) {
  if (!dialer_) {
    if (options_.UseTls()) {
      dialer_ = std::make_shared<TcpDialer>(options_.ConnectTimeoutMs(),
                                            options_.Tls());
    } else {
      dialer_ = std::make_shared<TcpDialer>(options_.ConnectTimeoutMs());
    }
  }
  std::ostringstream oss;
  oss << "created (" << options_ << ")";
  Log(oss.str());
}

ClientRegistry::~ClientRegistry() {
  CloseAll();
  std::vector<std::shared_ptr<Client>> all;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    all.swap(retired_);
    for (auto& kv : clients_) all.push_back(kv.second);
    clients_.clear();
  }
  for (auto& c : all) c->JoinTask();
}

std::shared_ptr<Client> ClientRegistry::GetOrCreate(const std::string& addr,
                                                    const RetryOptions* retry) {
  std::vector<std::shared_ptr<Client>> reaped;
  std::shared_ptr<Client> created;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = clients_.find(addr);
    if (it != clients_.end()) return it->second;

    created.reset(new Client(addr, retry ? *retry : options_.Retry(), this,
                             clock_, monitor_, dialer_, options_));
    clients_[addr] = created;
    ReapRetiredLocked(&reaped);
  }
  // Dialing starts outside the lock.
  created->Start();
  return created;
}

std::shared_ptr<Client> ClientRegistry::Lookup(const std::string& addr) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = clients_.find(addr);
  return it == clients_.end() ? nullptr : it->second;
}

size_t ClientRegistry::Size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return clients_.size();
}

void ClientRegistry::CloseAll() {
  std::vector<std::shared_ptr<Client>> live;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : clients_) live.push_back(kv.second);
  }
  for (auto& c : live) c->Close();
}

bool ClientRegistry::Remove(Client* c) {
  std::vector<std::shared_ptr<Client>> reaped;  // released after the lock
  std::lock_guard<std::mutex> lk(mtx_);
  {
    std::lock_guard<std::mutex> clk(c->mtx_);
    if (!c->MarkClosedLocked()) return false;
  }
  auto it = clients_.find(c->Addr());
  if (it != clients_.end() && it->second.get() == c) {
    retired_.push_back(std::move(it->second));
    clients_.erase(it);
  }
  ReapRetiredLocked(&reaped);
  return true;
}

void ClientRegistry::ReapRetiredLocked(
    std::vector<std::shared_ptr<Client>>* reaped) {
  auto it = std::stable_partition(
      retired_.begin(), retired_.end(),
      [](const std::shared_ptr<Client>& c) { return !c->TaskDone(); });
  std::move(it, retired_.end(), std::back_inserter(*reaped));
  retired_.erase(it, retired_.end());
}

void ClientRegistry::Log(const std::string& msg) const {
  if (options_.LogSink()) {
    options_.LogSink()("[ClientRegistry] " + msg);
  }
}

}  // namespace rpcclient
