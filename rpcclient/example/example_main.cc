// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Example program that heartbeats a set of peers and prints their
 *        clock offsets.
 *
 * Usage:
 *   rpcclient_example --peer 127.0.0.1:26257 --peer 10.0.0.2:26257 \
 *     --interval 3000 --tls-ca ca.pem --server-name node1
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rpcclient/client_registry.hpp"
#include "rpcclient/offset_monitor.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

std::atomic<bool> g_stop{false};

void SignalHandler(int) { g_stop.store(true); }

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: rpcclient_example --peer HOST:PORT [options]\n"
               "Options:\n"
               "  --peer HOST:PORT     Peer to heartbeat (repeatable)\n"
               "  --interval ms        (default 3000)\n"
               "  --max-attempts n     Dial attempts, 0 = unlimited "
               "(default 0)\n"
               "  --tls-ca PEM         Dial with TLS, trusting this CA\n"
               "  --server-name NAME   Name expected in peer certificates\n"
               "  --insecure           Skip certificate verification\n"
               "  --debug              Enable debug logging\n");
}

const char* StateName(const rpcclient::Client& c) {
  switch (c.GetState()) {
    case rpcclient::Client::State::kDialing:
      return "dialing";
    case rpcclient::Client::State::kVerifying:
      return "verifying";
    case rpcclient::Client::State::kReady:
      return "ready";
    case rpcclient::Client::State::kClosed:
      return "closed";
  }
  return "?";
}
}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> peers;
  int interval_ms = rpcclient::Options::kDefaultHeartbeatIntervalMs;
  rpcclient::RetryOptions retry;
  std::string tls_ca;
  std::string server_name;
  bool insecure = false;
  bool debug = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--peer" && need(1)) {
      peers.push_back(argv[++i]);
    } else if (a == "--interval" && need(1)) {
      interval_ms = std::atoi(argv[++i]);
    } else if (a == "--max-attempts" && need(1)) {
      retry.max_attempts = std::atoi(argv[++i]);
    } else if (a == "--tls-ca" && need(1)) {
      tls_ca = argv[++i];
    } else if (a == "--server-name" && need(1)) {
      server_name = argv[++i];
    } else if (a == "--insecure") {
      insecure = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (peers.empty()) {
    PrintUsage();
    return 2;
  }

  Logger logger(debug);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };

  rpcclient::Options::Builder builder;
  builder.HeartbeatIntervalMs(interval_ms).Retry(retry).LogSink(log_callback);
  if (!tls_ca.empty() || insecure) {
    builder.Tls(heartbeat::TlsConfig::Builder()
                    .CaFile(tls_ca)
                    .ServerName(server_name)
                    .VerifyPeer(!insecure)
                    .Build());
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  rpcclient::RemoteClockMonitor monitor;
  rpcclient::ClientRegistry registry(nullptr, &monitor, builder.Build());

  std::map<std::string, std::shared_ptr<rpcclient::Client>> clients;
  for (const auto& p : peers) clients[p] = registry.GetOrCreate(p);

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    for (auto& kv : clients) {
      // Recycled peers are redialed on the next lookup.
      if (kv.second->IsClosed()) {
        kv.second = registry.GetOrCreate(kv.first);
      }
      heartbeat::RemoteOffset o;
      if (!monitor.GetOffset(kv.first, &o)) {
        std::printf("%-24s %-9s no measurement\n", kv.first.c_str(),
                    StateName(*kv.second));
      } else if (o.IsInfinite()) {
        std::printf("%-24s %-9s offset=unknown (timed out)\n",
                    kv.first.c_str(), StateName(*kv.second));
      } else {
        std::printf("%-24s %-9s offset=%+.3fms error=%.3fms\n",
                    kv.first.c_str(), StateName(*kv.second),
                    static_cast<double>(o.offset) / 1e6,
                    static_cast<double>(o.error) / 1e6);
      }
    }
    std::fflush(stdout);
  }

  registry.CloseAll();
  return 0;
}
