// Copyright (c) 2025 <Your Name>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>

#include "heartbeat/heartbeat_server.hpp"
#include "heartbeat/monotonic_clock.hpp"
#include "heartbeat/remote_offset.hpp"

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

void PrintUsage() {
  std::fprintf(
      stderr,
      "Usage: heartbeat_example [--port N] [--skew-ms MS] "
      "[--tls-cert PEM --tls-key PEM] [--debug]\n"
      "       Commands on stdin: help | now | skew MS | reset | stats | "
      "quit\n");
}
}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 26257;
  int64_t skew_ms = 0;
  std::string tls_cert;
  std::string tls_key;
  bool debug = false;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int n) { return i + n < argc; };
    if (a == "--port" && need(1)) {
      port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (a == "--skew-ms" && need(1)) {
      skew_ms = std::atoll(argv[++i]);
    } else if (a == "--tls-cert" && need(1)) {
      tls_cert = argv[++i];
    } else if (a == "--tls-key" && need(1)) {
      tls_key = argv[++i];
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (tls_cert.empty() != tls_key.empty()) {
    std::fprintf(stderr, "--tls-cert and --tls-key go together\n");
    return 2;
  }

  Logger logger(debug);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };

  heartbeat::MonotonicClock clock;
  if (skew_ms != 0) clock.Skew(skew_ms * 1000000);

  // Peers report our offset as seen by them; show it from our side.
  auto on_ping = [&logger](const heartbeat::PingRequest& req) {
    std::ostringstream oss;
    oss << "ping from " << (req.addr.empty() ? "?" : req.addr)
        << " their view of us: " << heartbeat::ReciprocalOffset(req.offset);
    logger.Log(oss.str());
  };

  heartbeat::Options::Builder builder;
  builder.LogSink(log_callback).OnPing(on_ping);
  if (!tls_cert.empty()) {
    builder.Tls(heartbeat::TlsConfig::Builder()
                    .CertFile(tls_cert)
                    .KeyFile(tls_key)
                    .Build());
  }
  const heartbeat::Options opts = builder.Build();

  heartbeat::HeartbeatServer server;
  if (!server.Start(port, &clock, opts)) {
    std::fprintf(stderr, "failed to start heartbeat server: %s\n",
                 server.GetStats().last_error.c_str());
    return 1;
  }
  std::printf("heartbeat server running on TCP %u%s\n", server.Port(),
              tls_cert.empty() ? "" : " (TLS)");
  std::printf("stdin commands: help | now | skew MS | reset | stats | quit\n");

  char line[256];
  while (std::fgets(line, sizeof(line), stdin)) {
    size_t len = std::strlen(line);
    while (len && (line[len - 1] == '\n' || line[len - 1] == '\r'))
      line[--len] = 0;
    if (len == 0) continue;
    if (std::strcmp(line, "help") == 0) {
      PrintUsage();
      continue;
    }
    if (std::strcmp(line, "quit") == 0 || std::strcmp(line, "exit") == 0) {
      break;
    }
    if (std::strcmp(line, "now") == 0) {
      std::printf("now=%.6f\n", clock.Now().ToDouble());
      continue;
    }
    if (std::strncmp(line, "skew ", 5) == 0) {
      int64_t ms = std::atoll(line + 5);
      double before = clock.Now().ToDouble();
      clock.Skew(ms * 1000000);
      double after = clock.Now().ToDouble();
      std::ostringstream oss;
      oss << "Clock skewed by " << (ms >= 0 ? "+" : "") << ms
          << "ms before=" << before << " after=" << after;
      logger.Log(oss.str());
      continue;
    }
    if (std::strcmp(line, "reset") == 0) {
      clock.ResetToRealTime();
      logger.Log("Clock reset to real-time");
      continue;
    }
    if (std::strcmp(line, "stats") == 0) {
      heartbeat::ServerStats s = server.GetStats();
      std::printf(
          "accepted=%llu active=%llu requests=%llu responses=%llu "
          "recv_errors=%llu send_errors=%llu handshake_failures=%llu "
          "unknown_methods=%llu last_error=\"%s\"\n",
          static_cast<unsigned long long>(s.connections_accepted),
          static_cast<unsigned long long>(s.active_connections),
          static_cast<unsigned long long>(s.requests_received),
          static_cast<unsigned long long>(s.responses_sent),
          static_cast<unsigned long long>(s.recv_errors),
          static_cast<unsigned long long>(s.send_errors),
          static_cast<unsigned long long>(s.handshake_failures),
          static_cast<unsigned long long>(s.unknown_methods),
          s.last_error.c_str());
      continue;
    }
    std::fprintf(stderr, "unknown command: %s\n", line);
  }

  server.Stop();
  return 0;
}
