// Copyright (c) 2025 <Your Name>
/**
 * @test Client and ClientRegistry
 * @brief Connection lifecycle, heartbeats and recycling against a real
 *        HeartbeatServer on the loopback interface.
 */
#include "rpcclient/client_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "heartbeat/conn.hpp"
#include "heartbeat/heartbeat_server.hpp"
#include "heartbeat/heartbeat_types.hpp"
#include "heartbeat/manual_clock.hpp"
#include "heartbeat/monotonic_clock.hpp"
#include "heartbeat/platform/socket_interface.hpp"
#include "rpcclient/client.hpp"
#include "rpcclient/dialer.hpp"
#include "rpcclient/offset_monitor.hpp"

namespace rpcclient {
namespace {

using std::chrono::milliseconds;

constexpr milliseconds kWait(5000);

/** Records every published offset in order. */
class RecordingMonitor : public OffsetMonitor {
 public:
  void UpdateOffset(const std::string& addr,
                    const heartbeat::RemoteOffset& offset) override {
    std::lock_guard<std::mutex> lk(mtx_);
    updates_.emplace_back(addr, offset);
  }

  std::vector<std::pair<std::string, heartbeat::RemoteOffset>> Updates()
      const {
    std::lock_guard<std::mutex> lk(mtx_);
    return updates_;
  }

  bool SawInfinite() const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& u : updates_) {
      if (u.second.IsInfinite()) return true;
    }
    return false;
  }

  size_t FiniteAfterInfinite() const {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0;
    bool seen_inf = false;
    for (const auto& u : updates_) {
      if (u.second.IsInfinite()) {
        seen_inf = true;
      } else if (seen_inf) {
        ++n;
      }
    }
    return n;
  }

 private:
  mutable std::mutex mtx_;
  std::vector<std::pair<std::string, heartbeat::RemoteOffset>> updates_;
};

/** Fails the first N dials, then dials for real. */
class FlakyDialer : public Dialer {
 public:
  explicit FlakyDialer(int failures) : failures_(failures), real_(2000) {}

  std::unique_ptr<heartbeat::Conn> Dial(const std::string& addr,
                                        std::string* err) override {
    ++attempts_;
    if (failures_.fetch_sub(1) > 0) {
      *err = "connection refused";
      return nullptr;
    }
    return real_.Dial(addr, err);
  }

  int attempts() const { return attempts_.load(); }

 private:
  std::atomic<int> failures_;
  std::atomic<int> attempts_{0};
  TcpDialer real_;
};

/** Listens but never accepts, so requests are never answered. */
class SilentListener {
 public:
  SilentListener() : sock_(heartbeat::platform::CreatePlatformSocket()) {
    ok_ = sock_->Initialize() && sock_->Bind(0) && sock_->Listen(4);
  }
  ~SilentListener() { sock_->Close(); }
  bool ok() const { return ok_; }
  std::string addr() const {
    return "127.0.0.1:" + std::to_string(sock_->LocalEndpoint().port);
  }

 private:
  std::unique_ptr<heartbeat::platform::ISocket> sock_;
  bool ok_ = false;
};

/**
 * Heartbeat peer whose replies are switched at run time. Serves one
 * connection at a time.
 */
class ScriptedPeer {
 public:
  enum class Mode { kAnswer, kError, kStall };

  static constexpr int64_t kServerTime = 7000;

  ScriptedPeer() : listener_(heartbeat::platform::CreatePlatformSocket()) {
    ok_ = listener_->Initialize() && listener_->Bind(0) &&
          listener_->Listen(4);
    if (ok_) thread_ = std::thread([this]() { Run(); });
  }

  ~ScriptedPeer() {
    running_.store(false);
    Drop();
    if (thread_.joinable()) thread_.join();
    listener_->Close();
  }

  bool ok() const { return ok_; }
  std::string addr() const {
    return "127.0.0.1:" + std::to_string(listener_->LocalEndpoint().port);
  }
  void SetMode(Mode m) { mode_.store(m); }
  int served() const { return served_.load(); }
  int stalled() const { return stalled_.load(); }

  /** Closes the current connection, failing any unanswered request. */
  void Drop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (conn_) conn_->Close();
  }

 private:
  void Run() {
    while (running_.load()) {
      if (!listener_->WaitReadable(/*timeout_us=*/50000)) continue;
      std::unique_ptr<heartbeat::platform::ISocket> sock = listener_->Accept();
      if (!sock) continue;
      std::shared_ptr<heartbeat::Conn> conn =
          heartbeat::NewPlainConn(std::move(sock));
      {
        std::lock_guard<std::mutex> lk(mtx_);
        conn_ = conn;
      }
      Serve(conn.get());
      std::lock_guard<std::mutex> lk(mtx_);
      conn_.reset();
    }
  }

  void Serve(heartbeat::Conn* conn) {
    while (running_.load()) {
      heartbeat::Frame req;
      std::string err;
      if (!heartbeat::ReadFrame(conn, &req, &err)) return;
      heartbeat::Frame resp;
      resp.kind = heartbeat::Frame::Kind::kResponse;
      resp.seq = req.seq;
      heartbeat::PingResponse pong;
      pong.server_time = kServerTime;
      resp.body = heartbeat::PingResponse::Serialize(pong);
      switch (mode_.load()) {
        case Mode::kAnswer:
          break;
        case Mode::kError:
          resp.name = "rpc error";
          break;
        case Mode::kStall:
          ++stalled_;
          continue;
      }
      ++served_;
      if (!heartbeat::WriteFrame(conn, resp, &err)) return;
    }
  }

  std::unique_ptr<heartbeat::platform::ISocket> listener_;
  bool ok_ = false;
  std::atomic<bool> running_{true};
  std::atomic<Mode> mode_{Mode::kAnswer};
  std::atomic<int> served_{0};
  std::atomic<int> stalled_{0};
  std::mutex mtx_;
  std::shared_ptr<heartbeat::Conn> conn_;
  std::thread thread_;
};

RetryOptions FastRetry(int max_attempts = 0) {
  RetryOptions r;
  r.backoff = milliseconds(10);
  r.max_backoff = milliseconds(50);
  r.max_attempts = max_attempts;
  return r;
}

Options FastOptions(std::shared_ptr<Dialer> dialer = nullptr) {
  Options::Builder b;
  b.HeartbeatIntervalMs(50).ConnectTimeoutMs(1000).Retry(FastRetry());
  if (dialer) b.Transport(std::move(dialer));
  return b.Build();
}

template <typename Pred>
bool Eventually(Pred pred, milliseconds limit = kWait) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(milliseconds(5));
  }
  return pred();
}

class ClientRegistryTest : public ::testing::Test {
 protected:
  void StartServer(heartbeat::TimeSource* clock) {
    heartbeat::Options opts =
        heartbeat::Options::Builder()
            .OnPing([this](const heartbeat::PingRequest& req) {
              {
                std::lock_guard<std::mutex> lk(ping_mtx_);
                pings_.push_back(req);
              }
              while (stall_.load()) {
                std::this_thread::sleep_for(milliseconds(5));
              }
            })
            .Build();
    ASSERT_TRUE(server_.Start(0, clock, opts));
    addr_ = "127.0.0.1:" + std::to_string(server_.Port());
  }

  void TearDown() override {
    stall_.store(false);
    server_.Stop();
  }

  std::vector<heartbeat::PingRequest> Pings() {
    std::lock_guard<std::mutex> lk(ping_mtx_);
    return pings_;
  }

  heartbeat::HeartbeatServer server_;
  std::string addr_;
  std::atomic<bool> stall_{false};
  std::mutex ping_mtx_;
  std::vector<heartbeat::PingRequest> pings_;
};

}  // namespace

/**
 * @test ClientRegistryTest.GetOrCreateIsSingleFlight
 * @brief Concurrent lookups for one address share a single Client.
 *
 * @steps
 * 1. Eight threads call GetOrCreate() for the same address at once.
 *
 * @expected Every thread gets the same instance and the registry holds one
 *           entry.
 */
TEST_F(ClientRegistryTest, GetOrCreateIsSingleFlight) {
  heartbeat::ManualClock server_clock(1);
  StartServer(&server_clock);
  ClientRegistry registry(nullptr, nullptr, FastOptions());

  std::atomic<bool> go{false};
  std::vector<std::shared_ptr<Client>> got(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < got.size(); ++i) {
    threads.emplace_back([&, i]() {
      while (!go.load()) std::this_thread::yield();
      got[i] = registry.GetOrCreate(addr_);
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();

  for (const auto& c : got) EXPECT_EQ(c, got[0]);
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(registry.Lookup(addr_), got[0]);
  EXPECT_TRUE(got[0]->WaitReady(kWait));
}

/**
 * @test ClientRegistryTest.ReadyPublishesExactOffset
 * @brief With frozen clocks the estimate is exact and is reported back to
 *        the server on the next ping.
 *
 * @steps
 * 1. Server clock fixed at 5000 ns, client clock fixed at 1000 ns.
 * 2. Wait for Ready and a few heartbeats.
 *
 * @expected Offset 4000 with zero error is published, the client is
 *           healthy, and later pings carry that offset and the client's
 *           local address.
 */
TEST_F(ClientRegistryTest, ReadyPublishesExactOffset) {
  heartbeat::ManualClock server_clock(5000);
  heartbeat::ManualClock client_clock(1000);
  StartServer(&server_clock);
  RemoteClockMonitor monitor;
  ClientRegistry registry(&client_clock, &monitor, FastOptions());

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));
  EXPECT_EQ(client->GetState(), Client::State::kReady);
  EXPECT_TRUE(client->IsConnected());
  EXPECT_TRUE(client->IsHealthy());
  EXPECT_FALSE(client->LocalAddr().empty());

  heartbeat::RemoteOffset published;
  ASSERT_TRUE(monitor.GetOffset(addr_, &published));
  EXPECT_EQ(published.offset, 4000);
  EXPECT_EQ(published.error, 0);
  EXPECT_EQ(published.measured_at, 1000);
  EXPECT_EQ(client->RemoteOffset(), published);

  ASSERT_TRUE(Eventually([&]() { return Pings().size() >= 3; }));
  std::vector<heartbeat::PingRequest> pings = Pings();
  EXPECT_TRUE(pings[0].offset.offset == 0 || pings[0].offset.IsInfinite());
  EXPECT_EQ(pings.back().offset.offset, 4000);
  EXPECT_EQ(pings.back().addr, client->LocalAddr());
}

TEST_F(ClientRegistryTest, SkewedServerClockIsMeasured) {
  heartbeat::MonotonicClock server_clock;
  server_clock.Skew(5000000000LL);
  StartServer(&server_clock);
  ClientRegistry registry(nullptr, nullptr, FastOptions());

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));
  heartbeat::RemoteOffset o = client->RemoteOffset();
  ASSERT_FALSE(o.IsInfinite());
  EXPECT_LE(std::llabs(o.offset - 5000000000LL), o.error + 100000000LL);
}

/**
 * @test ClientRegistryTest.SlowReplyPublishesInfiniteThenRecovers
 * @brief A reply slower than twice the interval marks the peer unhealthy
 *        with the infinite sentinel, but the connection is kept.
 *
 * @steps
 * 1. Reach Ready, then stall the server's ping handler.
 * 2. Wait for an infinite offset to be published.
 * 3. Release the handler.
 *
 * @expected The client is unhealthy while stalled, stays open, and later
 *           publishes finite offsets and becomes healthy again.
 */
TEST_F(ClientRegistryTest, SlowReplyPublishesInfiniteThenRecovers) {
  heartbeat::ManualClock server_clock(9000);
  heartbeat::ManualClock client_clock(1000);
  StartServer(&server_clock);
  RecordingMonitor monitor;
  ClientRegistry registry(&client_clock, &monitor, FastOptions());

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));

  stall_.store(true);
  ASSERT_TRUE(Eventually([&]() { return monitor.SawInfinite(); }));
  EXPECT_FALSE(client->IsHealthy());
  EXPECT_TRUE(client->RemoteOffset().IsInfinite());
  EXPECT_NE(client->RemoteOffset().measured_at, 0);
  EXPECT_FALSE(client->IsClosed());

  stall_.store(false);
  ASSERT_TRUE(Eventually([&]() { return monitor.FiniteAfterInfinite() > 0; }));
  EXPECT_TRUE(Eventually([&]() { return client->IsHealthy(); }));
  EXPECT_FALSE(client->IsClosed());
  EXPECT_EQ(client->RemoteOffset().offset, 8000);
  EXPECT_EQ(registry.Lookup(addr_), client);
}

/**
 * @test ClientRegistryTest.ConcurrentCloseIsIdempotent
 * @brief Many concurrent Close() calls resolve Closed() exactly once.
 */
TEST_F(ClientRegistryTest, ConcurrentCloseIsIdempotent) {
  heartbeat::ManualClock server_clock(1);
  StartServer(&server_clock);
  ClientRegistry registry(nullptr, nullptr, FastOptions());

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() { client->Close(); });
  }
  for (auto& t : threads) t.join();
  client->Close();

  EXPECT_TRUE(client->WaitClosed(milliseconds(0)));
  EXPECT_TRUE(client->IsClosed());
  EXPECT_FALSE(client->IsHealthy());
  EXPECT_FALSE(client->IsConnected());
  EXPECT_EQ(client->GetState(), Client::State::kClosed);
  EXPECT_EQ(registry.Lookup(addr_), nullptr);
  EXPECT_EQ(registry.Size(), 0u);

  auto fresh = registry.GetOrCreate(addr_);
  EXPECT_NE(fresh, client);
  EXPECT_TRUE(fresh->WaitReady(kWait));
}

/**
 * @test ClientRegistryTest.FailedHeartbeatRecyclesClient
 * @brief When the peer goes away the Client closes itself and leaves the
 *        registry, so the next lookup builds a new one.
 */
TEST_F(ClientRegistryTest, FailedHeartbeatRecyclesClient) {
  heartbeat::ManualClock server_clock(1);
  StartServer(&server_clock);
  ClientRegistry registry(nullptr, nullptr, FastOptions());

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));

  server_.Stop();
  ASSERT_TRUE(client->WaitClosed(kWait));
  EXPECT_EQ(client->GetState(), Client::State::kClosed);
  EXPECT_EQ(registry.Lookup(addr_), nullptr);

  auto fresh = registry.GetOrCreate(addr_);
  EXPECT_NE(fresh, client);
  EXPECT_FALSE(fresh->IsClosed());
}

/**
 * @test ClientRegistryTest.ErrorReplyClosesAndRecyclesReadyClient
 * @brief An error reply to a heartbeat of a Ready client is fatal, but the
 *        round trip is still published before the client closes.
 *
 * @steps
 * 1. Reach Ready against a peer answering with server time 7000 while the
 *    client clock reads 1000.
 * 2. Switch the peer to error replies.
 * 3. Switch it back and look the address up again.
 *
 * @expected The error round is published with a zero server time (offset
 *           -1000), Closed() resolves, the registry entry is removed, and
 *           the next lookup builds a new Client that becomes Ready.
 */
TEST_F(ClientRegistryTest, ErrorReplyClosesAndRecyclesReadyClient) {
  ScriptedPeer peer;
  ASSERT_TRUE(peer.ok());
  heartbeat::ManualClock client_clock(1000);
  RecordingMonitor monitor;
  ClientRegistry registry(&client_clock, &monitor, FastOptions());

  auto client = registry.GetOrCreate(peer.addr());
  ASSERT_TRUE(client->WaitReady(kWait));
  EXPECT_EQ(client->RemoteOffset().offset, 6000);

  peer.SetMode(ScriptedPeer::Mode::kError);
  ASSERT_TRUE(client->WaitClosed(kWait));
  EXPECT_EQ(client->GetState(), Client::State::kClosed);
  EXPECT_EQ(registry.Lookup(peer.addr()), nullptr);

  std::vector<std::pair<std::string, heartbeat::RemoteOffset>> updates =
      monitor.Updates();
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().second.offset, -1000);
  EXPECT_EQ(updates.back().second.error, 0);
  EXPECT_FALSE(monitor.SawInfinite());

  peer.SetMode(ScriptedPeer::Mode::kAnswer);
  auto fresh = registry.GetOrCreate(peer.addr());
  EXPECT_NE(fresh, client);
  EXPECT_TRUE(fresh->WaitReady(kWait));
}

/**
 * @test ClientRegistryTest.ErrorReplyDuringVerificationIsMeasured
 * @brief Verification heartbeats answered with an error inside the
 *        timeout are published, then retried until the budget runs out.
 *
 * @expected Three replies served, three published offsets, Ready() never
 *           resolves and Closed() does.
 */
TEST_F(ClientRegistryTest, ErrorReplyDuringVerificationIsMeasured) {
  ScriptedPeer peer;
  ASSERT_TRUE(peer.ok());
  peer.SetMode(ScriptedPeer::Mode::kError);
  heartbeat::ManualClock client_clock(1000);
  RecordingMonitor monitor;
  ClientRegistry registry(&client_clock, &monitor, FastOptions());

  RetryOptions budget = FastRetry(3);
  auto client = registry.GetOrCreate(peer.addr(), &budget);
  ASSERT_TRUE(client->WaitClosed(kWait));
  EXPECT_FALSE(client->WaitReady(milliseconds(0)));
  EXPECT_EQ(peer.served(), 3);
  std::vector<std::pair<std::string, heartbeat::RemoteOffset>> updates =
      monitor.Updates();
  ASSERT_EQ(updates.size(), 3u);
  for (const auto& u : updates) {
    EXPECT_EQ(u.first, peer.addr());
    EXPECT_EQ(u.second.offset, -1000);
  }
}

/**
 * @test ClientRegistryTest.TimedOutHeartbeatThenFailureCloses
 * @brief A heartbeat that outlives its timeout publishes the infinite
 *        sentinel; when the late call then fails the client closes.
 *
 * @steps
 * 1. Reach Ready, then let the peer swallow requests.
 * 2. Wait for the infinite offset.
 * 3. Drop the peer's connection so the pending call fails.
 *
 * @expected The client stays open while the call is pending, then closes
 *           and leaves the registry.
 */
TEST_F(ClientRegistryTest, TimedOutHeartbeatThenFailureCloses) {
  ScriptedPeer peer;
  ASSERT_TRUE(peer.ok());
  RecordingMonitor monitor;
  ClientRegistry registry(nullptr, &monitor, FastOptions());

  auto client = registry.GetOrCreate(peer.addr());
  ASSERT_TRUE(client->WaitReady(kWait));

  peer.SetMode(ScriptedPeer::Mode::kStall);
  ASSERT_TRUE(Eventually([&]() { return monitor.SawInfinite(); }));
  EXPECT_FALSE(client->IsHealthy());
  EXPECT_TRUE(client->RemoteOffset().IsInfinite());
  EXPECT_FALSE(client->IsClosed());
  EXPECT_TRUE(Eventually([&]() { return peer.stalled() == 1; }));

  peer.Drop();
  ASSERT_TRUE(client->WaitClosed(kWait));
  EXPECT_EQ(client->GetState(), Client::State::kClosed);
  EXPECT_EQ(registry.Lookup(peer.addr()), nullptr);
  EXPECT_EQ(monitor.FiniteAfterInfinite(), 0u);
}

/**
 * @test ClientRegistryTest.RetryExhaustionClosesWithoutReady
 * @brief A peer that never accepts exhausts a bounded retry budget.
 *
 * @steps
 * 1. Use a dialer that always fails and a budget of three attempts.
 *
 * @expected Closed() resolves, Ready() never does, and three dials were
 *           made.
 */
TEST_F(ClientRegistryTest, RetryExhaustionClosesWithoutReady) {
  auto dialer = std::make_shared<FlakyDialer>(1000);
  ClientRegistry registry(nullptr, nullptr, FastOptions(dialer));

  RetryOptions budget = FastRetry(3);
  auto client = registry.GetOrCreate("127.0.0.1:1", &budget);
  ASSERT_TRUE(client->WaitClosed(kWait));
  EXPECT_FALSE(client->WaitReady(milliseconds(50)));
  EXPECT_EQ(dialer->attempts(), 3);
  EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(ClientRegistryTest, DialRetriesUntilPeerAnswers) {
  heartbeat::ManualClock server_clock(1);
  StartServer(&server_clock);
  auto dialer = std::make_shared<FlakyDialer>(3);
  std::mutex log_mtx;
  std::vector<std::string> logs;
  Options opts = Options::Builder(FastOptions(dialer))
                     .LogSink([&](const std::string& msg) {
                       std::lock_guard<std::mutex> lk(log_mtx);
                       logs.push_back(msg);
                     })
                     .Build();
  ClientRegistry registry(nullptr, nullptr, opts);

  auto client = registry.GetOrCreate(addr_);
  ASSERT_TRUE(client->WaitReady(kWait));
  EXPECT_EQ(dialer->attempts(), 4);

  registry.CloseAll();
  std::lock_guard<std::mutex> lk(log_mtx);
  bool saw_refused = false;
  bool saw_connected = false;
  for (const auto& l : logs) {
    if (l.find("connection refused") != std::string::npos) saw_refused = true;
    if (l == "[Client " + addr_ + "] connected") saw_connected = true;
  }
  EXPECT_TRUE(saw_refused);
  EXPECT_TRUE(saw_connected);
}

/**
 * @test ClientRegistryTest.CloseWhileDialingNeverReady
 * @brief Close() during a long backoff wakes the task immediately, and
 *        Ready() is never resolved afterwards.
 */
TEST_F(ClientRegistryTest, CloseWhileDialingNeverReady) {
  auto dialer = std::make_shared<FlakyDialer>(1000000);
  Options::Builder b(FastOptions(dialer));
  RetryOptions slow;
  slow.backoff = milliseconds(10000);
  ClientRegistry registry(nullptr, nullptr, b.Retry(slow).Build());

  auto client = registry.GetOrCreate("127.0.0.1:1");
  ASSERT_TRUE(Eventually([&]() { return dialer->attempts() >= 1; }));
  EXPECT_EQ(client->GetState(), Client::State::kDialing);

  const auto start = std::chrono::steady_clock::now();
  client->Close();
  EXPECT_TRUE(client->WaitClosed(milliseconds(0)));
  EXPECT_FALSE(client->WaitReady(milliseconds(100)));
  EXPECT_EQ(dialer->attempts(), 1);
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(5000));
}

/**
 * @test ClientRegistryTest.CloseUnblocksSilentVerification
 * @brief A peer that accepts but never answers keeps the Client in
 *        verification until Close().
 */
TEST_F(ClientRegistryTest, CloseUnblocksSilentVerification) {
  SilentListener silent;
  ASSERT_TRUE(silent.ok());
  RecordingMonitor monitor;
  ClientRegistry registry(nullptr, &monitor, FastOptions());

  auto client = registry.GetOrCreate(silent.addr());
  ASSERT_TRUE(Eventually(
      [&]() { return client->GetState() == Client::State::kVerifying; }));
  ASSERT_TRUE(Eventually([&]() { return monitor.SawInfinite(); }));
  EXPECT_FALSE(client->WaitReady(milliseconds(0)));

  client->Close();
  EXPECT_TRUE(client->WaitClosed(kWait));
  EXPECT_FALSE(client->WaitReady(milliseconds(100)));
  EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(ClientRegistryTest, DestructorClosesLiveClients) {
  heartbeat::ManualClock server_clock(1);
  StartServer(&server_clock);
  std::shared_ptr<Client> client;
  {
    ClientRegistry registry(nullptr, nullptr, FastOptions());
    client = registry.GetOrCreate(addr_);
    ASSERT_TRUE(client->WaitReady(kWait));
  }
  EXPECT_TRUE(client->IsClosed());
  EXPECT_TRUE(client->WaitClosed(milliseconds(0)));
}

TEST(ClientOptionsTest, DefaultsAndTimeout) {
  Options o;
  EXPECT_EQ(o.HeartbeatIntervalMs(), 3000);
  EXPECT_EQ(o.HeartbeatTimeout(), milliseconds(6000));
  EXPECT_EQ(o.Retry().backoff, milliseconds(1000));
  EXPECT_EQ(o.Retry().max_attempts, 0);
  EXPECT_FALSE(o.UseTls());

  Options fast = Options::Builder().HeartbeatIntervalMs(50).Build();
  EXPECT_EQ(fast.HeartbeatTimeout(), milliseconds(100));
}

}  // namespace rpcclient
