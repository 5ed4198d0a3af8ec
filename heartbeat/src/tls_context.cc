// Copyright (c) 2025 <Your Name>
/**
 * @file tls_context.cc
 * @brief OpenSSL-backed TLS context and connection.
 *
 * Sockets are switched to non-blocking mode after connect so that a reader
 * blocked in poll() never holds the SSL object. Every SSL_* call on a
 * connection is made under its ssl mutex; waiting happens outside it.
 */
#include "heartbeat/tls_context.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace heartbeat {

namespace {

constexpr int64_t kIoPollUs = 200000;

/** Drains the OpenSSL error queue into a readable string. */
std::string OpenSslError(const std::string& context) {
  std::string text = context;
  unsigned long code = 0;
  bool first = true;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    text += first ? ": " : "; ";
    text += buf;
    first = false;
  }
  return text;
}

/** Waits for the readiness an SSL_ERROR_WANT_* code asks for. */
bool WaitFor(platform::ISocket* socket, int ssl_error, int64_t timeout_us) {
  if (ssl_error == SSL_ERROR_WANT_WRITE) {
    return socket->WaitWritable(timeout_us);
  }
  return socket->WaitReadable(timeout_us);
}

class TlsConn : public Conn {
 public:
  TlsConn(std::unique_ptr<platform::ISocket> socket, SSL* ssl)
      : socket_(std::move(socket)),
        ssl_(ssl),
        local_(socket_->LocalEndpoint()),
        remote_(socket_->RemoteEndpoint()) {}

  ~TlsConn() override {
    Close();
    SSL_free(ssl_);
    socket_->Close();
  }

  bool Write(const std::vector<uint8_t>& data) override {
    std::lock_guard<std::mutex> wlk(write_mtx_);
    size_t off = 0;
    while (off < data.size()) {
      if (closed_.load()) {
        SetError("use of closed connection");
        return false;
      }
      int rc = 0;
      int ssl_error = SSL_ERROR_NONE;
      {
        std::lock_guard<std::mutex> lk(ssl_mtx_);
        ERR_clear_error();
        rc = SSL_write(ssl_, data.data() + off,
                       static_cast<int>(data.size() - off));
        if (rc <= 0) ssl_error = SSL_get_error(ssl_, rc);
      }
      if (rc > 0) {
        off += static_cast<size_t>(rc);
        continue;
      }
      if (ssl_error == SSL_ERROR_WANT_READ ||
          ssl_error == SSL_ERROR_WANT_WRITE) {
        WaitFor(socket_.get(), ssl_error, kIoPollUs);
        continue;
      }
      SetError(OpenSslError("SSL_write failed"));
      return false;
    }
    return true;
  }

  bool ReadFull(uint8_t* buf, size_t n) override {
    size_t got = 0;
    while (got < n) {
      if (closed_.load()) {
        SetError("use of closed connection");
        return false;
      }
      int rc = 0;
      int ssl_error = SSL_ERROR_NONE;
      {
        std::lock_guard<std::mutex> lk(ssl_mtx_);
        ERR_clear_error();
        rc = SSL_read(ssl_, buf + got, static_cast<int>(n - got));
        if (rc <= 0) ssl_error = SSL_get_error(ssl_, rc);
      }
      if (rc > 0) {
        got += static_cast<size_t>(rc);
        continue;
      }
      if (ssl_error == SSL_ERROR_WANT_READ ||
          ssl_error == SSL_ERROR_WANT_WRITE) {
        WaitFor(socket_.get(), ssl_error, kIoPollUs);
        continue;
      }
      if (ssl_error == SSL_ERROR_ZERO_RETURN ||
          (ssl_error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
        SetError("Connection closed");
      } else {
        SetError(OpenSslError("SSL_read failed"));
      }
      return false;
    }
    return true;
  }

  void Close() override {
    if (closed_.exchange(true)) return;
    {
      std::lock_guard<std::mutex> lk(ssl_mtx_);
      ERR_clear_error();
      SSL_shutdown(ssl_);  // best effort close_notify; socket is non-blocking
    }
    socket_->Shutdown();
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
  SSL* ssl_;
  platform::Endpoint local_;
  platform::Endpoint remote_;
  std::atomic<bool> closed_{false};
  std::mutex ssl_mtx_;
  std::mutex write_mtx_;
  mutable std::mutex err_mtx_;
  std::string last_error_;
};

}  // namespace

struct TlsContext::Impl {
  SSL_CTX* ctx = nullptr;
  Role role = Role::kClient;
  std::string server_name;
  bool verify_peer = true;

  ~Impl() {
    if (ctx) SSL_CTX_free(ctx);
  }
};

TlsContext::TlsContext(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

TlsContext::~TlsContext() = default;

TlsContext::Role TlsContext::GetRole() const { return impl_->role; }

std::shared_ptr<TlsContext> TlsContext::Create(Role role,
                                               const TlsConfig& config,
                                               std::string* err) {
  auto fail = [err](const std::string& text) {
    if (err) *err = text;
    return std::shared_ptr<TlsContext>();
  };

  std::unique_ptr<Impl> impl(new Impl);
  impl->role = role;
  impl->server_name = config.ServerName();
  impl->verify_peer = config.VerifyPeer();

  ERR_clear_error();
  impl->ctx = SSL_CTX_new(role == Role::kClient ? TLS_client_method()
                                                : TLS_server_method());
  if (!impl->ctx) return fail(OpenSslError("SSL_CTX_new failed"));

  SSL_CTX_set_min_proto_version(impl->ctx, TLS1_2_VERSION);

  if (!config.CaFile().empty()) {
    if (SSL_CTX_load_verify_locations(impl->ctx, config.CaFile().c_str(),
                                      nullptr) != 1) {
      return fail(OpenSslError("cannot load CA file " + config.CaFile()));
    }
  } else if (role == Role::kClient && config.VerifyPeer()) {
    SSL_CTX_set_default_verify_paths(impl->ctx);
  }

  if (!config.CertFile().empty()) {
    if (SSL_CTX_use_certificate_chain_file(impl->ctx,
                                           config.CertFile().c_str()) != 1) {
      return fail(OpenSslError("cannot load certificate " + config.CertFile()));
    }
    const std::string& key =
        config.KeyFile().empty() ? config.CertFile() : config.KeyFile();
    if (SSL_CTX_use_PrivateKey_file(impl->ctx, key.c_str(),
                                    SSL_FILETYPE_PEM) != 1) {
      return fail(OpenSslError("cannot load private key " + key));
    }
    if (SSL_CTX_check_private_key(impl->ctx) != 1) {
      return fail(OpenSslError("private key does not match certificate"));
    }
  } else if (role == Role::kServer) {
    return fail("server TLS requires a certificate");
  }

  int mode = SSL_VERIFY_NONE;
  if (config.VerifyPeer()) {
    if (role == Role::kClient) {
      mode = SSL_VERIFY_PEER;
    } else if (!config.CaFile().empty()) {
      mode = SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT;
    }
  }
  SSL_CTX_set_verify(impl->ctx, mode, nullptr);

  return std::shared_ptr<TlsContext>(new TlsContext(std::move(impl)));
}

std::unique_ptr<Conn> TlsContext::Handshake(
    std::unique_ptr<platform::ISocket> socket, const std::string& peer_name,
    int timeout_ms, std::string* err) const {
  auto fail = [err](const std::string& text) {
    if (err) *err = text;
    return std::unique_ptr<Conn>();
  };

  if (!socket || !socket->IsValid()) return fail("socket not connected");
  if (!socket->SetNonBlocking(true)) return fail(socket->GetLastError());

  ERR_clear_error();
  SSL* ssl = SSL_new(impl_->ctx);
  if (!ssl) return fail(OpenSslError("SSL_new failed"));
  if (SSL_set_fd(ssl, socket->NativeHandle()) != 1) {
    SSL_free(ssl);
    return fail(OpenSslError("SSL_set_fd failed"));
  }

  if (impl_->role == Role::kClient) {
    const std::string& name =
        impl_->server_name.empty() ? peer_name : impl_->server_name;
    if (!name.empty()) {
      SSL_set_tlsext_host_name(ssl, name.c_str());
      if (impl_->verify_peer && SSL_set1_host(ssl, name.c_str()) != 1) {
        SSL_free(ssl);
        return fail(OpenSslError("SSL_set1_host failed"));
      }
    }
    SSL_set_connect_state(ssl);
  } else {
    SSL_set_accept_state(ssl);
  }

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    ERR_clear_error();
    int rc = SSL_do_handshake(ssl);
    if (rc == 1) break;
    int ssl_error = SSL_get_error(ssl, rc);
    if (ssl_error != SSL_ERROR_WANT_READ && ssl_error != SSL_ERROR_WANT_WRITE) {
      std::string text = OpenSslError("handshake failed");
      long verify = SSL_get_verify_result(ssl);
      if (verify != X509_V_OK) {
        text += " (verify: ";
        text += X509_verify_cert_error_string(verify);
        text += ")";
      }
      SSL_free(ssl);
      return fail(text);
    }
    auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      SSL_free(ssl);
      return fail("handshake timed out");
    }
    WaitFor(socket.get(), ssl_error, remaining.count());
  }

  return std::unique_ptr<Conn>(new TlsConn(std::move(socket), ssl));
}

}  // namespace heartbeat
