// Copyright (c) 2025 <Your Name>
/**
 * @file heartbeat_types.hpp
 * @brief Wire format of the heartbeat RPC (frames and Ping messages).
 *
 * A frame is a fixed 22-byte header followed by a name and a body. All
 * integers are big-endian.
 *
 *   magic(4)="HBRP" version(1)=1 kind(1) reserved(2) seq(8)
 *   name_len(2) body_len(4) name[name_len] body[body_len]
 *
 * Requests carry the method name; responses carry the error text, empty on
 * success, and echo the request's seq.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "heartbeat/export.hpp"
#include "heartbeat/remote_offset.hpp"

namespace heartbeat {

class Conn;

/** Method name served by the heartbeat service. */
constexpr char kPingMethod[] = "Heartbeat.Ping";

/**
 * @brief One request or response on the wire.
 */
struct Frame {
  enum class Kind : uint8_t { kRequest = 0, kResponse = 1 };

  static constexpr uint32_t kMagic = 0x48425250;  // "HBRP"
  static constexpr uint8_t kVersion = 1;
  static constexpr size_t kHeaderSize = 22;
  static constexpr size_t kMaxBodySize = 1u << 20;

  Kind kind = Kind::kRequest;
  uint64_t seq = 0;
  std::string name;  ///< Method (request) or error text (response)
  std::vector<uint8_t> body;

  /** Encodes header, name and body. */
  static std::vector<uint8_t> Serialize(const Frame& f);

  /**
   * @brief Decodes a complete frame from a buffer.
   * @param data Pointer to header + name + body.
   * @param len Buffer length; must match the encoded lengths exactly.
   * @param out Output frame (unchanged on failure).
   * @return true on success.
   */
  static bool Parse(const uint8_t* data, size_t len, Frame* out);
};

/**
 * @brief Heartbeat.Ping request.
 *
 * Carries the caller's current estimate of the callee's clock, so the callee
 * can reciprocally track skew, and the caller's local address as observed
 * on this connection.
 */
struct PingRequest {
  RemoteOffset offset;
  std::string addr;

  /** offset(8) error(8) measured_at(8) addr_len(2) addr */
  static std::vector<uint8_t> Serialize(const PingRequest& r);
  static bool Parse(const std::vector<uint8_t>& body, PingRequest* out);
};

/**
 * @brief Heartbeat.Ping response.
 */
struct PingResponse {
  int64_t server_time = 0;  ///< Peer clock, UNIX nanoseconds

  /** server_time(8) */
  static std::vector<uint8_t> Serialize(const PingResponse& r);
  static bool Parse(const std::vector<uint8_t>& body, PingResponse* out);
};

/**
 * @brief Reads one frame from a connection.
 * @param conn Source stream.
 * @param out Output frame.
 * @param err Output: failure description ("Connection closed" on EOF).
 * @return true on success.
 */
HEARTBEAT_API bool ReadFrame(Conn* conn, Frame* out, std::string* err);

/**
 * @brief Writes one frame to a connection.
 * @return true if the whole frame was written.
 */
HEARTBEAT_API bool WriteFrame(Conn* conn, const Frame& frame, std::string* err);

}  // namespace heartbeat
