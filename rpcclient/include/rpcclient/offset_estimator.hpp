// Copyright (c) 2025 <Your Name>
/**
 * @file offset_estimator.hpp
 * @brief Remote clock offset from one heartbeat round trip.
 *
 * Cristian's algorithm: the reply is assumed to have spent half of the
 * round trip in flight, so the peer's clock at receive time is
 * server_time + rtt/2 and the estimate is exact to within +/- rtt/2.
 */
#pragma once

#include <cstdint>
#include <limits>

#include "heartbeat/remote_offset.hpp"

namespace rpcclient {

namespace detail {

constexpr int64_t kMaxNanos = std::numeric_limits<int64_t>::max();
constexpr int64_t kMinNanos = std::numeric_limits<int64_t>::min();

inline int64_t SaturatingAdd(int64_t a, int64_t b) {
  if (b > 0 && a > kMaxNanos - b) return kMaxNanos;
  if (b < 0 && a < kMinNanos - b) return kMinNanos;
  return a + b;
}

inline int64_t SaturatingSub(int64_t a, int64_t b) {
  if (b < 0 && a > kMaxNanos + b) return kMaxNanos;
  if (b > 0 && a < kMinNanos + b) return kMinNanos;
  return a - b;
}

}  // namespace detail

/**
 * @brief Estimates the peer clock offset from one Ping exchange.
 *
 * @param send_nanos Local clock right before the call was issued.
 * @param recv_nanos Local clock right after the reply arrived.
 * @param server_nanos Peer clock reported in the reply.
 * @return offset = server + (recv - send) / 2 - recv,
 *         error = (recv - send) / 2, measured_at = recv.
 *
 * server_nanos comes off the wire, so every step saturates instead of
 * overflowing. A local clock that stepped backwards gives a round trip of
 * zero. A finite estimate never equals the InfiniteOffset() sentinel.
 */
inline heartbeat::RemoteOffset EstimateRemoteOffset(int64_t send_nanos,
                                                    int64_t recv_nanos,
                                                    int64_t server_nanos) {
  int64_t half_round_trip =
      detail::SaturatingSub(recv_nanos, send_nanos) / 2;
  if (half_round_trip < 0) half_round_trip = 0;
  const int64_t remote_now =
      detail::SaturatingAdd(server_nanos, half_round_trip);
  heartbeat::RemoteOffset o;
  o.offset = detail::SaturatingSub(remote_now, recv_nanos);
  if (o.offset == detail::kMaxNanos) o.offset = detail::kMaxNanos - 1;
  o.error = half_round_trip;
  o.measured_at = recv_nanos;
  return o;
}

}  // namespace rpcclient
