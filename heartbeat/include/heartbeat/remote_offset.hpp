// Copyright (c) 2025 <Your Name>
/**
 * @file remote_offset.hpp
 * @brief Estimated clock offset of a peer and its error bound.
 */
#pragma once

#include <cstdint>
#include <limits>
#include <ostream>

namespace heartbeat {

/**
 * @brief Clock offset estimate of a peer relative to the local clock.
 *
 * All fields are nanoseconds. Under the symmetric-latency assumption the
 * true offset lies in [offset - error, offset + error].
 */
struct RemoteOffset {
  int64_t offset = 0;       ///< Peer clock minus local clock (may be < 0)
  int64_t error = 0;        ///< Half the measured round trip (>= 0)
  int64_t measured_at = 0;  ///< Local UNIX nanos at measurement time

  /** True for the "no valid estimate" sentinel. */
  bool IsInfinite() const {
    return offset == std::numeric_limits<int64_t>::max() && error == 0;
  }

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const RemoteOffset& o) {
    if (o.IsInfinite()) {
      return os << "offset=inf measured_at=" << o.measured_at;
    }
    return os << "offset=" << o.offset << "ns error=" << o.error
              << "ns measured_at=" << o.measured_at;
  }
};

inline bool operator==(const RemoteOffset& a, const RemoteOffset& b) {
  return a.offset == b.offset && a.error == b.error &&
         a.measured_at == b.measured_at;
}

inline bool operator!=(const RemoteOffset& a, const RemoteOffset& b) {
  return !(a == b);
}

/**
 * @brief Sentinel published when a heartbeat times out.
 * @return {offset = INT64_MAX, error = 0, measured_at = 0}
 */
inline RemoteOffset InfiniteOffset() {
  RemoteOffset o;
  o.offset = std::numeric_limits<int64_t>::max();
  o.error = 0;
  o.measured_at = 0;
  return o;
}

/**
 * @brief Offset of the sender as seen from the receiver of a Ping.
 *
 * A Ping carries the sender's estimate of the receiver's clock. The
 * receiver records the negated offset for the sender. The infinite sentinel
 * is passed through unchanged.
 */
inline RemoteOffset ReciprocalOffset(const RemoteOffset& reported) {
  if (reported.IsInfinite()) return reported;
  RemoteOffset o = reported;
  o.offset = -reported.offset;
  return o;
}

}  // namespace heartbeat
