// Copyright (c) 2025 <Your Name>
/**
 * @file default_time_source.hpp
 * @brief Platform-specific default TimeSource.
 */
#pragma once

#include <memory>

#include "heartbeat/time_source.hpp"

namespace heartbeat {
namespace platform {

/**
 * @brief Creates a platform-specific default TimeSource.
 * @return Unique pointer to a MonotonicClock anchored to real time.
 */
std::unique_ptr<TimeSource> CreateDefaultTimeSource();

/**
 * @brief Process-wide default TimeSource used when none is supplied.
 *
 * The instance is created on first use and lives until process exit.
 */
TimeSource& GetDefaultTimeSource();

}  // namespace platform
}  // namespace heartbeat
