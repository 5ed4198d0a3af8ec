// Copyright (c) 2025 <Your Name>
#pragma once

#if defined(__GNUC__) && defined(HEARTBEAT_SHARED)
#define HEARTBEAT_API __attribute__((visibility("default")))
#else
#define HEARTBEAT_API
#endif
