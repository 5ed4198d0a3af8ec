// Copyright (c) 2025 <Your Name>
/**
 * @file endpoint.cc
 * @brief Endpoint formatting and parsing.
 */
#include <cstdlib>
#include <string>

#include "heartbeat/platform/socket_interface.hpp"

namespace heartbeat {
namespace platform {

std::string Endpoint::ToString() const {
  return address + ":" + std::to_string(port);
}

bool ParseEndpoint(const std::string& host_port, Endpoint* out) {
  const size_t colon = host_port.rfind(':');
  if (colon == std::string::npos || colon + 1 >= host_port.size()) {
    return false;
  }
  const std::string port_str = host_port.substr(colon + 1);
  char* end = nullptr;
  long port = std::strtol(port_str.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || port < 0 || port > 65535) {
    return false;
  }
  out->address = host_port.substr(0, colon);
  out->port = static_cast<uint16_t>(port);
  return true;
}

}  // namespace platform
}  // namespace heartbeat
