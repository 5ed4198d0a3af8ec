// Copyright (c) 2025 <Your Name>
/**
 * @file socket_utils.hpp
 * @brief Socket address conversion helpers
 */
#pragma once

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>
#include <string>

#include "heartbeat/platform/socket_interface.hpp"

namespace heartbeat {
namespace platform {

/**
 * @brief Convert Endpoint to sockaddr_in, resolving host names to IPv4.
 * @param endpoint Platform-independent endpoint
 * @param addr Output sockaddr_in structure
 * @param err Optional resolver error text
 * @return true on success, false if the host cannot be resolved
 */
inline bool EndpointToSockaddr(const Endpoint& endpoint, sockaddr_in* addr,
                               std::string* err = nullptr) {
  std::memset(addr, 0, sizeof(*addr));
  addr->sin_family = AF_INET;
  addr->sin_port = htons(endpoint.port);

  const std::string host =
      endpoint.address.empty() ? "127.0.0.1" : endpoint.address;
  if (inet_pton(AF_INET, host.c_str(), &addr->sin_addr) == 1) {
    return true;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    if (err) *err = "cannot resolve " + host + ": " + gai_strerror(rc);
    if (res) freeaddrinfo(res);
    return false;
  }
  addr->sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
  freeaddrinfo(res);
  return true;
}

/**
 * @brief Convert sockaddr_in to Endpoint
 * @param addr Input sockaddr_in structure
 * @return Platform-independent endpoint
 */
inline Endpoint SockaddrToEndpoint(const sockaddr_in& addr) {
  Endpoint endpoint;

  char ip[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) != nullptr) {
    endpoint.address = ip;
  } else {
    endpoint.address = "";
  }

  endpoint.port = ntohs(addr.sin_port);

  return endpoint;
}

}  // namespace platform
}  // namespace heartbeat
