#ifdef _WIN32

#include "preflight/supervisor.hpp"

#include <winsock2.h>
#include <ws2tcpip.h>

#include <mutex>

namespace preflight {

namespace {

bool split_endpoint(const std::string& endpoint, std::string& host, std::string& port) {
  const auto colon = endpoint.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) return false;
  host = endpoint.substr(0, colon);
  port = endpoint.substr(colon + 1);
  return true;
}

bool winsock_ready() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] {
    WSADATA data;
    ok = WSAStartup(MAKEWORD(2, 2), &data) == 0;
  });
  return ok;
}

}  // namespace

bool tcp_probe(const std::string& endpoint) {
  if (!winsock_ready()) return false;
  std::string host, port;
  if (!split_endpoint(endpoint, host, port)) return false;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  if (getaddrinfo(host.c_str(), port.c_str(), &hints, &res) != 0) return false;

  bool connected = false;
  for (addrinfo* ai = res; ai != nullptr && !connected; ai = ai->ai_next) {
    SOCKET s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (s == INVALID_SOCKET) continue;
    connected = connect(s, ai->ai_addr, static_cast<int>(ai->ai_addrlen)) == 0;
    closesocket(s);
  }
  freeaddrinfo(res);
  return connected;
}

}  // namespace preflight

#endif
