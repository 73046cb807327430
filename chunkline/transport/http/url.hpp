#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkline::http {

// http://host[:port][/path[?query]]. Only plain http is supported.
struct Url {
  std::string host;
  uint16_t port = 80;
  std::string target = "/";

  // "host:port", as accepted by TcpDialer.
  [[nodiscard]] std::string authority() const;

  // Host header value: host, with ":port" unless the port is 80.
  [[nodiscard]] std::string hostHeader() const;
};

[[nodiscard]] std::optional<Url> parseUrl(std::string_view text);

// Numeric IPv4 form of host, resolving names with getaddrinfo(3).
[[nodiscard]] std::optional<std::string> resolveIPv4(const std::string& host);

// Joins a base URL path with a route: ("/api/", "/chat") -> "/api/chat".
[[nodiscard]] std::string joinPath(std::string_view base, std::string_view route);

}  // namespace chunkline::http
