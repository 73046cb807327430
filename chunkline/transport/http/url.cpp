#include "url.hpp"

#include <arpa/inet.h>
#include <netdb.h>

#include <bits/ttl/logger.hpp>
#include <charconv>

namespace chunkline::http {

std::string Url::authority() const {
  return host + ":" + std::to_string(port);
}

std::string Url::hostHeader() const {
  return port == 80 ? host : authority();
}

std::optional<Url> parseUrl(std::string_view text) {
  constexpr std::string_view kScheme = "http://";
  if (!text.starts_with(kScheme)) {
    return std::nullopt;
  }
  text.remove_prefix(kScheme.size());

  const size_t slash = text.find_first_of("/?");
  std::string_view authority = text.substr(0, slash);
  Url url;
  if (slash != std::string_view::npos) {
    url.target = std::string(text.substr(slash));
    if (url.target.front() == '?') {
      url.target.insert(url.target.begin(), '/');
    }
  }

  if (authority.empty() || authority.find('@') != std::string_view::npos) {
    return std::nullopt;
  }

  const size_t colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    const std::string_view port = authority.substr(colon + 1);
    uint16_t value              = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() ||
        value == 0) {
      return std::nullopt;
    }
    url.port  = value;
    authority = authority.substr(0, colon);
  }

  if (authority.empty()) {
    return std::nullopt;
  }
  url.host = std::string(authority);
  return url;
}

std::optional<std::string> resolveIPv4(const std::string& host) {
  in_addr addr{};
  if (::inet_pton(AF_INET, host.c_str(), &addr) == 1) {
    return host;
  }

  addrinfo hints{};
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result  = nullptr;
  const int rc      = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || result == nullptr) {
    TTL_LOG(Error) << "getaddrinfo(" << host << ") : ERR = " << ::gai_strerror(rc);
    return std::nullopt;
  }

  char text[INET_ADDRSTRLEN] = {};
  const auto* sin = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
  const bool ok   = ::inet_ntop(AF_INET, &sin->sin_addr, text, sizeof(text)) != nullptr;
  ::freeaddrinfo(result);
  if (!ok) {
    return std::nullopt;
  }
  TTL_LOG(Debug) << "getaddrinfo(" << host << ") : OK = " << text;
  return std::string(text);
}

std::string joinPath(std::string_view base, std::string_view route) {
  while (!base.empty() && base.back() == '/') {
    base.remove_suffix(1);
  }
  while (!route.empty() && route.front() == '/') {
    route.remove_prefix(1);
  }
  std::string out;
  if (!base.starts_with('/')) {
    out.push_back('/');
  }
  out.append(base);
  out.push_back('/');
  out.append(route);
  return out;
}

}  // namespace chunkline::http
