#include "http_message.hpp"

#include <algorithm>

namespace chunkline::http {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char x = a[i];
    char y = b[i];
    if (x >= 'A' && x <= 'Z') {
      x = static_cast<char>(x - 'A' + 'a');
    }
    if (y >= 'A' && y <= 'Z') {
      y = static_cast<char>(y - 'A' + 'a');
    }
    if (x != y) {
      return false;
    }
  }
  return true;
}

std::optional<std::string_view> findHeader(const Headers& headers,
                                           std::string_view name) {
  for (const auto& [key, value] : headers) {
    if (equalsIgnoreCase(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

void setHeader(Headers& headers, std::string name, std::string value) {
  std::erase_if(headers, [&](const auto& header) {
    return equalsIgnoreCase(header.first, name);
  });
  headers.emplace_back(std::move(name), std::move(value));
}

Headers jsonHeaders(std::string_view bearer_token) {
  Headers headers;
  headers.emplace_back("Content-Type", "application/json");
  if (!bearer_token.empty()) {
    headers.emplace_back("Authorization",
                         "Bearer " + std::string(bearer_token));
  }
  return headers;
}

}  // namespace chunkline::http
