#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkline::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method = "POST";
  std::string target = "/";
  Headers headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  Headers headers;
  std::string body;

  [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

// Case-insensitive lookup, first match wins.
[[nodiscard]] std::optional<std::string_view> findHeader(const Headers& headers,
                                                         std::string_view name);

// Replaces every header called name (case-insensitive) with a single entry.
void setHeader(Headers& headers, std::string name, std::string value);

// "Bearer <token>" plus the JSON content type.
[[nodiscard]] Headers jsonHeaders(std::string_view bearer_token);

}  // namespace chunkline::http
