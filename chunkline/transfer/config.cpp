#include "config.hpp"

#include <bits/ttl/logger.hpp>
#include <charconv>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <utility>

namespace chunkline::transfer {

namespace {

TransferError invalid(std::string detail) {
  return makeError(ErrorKind::kInvalidConfig, std::move(detail));
}

std::optional<size_t> parseSize(std::string_view text) {
  while (!text.empty() && text.front() == ' ') {
    text.remove_prefix(1);
  }
  while (!text.empty() && text.back() == ' ') {
    text.remove_suffix(1);
  }
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::expected<void, TransferError> readSize(const EnvLookup& lookup,
                                            const std::string& name,
                                            size_t& out) {
  const auto raw = lookup(name);
  if (!raw.has_value()) {
    return {};
  }
  const auto value = parseSize(*raw);
  if (!value.has_value()) {
    return std::unexpected(invalid(name + "='" + *raw + "' is not a size"));
  }
  out = *value;
  return {};
}

std::vector<std::string> splitRoutes(std::string_view text) {
  std::vector<std::string> routes;
  while (!text.empty()) {
    const size_t comma = text.find(',');
    std::string_view item = text.substr(0, comma);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (!item.empty()) {
      routes.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return routes;
}

}  // namespace

std::expected<void, TransferError> TransferConfig::validate() const {
  if (chunk_size_ceiling == 0) {
    return std::unexpected(invalid("chunk size ceiling must be positive"));
  }
  for (const auto& route : binary_routes) {
    if (!route.starts_with('/')) {
      return std::unexpected(invalid("binary route '" + route +
                                     "' must start with '/'"));
    }
  }
  return {};
}

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

std::expected<TransferConfig, TransferError> configFromEnvironment(
    const EnvLookup& lookup) {
  TransferConfig config;

  size_t delay_ms = static_cast<size_t>(config.pacing_delay.count());
  for (auto step : {
           readSize(lookup, "CHUNKLINE_MAX_PAYLOAD_SIZE", config.max_payload_size),
           readSize(lookup, "CHUNKLINE_CHUNK_CEILING", config.chunk_size_ceiling),
           readSize(lookup, "CHUNKLINE_PACING_MIN_CHUNKS", config.pacing_min_chunks),
           readSize(lookup, "CHUNKLINE_PACING_EVERY", config.pacing_every),
           readSize(lookup, "CHUNKLINE_PACING_DELAY_MS", delay_ms),
       }) {
    if (!step) {
      return std::unexpected(std::move(step.error()));
    }
  }
  config.pacing_delay = std::chrono::milliseconds(delay_ms);

  if (const auto routes = lookup("CHUNKLINE_BINARY_ROUTES")) {
    config.binary_routes = splitRoutes(*routes);
  }

  if (auto ok = config.validate(); !ok) {
    return std::unexpected(std::move(ok.error()));
  }

  TTL_LOG(Debug) << "TransferConfig{max_payload_size=" << config.max_payload_size
                 << ", chunk=" << config.chunkSize()
                 << ", pacing=" << config.pacing_min_chunks << "/"
                 << config.pacing_every << "/" << config.pacing_delay.count()
                 << "ms, binary_routes=" << config.binary_routes.size() << "}";
  return config;
}

std::expected<void, TransferError> applyServerConfig(TransferConfig& config,
                                                     std::string_view body) {
  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::unexpected(invalid("server config is not a JSON object"));
  }

  const auto it = j.find("MAX_PAYLOAD_SIZE");
  if (it == j.end()) {
    TTL_LOG(Debug) << "Server config has no MAX_PAYLOAD_SIZE";
    return {};
  }

  std::optional<size_t> value;
  if (it->is_number_unsigned()) {
    value = it->get<size_t>();
  } else if (it->is_string()) {
    value = parseSize(it->get_ref<const std::string&>());
  }
  if (!value.has_value()) {
    return std::unexpected(
        invalid("MAX_PAYLOAD_SIZE is not a size: " + it->dump()));
  }

  config.max_payload_size = *value;
  TTL_LOG(Info) << "Server MAX_PAYLOAD_SIZE = " << *value << ", chunk size "
                << config.chunkSize();
  return {};
}

}  // namespace chunkline::transfer
