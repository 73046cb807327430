#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunker.hpp"
#include "errors.hpp"

namespace chunkline::transfer {

struct TransferConfig {
  // Server-advertised request body limit; 0 selects kDefaultMaxPayloadSize.
  size_t max_payload_size   = 0;
  size_t chunk_size_ceiling = kChunkSizeCeiling;

  // Sleep pacing_delay after every pacing_every-th chunk once a transfer
  // has more than pacing_min_chunks chunks.
  size_t pacing_min_chunks = 100;
  size_t pacing_every      = 10;
  std::chrono::milliseconds pacing_delay{100};

  std::vector<std::string> binary_routes{"/speech2text"};

  [[nodiscard]] size_t chunkSize() const noexcept {
    return clampChunkSize(max_payload_size, chunk_size_ceiling);
  }

  // Largest body sent without chunking.
  [[nodiscard]] size_t directLimit() const noexcept {
    return max_payload_size == 0 ? kDefaultMaxPayloadSize : max_payload_size;
  }

  [[nodiscard]] bool paceAfter(size_t index, size_t total) const noexcept {
    return total > pacing_min_chunks && pacing_every != 0 &&
           index % pacing_every == 0;
  }

  [[nodiscard]] std::expected<void, TransferError> validate() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Process environment via getenv(3).
[[nodiscard]] std::optional<std::string> processEnv(const std::string& name);

// Reads CHUNKLINE_MAX_PAYLOAD_SIZE, CHUNKLINE_CHUNK_CEILING,
// CHUNKLINE_PACING_MIN_CHUNKS, CHUNKLINE_PACING_EVERY,
// CHUNKLINE_PACING_DELAY_MS and CHUNKLINE_BINARY_ROUTES (comma separated)
// on top of the defaults. Unset variables keep the default.
[[nodiscard]] std::expected<TransferConfig, TransferError> configFromEnvironment(
    const EnvLookup& lookup = processEnv);

// Merges the MAX_PAYLOAD_SIZE field of a GET /backend/config body. A body
// without the field leaves config untouched.
[[nodiscard]] std::expected<void, TransferError> applyServerConfig(
    TransferConfig& config, std::string_view body);

}  // namespace chunkline::transfer
