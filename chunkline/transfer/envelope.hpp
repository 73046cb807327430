#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace chunkline::transfer {

// One chunk on the wire:
// {"chunked":true,"chunkId":..,"chunkIndex":..,"totalChunks":..,
//  "chunkData":"<base64>","isBinary":..}
struct ChunkEnvelope {
  std::string chunk_id;
  size_t chunk_index  = 0;
  size_t total_chunks = 1;
  std::string chunk_data;
  bool is_binary = false;
};

// Intermediate acknowledgment: {"status":"chunk_received","received":N,"total":M}
struct ChunkAck {
  size_t received = 0;
  size_t total    = 0;
};

constexpr std::string_view kChunkReceived = "chunk_received";

[[nodiscard]] std::expected<std::string, TransferError> encodeEnvelope(
    const ChunkEnvelope& envelope);

// Receiver-side view, also used to inspect what was sent.
[[nodiscard]] std::expected<ChunkEnvelope, TransferError> decodeEnvelope(
    std::string_view body);

// Strict: status must be "chunk_received" and both counters unsigned
// integers. The error detail carries the raw body.
[[nodiscard]] std::expected<ChunkAck, TransferError> parseAck(std::string_view body);

// Compact JSON when body parses, otherwise the (truncated) raw text.
[[nodiscard]] std::string describeErrorBody(std::string_view body);

}  // namespace chunkline::transfer
