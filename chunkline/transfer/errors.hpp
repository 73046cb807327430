#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkline::transfer {

enum class ErrorKind : uint8_t {
  kUnsupportedPayload,
  kEncoding,
  kDecoding,
  kChunkTransmission,
  kAcknowledgment,
  kIncompleteTransfer,
  kCancelled,
  kInvalidConfig,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

// Terminal failure of a transfer or of one of its synchronous steps.
struct TransferError {
  ErrorKind kind;
  int code   = 0;  // errno for transport failures, otherwise 0
  int status = 0;  // HTTP status when the receiver answered
  std::optional<size_t> chunk_index;
  size_t total_chunks = 0;
  std::string detail;

  // "ChunkTransmission: chunk 2/3: HTTP 500: {...}"
  [[nodiscard]] std::string describe() const;
};

[[nodiscard]] TransferError makeError(ErrorKind kind, std::string detail);

}  // namespace chunkline::transfer
