#include "errors.hpp"

#include <cstring>
#include <sstream>
#include <utility>

namespace chunkline::transfer {

std::string_view toString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kUnsupportedPayload:
      return "UnsupportedPayload";
    case ErrorKind::kEncoding:
      return "Encoding";
    case ErrorKind::kDecoding:
      return "Decoding";
    case ErrorKind::kChunkTransmission:
      return "ChunkTransmission";
    case ErrorKind::kAcknowledgment:
      return "Acknowledgment";
    case ErrorKind::kIncompleteTransfer:
      return "IncompleteTransfer";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kInvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

std::string TransferError::describe() const {
  std::ostringstream out;
  out << toString(kind);
  if (chunk_index.has_value()) {
    // Chunks are numbered from 1 for people.
    out << ": chunk " << (*chunk_index + 1) << "/" << total_chunks;
  }
  if (status != 0) {
    out << ": HTTP " << status;
  }
  if (code != 0) {
    out << ": " << std::strerror(code) << " (" << code << ")";
  }
  if (!detail.empty()) {
    out << ": " << detail;
  }
  return out.str();
}

TransferError makeError(ErrorKind kind, std::string detail) {
  TransferError err{.kind = kind};
  err.detail = std::move(detail);
  return err;
}

}  // namespace chunkline::transfer
