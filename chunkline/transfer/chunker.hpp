#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace chunkline::transfer {

constexpr size_t kDefaultMaxPayloadSize = 500000;
constexpr size_t kChunkSizeCeiling      = 250000;

// min(configured, ceiling); 0 for either means its default, so the result
// is never 0.
[[nodiscard]] constexpr size_t clampChunkSize(
    size_t configured, size_t ceiling = kChunkSizeCeiling) noexcept {
  const size_t size = configured == 0 ? kDefaultMaxPayloadSize : configured;
  const size_t cap  = ceiling == 0 ? kChunkSizeCeiling : ceiling;
  return size < cap ? size : cap;
}

// Splits a byte sequence into consecutive views of at most chunkSize()
// bytes. Views borrow the sequence. An empty sequence has one empty chunk.
class Chunker {
public:
  // chunk_size must be non-zero.
  Chunker(std::span<const uint8_t> bytes, size_t chunk_size) noexcept
      : bytes_(bytes), chunk_size_(chunk_size) {}

  [[nodiscard]] size_t count() const noexcept {
    if (bytes_.empty()) {
      return 1;
    }
    return (bytes_.size() + chunk_size_ - 1) / chunk_size_;
  }

  // Bytes [i*C, min((i+1)*C, L)). Empty for i >= count().
  [[nodiscard]] std::span<const uint8_t> slice(size_t i) const noexcept;

  [[nodiscard]] std::vector<std::span<const uint8_t>> split() const;

  [[nodiscard]] size_t chunkSize() const noexcept { return chunk_size_; }
  [[nodiscard]] size_t totalBytes() const noexcept { return bytes_.size(); }

private:
  std::span<const uint8_t> bytes_;
  size_t chunk_size_;
};

}  // namespace chunkline::transfer
