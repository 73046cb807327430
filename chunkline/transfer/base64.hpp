#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

namespace chunkline::transfer {

using Bytes = std::vector<uint8_t>;

// Standard alphabet, '=' padded.
namespace base64 {

// Input is consumed in blocks of kBlockBytes, each producing 1 KiB of
// text appended to a pre-sized output.
constexpr size_t kBlockBytes = 768;

[[nodiscard]] constexpr size_t encodedSize(size_t n) noexcept {
  return ((n + 2) / 3) * 4;
}

[[nodiscard]] std::string encode(std::span<const uint8_t> bytes);

// Accepts bare base64 or a data URI ("data:<mime>;base64,<payload>").
[[nodiscard]] std::expected<Bytes, TransferError> decode(std::string_view text);

// Returns the payload part of a data URI, or text unchanged when it has
// no header. Fails when a header is present without the ";base64" marker.
[[nodiscard]] std::expected<std::string_view, TransferError> stripDataUri(
    std::string_view text);

}  // namespace base64

}  // namespace chunkline::transfer
