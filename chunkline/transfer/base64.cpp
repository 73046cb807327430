#include "base64.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace chunkline::transfer::base64 {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t kInvalid = 0xFF;

constexpr std::array<uint8_t, 256> makeReverse() {
  std::array<uint8_t, 256> table{};
  table.fill(kInvalid);
  for (size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<uint8_t>(i);
  }
  return table;
}

constexpr auto kReverse = makeReverse();

// Writes the encoding of src into dst, which must hold encodedSize(n).
void encodeBlock(const uint8_t* src, size_t n, char* dst) noexcept {
  size_t i = 0;
  for (; i + 3 <= n; i += 3) {
    const uint32_t v = (uint32_t{src[i]} << 16) | (uint32_t{src[i + 1]} << 8) |
                       uint32_t{src[i + 2]};
    *dst++ = kAlphabet[(v >> 18) & 0x3F];
    *dst++ = kAlphabet[(v >> 12) & 0x3F];
    *dst++ = kAlphabet[(v >> 6) & 0x3F];
    *dst++ = kAlphabet[v & 0x3F];
  }

  const size_t rest = n - i;
  if (rest == 1) {
    const uint32_t v = uint32_t{src[i]} << 16;
    *dst++ = kAlphabet[(v >> 18) & 0x3F];
    *dst++ = kAlphabet[(v >> 12) & 0x3F];
    *dst++ = '=';
    *dst++ = '=';
  } else if (rest == 2) {
    const uint32_t v = (uint32_t{src[i]} << 16) | (uint32_t{src[i + 1]} << 8);
    *dst++ = kAlphabet[(v >> 18) & 0x3F];
    *dst++ = kAlphabet[(v >> 12) & 0x3F];
    *dst++ = kAlphabet[(v >> 6) & 0x3F];
    *dst++ = '=';
  }
}

TransferError decodingError(std::string detail) {
  return makeError(ErrorKind::kDecoding, std::move(detail));
}

}  // namespace

std::string encode(std::span<const uint8_t> bytes) {
  std::string out(encodedSize(bytes.size()), '\0');
  char* dst = out.data();
  for (size_t off = 0; off < bytes.size(); off += kBlockBytes) {
    const size_t n = std::min(kBlockBytes, bytes.size() - off);
    encodeBlock(bytes.data() + off, n, dst);
    dst += encodedSize(n);
  }
  return out;
}

std::expected<std::string_view, TransferError> stripDataUri(
    std::string_view text) {
  const size_t comma = text.find(',');
  if (comma == std::string_view::npos) {
    return text;
  }
  const std::string_view header = text.substr(0, comma);
  if (!header.starts_with("data:") || !header.ends_with(";base64")) {
    return std::unexpected(decodingError(
        "malformed data URI header '" + std::string(header.substr(0, 64)) + "'"));
  }
  return text.substr(comma + 1);
}

std::expected<Bytes, TransferError> decode(std::string_view text) {
  auto payload = stripDataUri(text);
  if (!payload) {
    return std::unexpected(std::move(payload.error()));
  }
  const std::string_view in = *payload;

  if (in.size() % 4 != 0) {
    return std::unexpected(decodingError(
        "length " + std::to_string(in.size()) + " is not a multiple of 4"));
  }

  size_t padding = 0;
  if (!in.empty() && in.back() == '=') {
    padding = (in.size() >= 2 && in[in.size() - 2] == '=') ? 2 : 1;
  }

  Bytes out;
  out.reserve((in.size() / 4) * 3 - padding);

  for (size_t i = 0; i < in.size(); i += 4) {
    const bool last = i + 4 == in.size();
    uint32_t v      = 0;
    for (size_t j = 0; j < 4; ++j) {
      const char c = in[i + j];
      if (c == '=' && last && j >= 4 - padding) {
        v <<= 6;
        continue;
      }
      const uint8_t d = kReverse[static_cast<uint8_t>(c)];
      if (d == kInvalid) {
        return std::unexpected(decodingError(
            "invalid character at offset " + std::to_string(i + j)));
      }
      v = (v << 6) | d;
    }

    out.push_back(static_cast<uint8_t>(v >> 16));
    if (!last || padding < 2) {
      out.push_back(static_cast<uint8_t>(v >> 8));
    }
    if (!last || padding < 1) {
      out.push_back(static_cast<uint8_t>(v));
    }
  }
  return out;
}

}  // namespace chunkline::transfer::base64
