#include "chunk_id.hpp"

#include <sys/random.h>

#include <array>
#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <cstdint>
#include <string_view>

namespace chunkline::transfer {

namespace {

constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";

bool fillRandom(void* dst, size_t n) {
  auto* p = static_cast<uint8_t*>(dst);
  while (n > 0) {
    const ssize_t got = ::getrandom(p, n, 0);
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      TTL_LOG(Error) << "getrandom() : ERR = " << errno;
      return false;
    }
    p += got;
    n -= static_cast<size_t>(got);
  }
  return true;
}

}  // namespace

std::optional<std::string> makeChunkId(std::chrono::system_clock::time_point now) {
  std::array<uint8_t, kChunkIdSuffixLength> noise{};
  if (!fillRandom(noise.data(), noise.size())) {
    return std::nullopt;
  }

  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
          .count();

  std::string id = "chunk_" + std::to_string(ms) + "_";
  // Bytes >= 252 (7 * 36) are redrawn so digits stay uniform.
  for (uint8_t b : noise) {
    while (b >= 252) {
      if (!fillRandom(&b, 1)) {
        return std::nullopt;
      }
    }
    id.push_back(kBase36[b % 36]);
  }
  return id;
}

}  // namespace chunkline::transfer
