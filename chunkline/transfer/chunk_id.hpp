#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace chunkline::transfer {

constexpr size_t kChunkIdSuffixLength = 9;

// "chunk_<unix ms>_<9 base36 chars>". The suffix comes from getrandom(2);
// nullopt when the kernel refuses.
[[nodiscard]] std::optional<std::string> makeChunkId(
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

}  // namespace chunkline::transfer
