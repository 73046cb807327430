#include "chunker.hpp"

#include <algorithm>

namespace chunkline::transfer {

std::span<const uint8_t> Chunker::slice(size_t i) const noexcept {
  if (i >= count()) {
    return {};
  }
  const size_t begin = i * chunk_size_;
  const size_t end   = std::min(begin + chunk_size_, bytes_.size());
  return bytes_.subspan(begin, end - begin);
}

std::vector<std::span<const uint8_t>> Chunker::split() const {
  std::vector<std::span<const uint8_t>> out;
  out.reserve(count());
  for (size_t i = 0; i < count(); ++i) {
    out.push_back(slice(i));
  }
  return out;
}

}  // namespace chunkline::transfer
