#pragma once
#include <sys/uio.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

// ByteBuf is a sequential stream buffer for I/O.
// Readable bytes live in [r_, w_), tailroom in [w_, data_.size()).
class ByteBuf {
public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  ByteBuf() = default;

  // Returns total readable bytes.
  [[nodiscard]] size_t readableBytes() const noexcept;

  // Returns currently reserved writable bytes (no new allocation).
  [[nodiscard]] size_t writableBytes() const noexcept;

  // Moves up to n readable bytes into out (replacing its contents).
  size_t readString(std::string& out, size_t n);

  // Best-effort peek:
  // Copies up to n bytes into dst, no state change.
  size_t peek(void* dst, size_t n) const noexcept;

  // Offset of the first occurrence of needle within the readable bytes,
  // or npos.
  [[nodiscard]] size_t find(std::string_view needle) const noexcept;

  // Appends raw bytes to the tail; grows the buffer.
  // Returns false on allocation failure.
  bool write(const void* src, size_t n) noexcept;

  bool write(std::string_view text) noexcept {
    return write(text.data(), text.size());
  }

  // Transfer n bytes from src.
  // Transfers up to n bytes (min(n, src.readableBytes())).
  void write(ByteBuf&& src, size_t n) noexcept;

  // Reserve n writable bytes. Consumed head space is reclaimed before
  // the buffer grows.
  // Returns false on allocation failure.
  bool reserve(size_t n) noexcept;

  // View of available writable bytes (tailroom) for readv.
  // Does not allocate; caller must reserve() first.
  // Valid until the buffer is mutated.
  template <typename T>
  T tailroom() noexcept;

  // View of available readable bytes (headroom) for writev.
  // Valid until the buffer is mutated.
  template <typename T>
  T headroom() noexcept;

  // Drop up to n readable bytes from the head.
  // Returns bytes dropped (<= n).
  size_t advance(size_t n);

  // Make up to n bytes from tailroom readable.
  // Returns bytes committed (<= n).
  size_t commit(size_t n);

private:
  void compact() noexcept;

  size_t r_ = 0;
  size_t w_ = 0;
  std::vector<uint8_t> data_;
};

inline size_t ByteBuf::readableBytes() const noexcept {
  return w_ - r_;
}

inline size_t ByteBuf::writableBytes() const noexcept {
  return data_.size() - w_;
}

inline size_t ByteBuf::readString(std::string& out, size_t n) {
  const size_t m = std::min(n, readableBytes());
  out.assign(reinterpret_cast<const char*>(data_.data() + r_), m);
  advance(m);
  return m;
}

inline size_t ByteBuf::peek(void* dst, size_t n) const noexcept {
  const size_t m = std::min(n, readableBytes());
  if (m == 0) {
    return 0;
  }
  std::memcpy(dst, data_.data() + r_, m);
  return m;
}

inline size_t ByteBuf::find(std::string_view needle) const noexcept {
  if (needle.empty() || readableBytes() < needle.size()) {
    return npos;
  }
  const std::string_view hay(reinterpret_cast<const char*>(data_.data() + r_),
                             readableBytes());
  const size_t pos = hay.find(needle);
  return pos == std::string_view::npos ? npos : pos;
}

inline bool ByteBuf::write(const void* src, size_t n) noexcept {
  if (n == 0) {
    return true;
  }
  if (!reserve(n)) {
    return false;
  }

  std::memcpy(data_.data() + w_, src, n);
  w_ += n;
  return true;
}

inline void ByteBuf::write(ByteBuf&& src, size_t n) noexcept {
  const size_t m = std::min(n, src.readableBytes());
  if (m == 0 || !reserve(m)) {
    return;
  }

  std::memcpy(data_.data() + w_, src.data_.data() + src.r_, m);
  w_ += m;
  src.advance(m);
}

inline void ByteBuf::compact() noexcept {
  if (r_ == 0) {
    return;
  }
  const size_t live = readableBytes();
  if (live > 0) {
    std::memmove(data_.data(), data_.data() + r_, live);
  }
  r_ = 0;
  w_ = live;
}

inline bool ByteBuf::reserve(size_t n) noexcept {
  if (writableBytes() >= n) {
    return true;
  }

  compact();
  if (writableBytes() >= n) {
    return true;
  }

  try {
    data_.resize(w_ + n);
    return true;
  } catch (...) {
    return false;
  }
}

inline size_t ByteBuf::advance(size_t n) {
  const size_t m = std::min(n, readableBytes());
  r_ += m;
  if (r_ == w_) {
    r_ = w_ = 0;
  }
  return m;
}

inline size_t ByteBuf::commit(size_t n) {
  const size_t m = std::min(n, writableBytes());
  w_ += m;
  return m;
}

template <>
inline std::vector<iovec> ByteBuf::tailroom<std::vector<iovec>>() noexcept {
  std::vector<iovec> out;
  const size_t n = writableBytes();
  if (n == 0) {
    return out;
  }

  iovec v{};
  v.iov_base = static_cast<void*>(data_.data() + w_);
  v.iov_len  = n;

  out.push_back(v);
  return out;
}

template <>
inline std::vector<iovec> ByteBuf::headroom<std::vector<iovec>>() noexcept {
  std::vector<iovec> out;
  const size_t n = readableBytes();
  if (n == 0) {
    return out;
  }

  iovec v{};
  v.iov_base = static_cast<void*>(data_.data() + r_);
  v.iov_len  = n;

  out.push_back(v);
  return out;
}
