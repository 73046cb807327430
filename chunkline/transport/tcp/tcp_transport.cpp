#include "tcp_transport.hpp"
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <vector>

TcpTransport::TcpTransport(int fd, EventWatcher* ew)
    : AbstractEventLoopTransport(fd, ew) {}

int TcpTransport::readSome(ByteBuf& dst, size_t max_bytes) {
  if (!dst.reserve(max_bytes)) {
    return -ENOMEM;
  }

  // recv straight into the tailroom, then commit what arrived.
  auto iov = dst.tailroom<std::vector<iovec>>();
  if (iov.empty()) {
    return -ENOMEM;
  }
  iov.front().iov_len = std::min(iov.front().iov_len, max_bytes);

  const ssize_t n = ::readv(fd_, iov.data(), 1);

  if (n > 0) {
    dst.commit(static_cast<size_t>(n));
    return static_cast<int>(n);
  }

  if (n == 0) {
    return 0;
  }

  return -errno;
}

int TcpTransport::writeSome(ByteBuf& src, size_t max_bytes) {
  const size_t tail = src.readableBytes();
  if (tail == 0) {
    return 0;
  }

  auto iov = src.headroom<std::vector<iovec>>();
  if (iov.empty()) {
    return 0;
  }
  size_t remaining = std::min(tail, max_bytes);
  size_t count     = 0;
  for (auto& entry : iov) {
    if (remaining == 0) {
      break;
    }
    entry.iov_len = std::min(entry.iov_len, remaining);
    remaining -= entry.iov_len;
    ++count;
  }
  iov.resize(count);

  // MSG_NOSIGNAL keeps a reset peer from raising SIGPIPE.
  msghdr msg{};
  msg.msg_iov    = iov.data();
  msg.msg_iovlen = iov.size();
  const ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);

  if (n > 0) {
    src.advance(static_cast<size_t>(n));
    return static_cast<int>(n);
  }

  if (n == 0) {
    return 0;
  }

  return -errno;
}
