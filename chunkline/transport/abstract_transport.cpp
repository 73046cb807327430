#include "abstract_transport.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <bits/ttl/logger.hpp>
#include <bits/util.hpp>
#include <cerrno>
#include "event.hpp"

using namespace chunkline::io;

namespace {
constexpr size_t kReadChunk          = 16 * 1024;
constexpr int kMaxReadsPerWakeup     = 64;
constexpr int kMaxWritesPerWakeup    = 256;
}  // namespace

AbstractEventLoopTransport::AbstractEventLoopTransport(int fd, EventWatcher* ew)
    : fd_(fd),
      self_endpoint_(bits::getSockOptHostPort(fd).value_or("?")),
      other_endpoint_(bits::getPeerHostPort(fd).value_or("?")),
      pipeline_(this),
      ew_(ew) {}

AbstractEventLoopTransport::~AbstractEventLoopTransport() {
  ew_->unwatch(fd_, WatchFlag::RDONLY);
  ew_->unwatch(fd_, WatchFlag::WRONLY);
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void AbstractEventLoopTransport::onReadable() {
  TTL_LOG(Trace) << "onReadable() : fd=" << fd_;

  ByteBuf buf{};
  int n = 0;
  for (int i = 0; i < kMaxReadsPerWakeup; ++i) {
    n = readSome(buf, kReadChunk);
    if (n <= 0) {
      break;
    }
    TTL_LOG(Trace) << "readSome(*, " << kReadChunk << ") : OK = " << n;
  }

  if (buf.readableBytes() > 0) {
    TTL_LOG(Debug) << "fireInbound(InboundBytes) : " << buf.readableBytes()
                   << " bytes";
    InboundBytes evt{std::move(buf)};
    pipeline_.fireInbound(evt);
  }

  if (n > 0 || n == -EAGAIN || n == -EWOULDBLOCK) {
    return;
  }

  // EOF and hard errors both end the read side; level-triggered epoll
  // would otherwise report the fd forever.
  readableStateChanged(false);

  if (n == 0) {
    TTL_LOG(Info) << "Connection closed by peer fd=" << fd_;
    InboundTransportInactive evt;
    pipeline_.fireInbound(evt);
    return;
  }

  TTL_LOG(Error) << "readSome() : ERR = " << -n;
  InboundTransportError evt{-n};
  pipeline_.fireInbound(evt);
}

void AbstractEventLoopTransport::onWritable() {
  TTL_LOG(Trace) << "onWritable() fd=" << fd_
                 << " wbuf_size=" << wbuf_.readableBytes();

  for (int i = 0; i < kMaxWritesPerWakeup && wbuf_.readableBytes() > 0; ++i) {
    const int written = writeSome(wbuf_, wbuf_.readableBytes());

    if (written > 0) {
      TTL_LOG(Trace) << "writeSome() : " << written << " bytes";
      continue;
    }

    if (written == -EAGAIN || written == -EWOULDBLOCK) {
      TTL_LOG(Trace) << "writeSome() : EAGAIN";
      return;
    }

    if (written < 0) {
      TTL_LOG(Error) << "writeSome() : ERR = " << -written;
      ew_->unwatch(fd_, WatchFlag::WRONLY);
      InboundTransportError evt{-written};
      pipeline_.fireInbound(evt);
      return;
    }
  }

  if (wbuf_.readableBytes() > 0) {
    // Budget exhausted; stay subscribed.
    return;
  }

  TTL_LOG(Debug) << "Write buffer empty, unwatching WRONLY fd=" << fd_;
  ew_->unwatch(fd_, WatchFlag::WRONLY);
}

int AbstractEventLoopTransport::write(ByteBuf& buf) {
  if (buf.readableBytes() == 0) {
    return 0;
  }

  const size_t size = buf.readableBytes();
  TTL_LOG(Debug) << "write() fd=" << fd_ << " bytes=" << size;

  wbuf_.write(std::move(buf), size);
  ew_->watch(fd_, WatchFlag::WRONLY, [this]() { this->onWritable(); });

  return static_cast<int>(size);
}

void AbstractEventLoopTransport::readableStateChanged(bool readable) {
  if (readable == reading_) {
    return;
  }
  TTL_LOG(Debug) << "readableStateChanged(" << readable << ") fd=" << fd_;
  reading_ = readable;

  if (readable) {
    ew_->watch(fd_, WatchFlag::RDONLY, [this]() { this->onReadable(); });
  } else {
    ew_->unwatch(fd_, WatchFlag::RDONLY);
  }
}

void AbstractEventLoopTransport::shutdown(int how) {
  if (::shutdown(fd_, how) < 0) {
    TTL_LOG(Debug) << "shutdown(" << fd_ << ", " << how
                   << ") : ERR = " << errno;
  }
}
