#include "tcp_listener.hpp"
#include "tcp_transport.hpp"

#include <unistd.h>

#include <cerrno>

#include "bits/util.hpp"
#include "bits/ttl/logger.hpp"

using chunkline::io::RDONLY;

namespace {
constexpr int kMaxAcceptsPerWakeup = 256;
}  // namespace

TcpListener::TcpListener(const std::string& address,
                         EventWatcher& ew)
    : address_(address), ew_(ew) {}

TcpListener::~TcpListener() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
}

void TcpListener::abortListen(int err) {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  ew_.runInEventWatcherLoop([this, err]() {
    on_failure_(err);
    shutdown_latch_.count_down();
  });
  shutdown_latch_.wait();
}

void TcpListener::listenAndWait() {
  TTL_LOG(Debug) << "listenAndWait(" << address_ << ")";

  auto parsed = bits::parseAddress(address_);
  if (!parsed) {
    TTL_LOG(Error) << "parseAddress(" << address_ << ") : ERR = " << EINVAL;
    abortListen(EINVAL);
    return;
  }

  listen_fd_ = bits::makeSockTcp();
  if (listen_fd_ < 0) {
    const int err = errno;
    TTL_LOG(Error) << "makeSockTcp() : ERR = " << err;
    abortListen(err);
    return;
  }
  TTL_LOG(Debug) << "makeSockTcp() : OK = " << listen_fd_;

  if (bits::setSockOptNonBlocking(listen_fd_) < 0) {
    const int err = errno;
    TTL_LOG(Error) << "setSockOptNonBlocking(" << listen_fd_ << ") : ERR = " << err;
    abortListen(err);
    return;
  }

  bits::setSockOptShared(listen_fd_);

  if (bits::sockBind(listen_fd_, parsed->second, parsed->first) < 0) {
    const int err = errno;
    TTL_LOG(Error) << "sockBind(" << listen_fd_ << ") : ERR = " << err;
    abortListen(err);
    return;
  }

  if (bits::sockListen(listen_fd_) < 0) {
    const int err = errno;
    TTL_LOG(Error) << "sockListen(" << listen_fd_ << ") : ERR = " << err;
    abortListen(err);
    return;
  }

  const auto bound = bits::getSockOptHostPort(listen_fd_);
  if (!bound) {
    const int err = errno;
    TTL_LOG(Error) << "getSockOptHostPort(" << listen_fd_ << ") : ERR = " << err;
    abortListen(err);
    return;
  }

  bound_address_ = *bound;
  TTL_LOG(Info) << "Listening on " << bound_address_;

  ew_.runInEventWatcherLoop([this, address = bound_address_]() {
    on_started_(address);
    ew_.watch(listen_fd_, RDONLY, [this]() { onReadable(); });
  });

  shutdown_latch_.wait();
}

void TcpListener::shutdown() {
  ew_.runInEventWatcherLoop([this]() {
    if (listen_fd_ >= 0) {
      ew_.unwatch(listen_fd_, RDONLY);
      ::close(listen_fd_);
      listen_fd_ = -1;
    }
    shutdown_latch_.count_down();
  });
}

void TcpListener::onReadable() {
  TTL_LOG(Trace) << "onReadable()";

  for (int i = 0; i < kMaxAcceptsPerWakeup; ++i) {
    const int client_fd = bits::sockAccept(listen_fd_);

    if (client_fd < 0) {
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err == EAGAIN || err == EWOULDBLOCK) {
        return;
      }
      if (err == EMFILE || err == ENFILE || err == ENOMEM) {
        TTL_LOG(Error) << "sockAccept() : ERR = " << err << " (transient)";
        return;
      }
      TTL_LOG(Error) << "sockAccept() : ERR = " << err;
      on_failure_(err);
      return;
    }

    TTL_LOG(Debug) << "sockAccept() : OK = " << client_fd;
    auto transport = createTransport(client_fd);
    if (transport) {
      on_accepted_(std::move(transport));
    }
  }
}

std::unique_ptr<ITransport> TcpListener::createTransport(int client_fd) {
  if (bits::setSockOptNonBlocking(client_fd) < 0) {
    const int err = errno;
    TTL_LOG(Error) << "setSockOptNonBlocking(" << client_fd << ") : ERR = " << err;
    ::close(client_fd);
    return nullptr;
  }

  return std::make_unique<TcpTransport>(client_fd, &ew_);
}
