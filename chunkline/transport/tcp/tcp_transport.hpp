#pragma once
#include <chunkline/transport/abstract_transport.hpp>

class TcpTransport : public AbstractEventLoopTransport {
  using EventWatcher = chunkline::io::EventWatcher;

public:
  explicit TcpTransport(int fd, EventWatcher* ew);
  ~TcpTransport() override = default;

protected:
  int readSome(ByteBuf& dst, size_t max_bytes) override;
  int writeSome(ByteBuf& src, size_t max_bytes) override;
};
