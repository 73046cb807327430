#pragma once
#include <string>
#include "byte_buffer.hpp"
#include "conveyor.hpp"
#include "event_watcher/event_watcher.hpp"
#include "transport.hpp"

// Socket transport driven by the event watcher. Readable bytes are
// fired into the pipeline as InboundBytes; peer close as
// InboundTransportInactive; socket errors as InboundTransportError.
class AbstractEventLoopTransport : public ITransport {
  using EventWatcher = chunkline::io::EventWatcher;

public:
  explicit AbstractEventLoopTransport(int fd, EventWatcher* ew);
  ~AbstractEventLoopTransport() override;

  Conveyor& pipeline() noexcept override { return pipeline_; }

  int write(ByteBuf& buf) override;
  void readableStateChanged(bool readable) override;
  void shutdown(int how) override;

  [[nodiscard]] const char* otherEndpoint() const override {
    return other_endpoint_.c_str();
  }

  [[nodiscard]] const char* selfEndpoint() const override {
    return self_endpoint_.c_str();
  }

protected:
  // Both return bytes moved, 0 on EOF (read side), or -errno.
  virtual int readSome(ByteBuf& dst, size_t max_bytes)  = 0;
  virtual int writeSome(ByteBuf& src, size_t max_bytes) = 0;

  int fd_;
  std::string self_endpoint_;
  std::string other_endpoint_;

private:
  void onReadable();
  void onWritable();

  Conveyor pipeline_;
  EventWatcher* ew_;

  ByteBuf wbuf_;
  bool reading_ = false;
};
