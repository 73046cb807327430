#pragma once

#include <functional>

template <typename T>
using F = std::move_only_function<T>;

class Conveyor;
class ByteBuf;

// A connected byte stream with a stage pipeline attached.
// All methods must be called from the event watcher thread.
class ITransport {
 public:
  virtual ~ITransport()                                   = default;
  virtual Conveyor& pipeline() noexcept                   = 0;
  virtual int write(ByteBuf& buf)                         = 0;
  virtual void readableStateChanged(bool)                 = 0;
  virtual void shutdown(int)                              = 0;
  [[nodiscard]] virtual const char* otherEndpoint() const = 0;
  [[nodiscard]] virtual const char* selfEndpoint() const  = 0;
};
