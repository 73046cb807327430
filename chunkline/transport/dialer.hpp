#pragma once
#include <memory>

#include "transport.hpp"

// Exactly one of onConnected / onFailure fires per dial(), unless the
// attempt is cancelled first.
class IDialer {
 public:
  virtual ~IDialer()                                             = default;
  virtual void onFailure(F<void(int)>)                           = 0;
  virtual void onConnected(F<void(std::unique_ptr<ITransport>)>) = 0;
  virtual void dial()                                            = 0;
  virtual void cancel()                                          = 0;
};
