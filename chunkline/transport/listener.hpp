#pragma once
#include <memory>
#include <string>
#include "transport.hpp"

// onFailure ends the listener. Transient accept errors are logged and
// the listener keeps running.
class IListener {
 public:
  virtual ~IListener()                                          = default;
  virtual void onFailure(F<void(int)>)                          = 0;
  virtual void onAccepted(F<void(std::unique_ptr<ITransport>)>) = 0;
  virtual void onStarted(F<void(const std::string&)>)           = 0;
  virtual void listenAndWait()                                  = 0;
  virtual void shutdown()                                       = 0;
};
