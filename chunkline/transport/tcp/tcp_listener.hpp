#pragma once
#include <latch>
#include <string>
#include <chunkline/transport/listener.hpp>
#include <chunkline/transport/transport.hpp>

#include <chunkline/transport/event_watcher/event_watcher.hpp>

using chunkline::io::EventWatcher;

// Accepts TCP connections on "host:port" (port 0 picks a free one).
// listenAndWait() blocks the calling thread until shutdown(); all
// callbacks run on the event watcher thread.
class TcpListener : public IListener {
 public:
  explicit TcpListener(const std::string& address, EventWatcher& ew);
  ~TcpListener() override;

  void onAccepted(F<void(std::unique_ptr<ITransport>)> cb) override {
    on_accepted_ = std::move(cb);
  }

  void onFailure(F<void(int)> cb) override { on_failure_ = std::move(cb); }

  void onStarted(F<void(const std::string&)> cb) override {
    on_started_ = std::move(cb);
  }

  void listenAndWait() override;
  void shutdown() override;

 private:
  void onReadable();
  void abortListen(int err);
  std::unique_ptr<ITransport> createTransport(int client_fd);

  std::string address_;
  EventWatcher& ew_;
  int listen_fd_ = -1;
  std::string bound_address_;

  F<void(std::unique_ptr<ITransport>)> on_accepted_ = [](auto) {};
  F<void(int)> on_failure_ = [](int) {};
  F<void(const std::string&)> on_started_ = [](const std::string&) {};
  std::latch shutdown_latch_{1};
};
