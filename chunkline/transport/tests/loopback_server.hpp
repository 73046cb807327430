#pragma once

#include <bits/queue.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <chunkline/transport/conveyor.hpp>
#include <chunkline/transport/event_watcher/event_watcher.hpp>
#include <chunkline/transport/http/http_codec.hpp>
#include <chunkline/transport/tcp/tcp_listener.hpp>

namespace chunkline::test_support {

// HTTP server on 127.0.0.1:<ephemeral> sharing the test's event watcher.
// The test thread drives ew.loop(); the listener blocks its own thread.
class LoopbackHttpServer {
public:
  using Handler = std::function<std::optional<http::HttpResponse>(
      const http::HttpRequest&)>;

  // A handler returning nullopt leaves the request unanswered.
  LoopbackHttpServer(io::EventWatcher& ew, Handler handler)
      : ew_(ew), listener_("127.0.0.1:0", ew), handler_(std::move(handler)) {
    listener_.onStarted(
        [this](const std::string& address) { started_q_.push(address); });
    listener_.onAccepted([this](std::unique_ptr<ITransport> transport) {
      accept(std::move(transport));
    });
  }

  ~LoopbackHttpServer() {
    connections_.clear();
    listener_.shutdown();
    for (int i = 0; i < 10; ++i) {
      ew_.loop(10);
    }
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  // Returns the bound "127.0.0.1:port", or nullopt on deadline.
  std::optional<std::string> start() {
    thread_ = std::thread([this]() { listener_.listenAndWait(); });
    std::optional<std::string> address;
    for (int i = 0; i < 100 && !address.has_value(); ++i) {
      ew_.loop(10);
      address = started_q_.tryPop();
    }
    return address;
  }

  [[nodiscard]] const std::vector<http::HttpRequest>& requests() const {
    return requests_;
  }

  [[nodiscard]] size_t connections() const { return connections_.size(); }

private:
  struct SocketWriter {
    void onOutbound(StageContext& ctx, OutboundBytes& evt) {
      ctx.transport().write(evt.buf);
    }
  };

  struct RequestHandler {
    LoopbackHttpServer* server;

    void onInbound(StageContext& ctx, InboundHttpRequest& evt) {
      server->requests_.push_back(evt.request);
      auto response = server->handler_(evt.request);
      if (!response.has_value()) {
        return;
      }
      OutboundHttpResponse out{std::move(*response)};
      ctx.fireOutbound(out);
    }
  };

  void accept(std::unique_ptr<ITransport> transport) {
    auto& pipeline = transport->pipeline();
    pipeline.addLast<SocketWriter>();
    pipeline.addLast<http::HttpCodec>(http::HttpCodec::Role::kServer);
    pipeline.addLast<RequestHandler>(this);
    transport->readableStateChanged(true);
    connections_.push_back(std::move(transport));
  }

  io::EventWatcher& ew_;
  TcpListener listener_;
  Handler handler_;
  bits::MPMCBlockingQueue<std::string> started_q_;
  std::thread thread_;

  std::vector<http::HttpRequest> requests_;
  std::vector<std::unique_ptr<ITransport>> connections_;
};

}  // namespace chunkline::test_support
