#include "http_client.hpp"

#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <utility>

#include <chunkline/transport/conveyor.hpp>
#include <chunkline/transport/event_watcher/timer.hpp>
#include <chunkline/transport/tcp/tcp_dialer.hpp>

#include "http_codec.hpp"

namespace chunkline::http {

namespace detail {

class Exchange {
public:
  Exchange(HttpClient& owner, uint64_t id, HttpRequest request,
           ResponseCallback on_response, FailureCallback on_failure)
      : owner_(owner),
        id_(id),
        request_(std::move(request)),
        on_response_(std::move(on_response)),
        on_failure_(std::move(on_failure)),
        dialer_(owner.endpoint_, owner.ew_),
        timer_(owner.ew_) {}

  void start() {
    dialer_.onConnected(
        [this](std::unique_ptr<ITransport> transport) {
          onConnected(std::move(transport));
        });
    dialer_.onFailure([this](int err) { onFailure(err); });

    if (!timer_.arm(owner_.timeout_, [this]() {
          TTL_LOG(Error) << "Exchange #" << id_ << " timed out after "
                         << owner_.timeout_.count() << "ms";
          dialer_.cancel();
          onFailure(ETIMEDOUT);
        })) {
      onFailure(errno);
      return;
    }

    dialer_.dial();
  }

  void onResponse(HttpResponse response) {
    if (done_) {
      return;
    }
    done_ = true;
    timer_.disarm();
    TTL_LOG(Debug) << "Exchange #" << id_ << " : HTTP " << response.status
                   << ", " << response.body.size() << " bytes";

    ResponseCallback cb = std::move(on_response_);
    owner_.release(id_);
    cb(std::move(response));
  }

  void onFailure(int err) {
    if (done_) {
      return;
    }
    done_ = true;
    timer_.disarm();
    TTL_LOG(Error) << "Exchange #" << id_ << " to " << owner_.endpoint_
                   << " failed : ERR = " << err;

    FailureCallback cb = std::move(on_failure_);
    owner_.release(id_);
    cb(err);
  }

private:
  void onConnected(std::unique_ptr<ITransport> transport);

  HttpClient& owner_;
  uint64_t id_;
  HttpRequest request_;
  ResponseCallback on_response_;
  FailureCallback on_failure_;

  TcpDialer dialer_;
  io::Timer timer_;
  std::unique_ptr<ITransport> transport_;
  bool done_ = false;
};

}  // namespace detail

namespace {

// Head of the pipeline: hands encoded bytes to the socket.
struct SocketWriter {
  void onOutbound(StageContext& ctx, OutboundBytes& evt) /*NOLINT*/ {
    if (ctx.transport().write(evt.buf) < 0) {
      ctx.failure(EIO);
    }
  }
};

// Tail of the pipeline: delivers the decoded response to the exchange.
struct ResponseSink {
  detail::Exchange* exchange;

  void onInbound(StageContext& /*ctx*/, InboundHttpResponse& evt) /*NOLINT*/ {
    exchange->onResponse(std::move(evt.response));
  }

  void onInbound(StageContext& /*ctx*/, InboundTransportError& evt) /*NOLINT*/ {
    exchange->onFailure(evt.err);
  }

  void onInbound(StageContext& /*ctx*/,
                 InboundTransportInactive& /*evt*/) /*NOLINT*/ {
    // Ignored once a response has been delivered.
    exchange->onFailure(ECONNRESET);
  }
};

}  // namespace

void detail::Exchange::onConnected(std::unique_ptr<ITransport> transport) {
  if (done_) {
    return;
  }
  transport_ = std::move(transport);
  TTL_LOG(Debug) << "Exchange #" << id_ << " connected "
                 << transport_->selfEndpoint() << " -> "
                 << transport_->otherEndpoint();

  auto& pipeline = transport_->pipeline();
  pipeline.addLast<SocketWriter>();
  pipeline.addLast<HttpCodec>(HttpCodec::Role::kClient);
  pipeline.addLast<ResponseSink>(ResponseSink{this});

  transport_->readableStateChanged(true);

  OutboundHttpRequest evt{std::move(request_)};
  pipeline.fireOutbound(evt);
}

HttpClient::HttpClient(std::string endpoint, io::EventWatcher& ew,
                       std::chrono::milliseconds timeout)
    : HttpClient(endpoint, endpoint, ew, timeout) {}

HttpClient::HttpClient(std::string host, std::string endpoint,
                       io::EventWatcher& ew, std::chrono::milliseconds timeout)
    : host_(std::move(host)),
      endpoint_(std::move(endpoint)),
      ew_(ew),
      timeout_(timeout),
      self_(std::make_shared<HttpClient*>(this)) {}

HttpClient::~HttpClient() {
  self_.reset();
}

void HttpClient::send(HttpRequest request, ResponseCallback on_response,
                      FailureCallback on_failure) {
  setHeader(request.headers, "Host", host_);
  setHeader(request.headers, "Connection", "close");

  const uint64_t id = next_id_++;
  TTL_LOG(Debug) << "send(#" << id << ", " << request.method << " "
                 << request.target << ", " << request.body.size()
                 << " bytes) -> " << host_ << " (" << endpoint_ << ")";

  auto exchange = std::make_unique<detail::Exchange>(
      *this, id, std::move(request), std::move(on_response),
      std::move(on_failure));
  exchanges_.emplace(id, std::move(exchange));

  // Dial failures are reported from dial() itself, so the exchange starts
  // on a later iteration and no callback runs inside send().
  ew_.defer([weak = std::weak_ptr<HttpClient*>(self_), id]() {
    if (auto self = weak.lock()) {
      if (auto it = (*self)->exchanges_.find(id); it != (*self)->exchanges_.end()) {
        it->second->start();
      }
    }
  });
}

void HttpClient::release(uint64_t id) {
  ew_.defer([weak = std::weak_ptr<HttpClient*>(self_), id]() {
    if (auto self = weak.lock()) {
      (*self)->exchanges_.erase(id);
    }
  });
}

}  // namespace chunkline::http
