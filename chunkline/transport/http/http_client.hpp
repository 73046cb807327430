#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include <chunkline/transport/event_watcher/event_watcher.hpp>
#include <chunkline/transport/transport.hpp>

#include "http_message.hpp"

namespace chunkline::http {

using ResponseCallback = F<void(HttpResponse)>;
using FailureCallback  = F<void(int)>;

// Request/response exchange over some HTTP transport. Exactly one of the
// callbacks fires per send(); failures carry an errno value. Any status
// code, including 4xx/5xx, is a response, not a failure.
//
// Callbacks never run inside send(). Callers issue the next request from
// a callback, so a synchronous answer would nest one frame per request.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;
  virtual void send(HttpRequest request, ResponseCallback on_response,
                    FailureCallback on_failure) = 0;
};

namespace detail {
class Exchange;
}  // namespace detail

// HTTP/1.1 client for one origin. Every send() opens its own connection
// (Connection: close) to endpoint, a numeric "ip:port", and is bounded by
// the exchange timeout, which covers connect, upload and download. The
// Host header carries host, the name the origin is known by. Runs
// entirely on the event watcher thread.
class HttpClient : public IHttpClient {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{120000};

  // Host is the endpoint itself.
  HttpClient(std::string endpoint, io::EventWatcher& ew,
             std::chrono::milliseconds timeout = kDefaultTimeout);

  HttpClient(std::string host, std::string endpoint, io::EventWatcher& ew,
             std::chrono::milliseconds timeout = kDefaultTimeout);
  ~HttpClient() override;

  HttpClient(const HttpClient&)            = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  void send(HttpRequest request, ResponseCallback on_response,
            FailureCallback on_failure) override;

  [[nodiscard]] size_t inflight() const noexcept { return exchanges_.size(); }

  [[nodiscard]] const std::string& host() const noexcept { return host_; }
  [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

 private:
  friend class detail::Exchange;

  // Releases the exchange on a later loop iteration; it may still be on
  // the stack when it finishes.
  void release(uint64_t id);

  std::string host_;
  std::string endpoint_;
  io::EventWatcher& ew_;
  std::chrono::milliseconds timeout_;

  uint64_t next_id_ = 1;
  std::unordered_map<uint64_t, std::unique_ptr<detail::Exchange>> exchanges_;
  std::shared_ptr<HttpClient*> self_;
};

}  // namespace chunkline::http
