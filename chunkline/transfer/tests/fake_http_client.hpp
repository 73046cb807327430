#pragma once

#include <chrono>
#include <deque>
#include <string>
#include <utility>
#include <vector>

#include <chunkline/transfer/sequencer.hpp>
#include <chunkline/transport/http/http_client.hpp>

namespace chunkline::test_support {

// Records requests and lets the test answer them one at a time, outside
// of send(), the way a real client answers from a later loop iteration.
class FakeHttpClient : public http::IHttpClient {
public:
  struct Pending {
    http::HttpRequest request;
    http::ResponseCallback on_response;
    http::FailureCallback on_failure;
  };

  void send(http::HttpRequest request, http::ResponseCallback on_response,
            http::FailureCallback on_failure) override {
    sent_.push_back(request);
    pending_.push_back(
        Pending{std::move(request), std::move(on_response), std::move(on_failure)});
  }

  [[nodiscard]] bool hasPending() const { return !pending_.empty(); }
  [[nodiscard]] const std::vector<http::HttpRequest>& sent() const { return sent_; }

  // Answers the oldest outstanding request. Returns false when none is.
  bool respond(int status, std::string body, std::string reason = "OK") {
    if (pending_.empty()) {
      return false;
    }
    Pending p = std::move(pending_.front());
    pending_.pop_front();
    http::HttpResponse response;
    response.status = status;
    response.reason = std::move(reason);
    response.body   = std::move(body);
    p.on_response(std::move(response));
    return true;
  }

  bool fail(int err) {
    if (pending_.empty()) {
      return false;
    }
    Pending p = std::move(pending_.front());
    pending_.pop_front();
    p.on_failure(err);
    return true;
  }

  // Takes the oldest outstanding request without answering it.
  Pending take() {
    Pending p = std::move(pending_.front());
    pending_.pop_front();
    return p;
  }

private:
  std::vector<http::HttpRequest> sent_;
  std::deque<Pending> pending_;
};

// Records requested delays and runs the callback right away.
struct ImmediateDelay {
  std::vector<std::chrono::milliseconds>* delays;

  void operator()(std::chrono::milliseconds delay, F<void()> cb) const {
    delays->push_back(delay);
    cb();
  }
};

// {"status":"chunk_received","received":r,"total":t}
inline std::string ackBody(size_t received, size_t total) {
  return R"({"status":"chunk_received","received":)" + std::to_string(received) +
         R"(,"total":)" + std::to_string(total) + "}";
}

}  // namespace chunkline::test_support
