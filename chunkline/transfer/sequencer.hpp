#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <chunkline/transport/http/http_client.hpp>
#include <chunkline/transport/transport.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "payload.hpp"

namespace chunkline::transfer {

// Schedules cb after delay. Production code binds EventWatcher::runAfter.
using DelayFn = F<void(std::chrono::milliseconds, F<void()>)>;

using CompletedCallback = F<void(http::HttpResponse)>;
using FailedCallback    = F<void(TransferError)>;

// Sends one normalized payload to target as a sequence of chunk
// envelopes, one exchange at a time, and reports the response to the last
// chunk. Intermediate responses must be chunk_received acknowledgments.
//
// Exactly one of onCompleted / onFailure fires, as the last thing the
// transfer does, so the callback may destroy it. Responses that arrive
// after the transfer is destroyed or cancelled are ignored.
class ChunkedTransfer {
public:
  enum class State : uint8_t { kIdle, kSending, kCompleted, kFailed };

  ChunkedTransfer(http::IHttpClient& client, std::string target,
                  std::string bearer_token, NormalizedPayload payload,
                  TransferConfig config, DelayFn delay);
  ~ChunkedTransfer();

  ChunkedTransfer(const ChunkedTransfer&)            = delete;
  ChunkedTransfer& operator=(const ChunkedTransfer&) = delete;

  void onCompleted(CompletedCallback cb) { on_completed_ = std::move(cb); }
  void onFailure(FailedCallback cb) { on_failure_ = std::move(cb); }

  void start();

  // Fails a running transfer with kCancelled. The receiver keeps whatever
  // it has buffered for this chunkId.
  void cancel();

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] const std::string& chunkId() const noexcept { return chunk_id_; }
  [[nodiscard]] size_t totalChunks() const noexcept { return total_; }

  // Index of the chunk in flight (or next to go out).
  [[nodiscard]] size_t currentIndex() const noexcept { return current_; }

private:
  void sendChunk(size_t index);
  void onResponse(size_t index, http::HttpResponse response);
  void onTransportFailure(size_t index, int err);
  void advance(size_t index);

  void complete(http::HttpResponse response);
  void fail(TransferError err);
  [[nodiscard]] TransferError chunkError(ErrorKind kind, size_t index) const;

  http::IHttpClient& client_;
  std::string target_;
  std::string bearer_token_;
  NormalizedPayload payload_;
  TransferConfig config_;
  DelayFn delay_;

  State state_ = State::kIdle;
  std::string chunk_id_;
  size_t chunk_size_ = 0;
  size_t total_      = 0;
  size_t current_    = 0;
  std::chrono::steady_clock::time_point started_at_;

  CompletedCallback on_completed_ = [](http::HttpResponse) {};
  FailedCallback on_failure_      = [](TransferError) {};

  std::shared_ptr<ChunkedTransfer*> self_;
};

[[nodiscard]] std::string_view toString(ChunkedTransfer::State state) noexcept;

}  // namespace chunkline::transfer
