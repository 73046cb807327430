#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

#include <chunkline/transport/http/http_client.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "payload.hpp"
#include "sequencer.hpp"

namespace chunkline::transfer {

// Route of the server settings document on the API origin.
constexpr std::string_view kServerConfigRoute = "/backend/config";

// Entry point for callers: sends a payload either as one ordinary JSON
// POST (serialized size within the direct limit) or as a chunked transfer.
// Binary routes are always chunked. Several sends may be in flight.
class Dispatcher {
public:
  Dispatcher(http::IHttpClient& client, TransferConfig config, DelayFn delay);
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Returns the id of the send, usable with cancel().
  uint64_t send(std::string target, std::string bearer_token, Payload payload,
                CompletedCallback on_completed, FailedCallback on_failure);

  // Cancels a chunked send. Direct sends run to completion.
  void cancel(uint64_t id);

  [[nodiscard]] size_t activeTransfers() const noexcept { return transfers_.size(); }
  [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

private:
  void sendDirect(std::string target, const std::string& bearer_token,
                  std::string body, CompletedCallback on_completed,
                  FailedCallback on_failure);

  void startChunked(uint64_t id, std::string target, std::string bearer_token,
                    NormalizedPayload payload, CompletedCallback on_completed,
                    FailedCallback on_failure);

  http::IHttpClient& client_;
  TransferConfig config_;
  PayloadNormalizer normalizer_;
  DelayFn delay_;

  uint64_t next_id_ = 1;
  std::unordered_map<uint64_t, std::unique_ptr<ChunkedTransfer>> transfers_;
};

using ServerConfigCallback = F<void(std::expected<TransferConfig, TransferError>)>;

// GET target (normally kServerConfigRoute joined to the API base) and
// merge MAX_PAYLOAD_SIZE into base.
void fetchServerConfig(http::IHttpClient& client, std::string target,
                       const std::string& bearer_token, TransferConfig base,
                       ServerConfigCallback done);

}  // namespace chunkline::transfer
