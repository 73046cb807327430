#include "dispatcher.hpp"

#include <bits/ttl/logger.hpp>
#include <utility>

#include "envelope.hpp"

namespace chunkline::transfer {

Dispatcher::Dispatcher(http::IHttpClient& client, TransferConfig config,
                       DelayFn delay)
    : client_(client),
      config_(std::move(config)),
      normalizer_(config_.binary_routes),
      delay_(std::move(delay)) {}

Dispatcher::~Dispatcher() {
  if (!transfers_.empty()) {
    TTL_LOG(Info) << "Dispatcher dropping " << transfers_.size()
                  << " unfinished transfer(s)";
  }
}

uint64_t Dispatcher::send(std::string target, std::string bearer_token,
                          Payload payload, CompletedCallback on_completed,
                          FailedCallback on_failure) {
  const uint64_t id = next_id_++;

  if (auto valid = config_.validate(); !valid) {
    TTL_LOG(Error) << "send(#" << id << ", " << target
                   << ") : " << valid.error().describe();
    on_failure(std::move(valid.error()));
    return id;
  }

  if (!normalizer_.isBinaryDestination(target)) {
    auto body = PayloadNormalizer::toJsonText(payload);
    if (!body) {
      on_failure(std::move(body.error()));
      return id;
    }
    if (body->size() <= config_.directLimit()) {
      TTL_LOG(Debug) << "send(#" << id << ", " << target << ") : direct, "
                     << body->size() << " bytes";
      sendDirect(std::move(target), bearer_token, std::move(*body),
                 std::move(on_completed), std::move(on_failure));
      return id;
    }
    TTL_LOG(Info) << "send(#" << id << ", " << target << ") : " << body->size()
                  << " bytes exceeds " << config_.directLimit()
                  << ", sending in chunks";
    NormalizedPayload normalized{.bytes     = Bytes(body->begin(), body->end()),
                                 .is_binary = false};
    startChunked(id, std::move(target), std::move(bearer_token),
                 std::move(normalized), std::move(on_completed),
                 std::move(on_failure));
    return id;
  }

  auto normalized = normalizer_.normalize(target, payload);
  if (!normalized) {
    on_failure(std::move(normalized.error()));
    return id;
  }
  startChunked(id, std::move(target), std::move(bearer_token),
               std::move(*normalized), std::move(on_completed),
               std::move(on_failure));
  return id;
}

void Dispatcher::cancel(uint64_t id) {
  auto it = transfers_.find(id);
  if (it == transfers_.end()) {
    return;
  }
  // The failure callback erases the entry.
  it->second->cancel();
}

namespace {

// A direct send is reported like a single-chunk transfer: index 0 of 1.
TransferError directError(ErrorKind kind) {
  TransferError err{.kind = kind};
  err.chunk_index  = 0;
  err.total_chunks = 1;
  return err;
}

struct DirectSend {
  CompletedCallback on_completed;
  FailedCallback on_failure;
};

}  // namespace

void Dispatcher::sendDirect(std::string target, const std::string& bearer_token,
                            std::string body, CompletedCallback on_completed,
                            FailedCallback on_failure) {
  http::HttpRequest request;
  request.method  = "POST";
  request.target  = std::move(target);
  request.headers = http::jsonHeaders(bearer_token);
  request.body    = std::move(body);

  // Only one of the two handlers runs.
  auto pending = std::make_shared<DirectSend>(
      DirectSend{std::move(on_completed), std::move(on_failure)});

  client_.send(
      std::move(request),
      [pending](http::HttpResponse response) {
        if (response.ok()) {
          pending->on_completed(std::move(response));
          return;
        }
        TransferError err = directError(ErrorKind::kChunkTransmission);
        err.status        = response.status;
        err.detail        = response.reason;
        const std::string body = describeErrorBody(response.body);
        if (!body.empty()) {
          err.detail += err.detail.empty() ? body : ", " + body;
        }
        TTL_LOG(Error) << "Direct send failed : " << err.describe();
        pending->on_failure(std::move(err));
      },
      [pending](int code) {
        TransferError err = directError(ErrorKind::kChunkTransmission);
        err.code          = code;
        TTL_LOG(Error) << "Direct send failed : " << err.describe();
        pending->on_failure(std::move(err));
      });
}

void Dispatcher::startChunked(uint64_t id, std::string target,
                              std::string bearer_token,
                              NormalizedPayload payload,
                              CompletedCallback on_completed,
                              FailedCallback on_failure) {
  auto transfer = std::make_unique<ChunkedTransfer>(
      client_, std::move(target), std::move(bearer_token), std::move(payload),
      config_,
      [this](std::chrono::milliseconds delay, F<void()> cb) {
        delay_(delay, std::move(cb));
      });

  transfer->onCompleted(
      [this, id, cb = std::move(on_completed)](http::HttpResponse response) mutable {
        CompletedCallback done = std::move(cb);
        transfers_.erase(id);
        done(std::move(response));
      });
  transfer->onFailure(
      [this, id, cb = std::move(on_failure)](TransferError err) mutable {
        FailedCallback done = std::move(cb);
        transfers_.erase(id);
        done(std::move(err));
      });

  auto* raw = transfer.get();
  transfers_.emplace(id, std::move(transfer));
  raw->start();
}

void fetchServerConfig(http::IHttpClient& client, std::string target,
                       const std::string& bearer_token, TransferConfig base,
                       ServerConfigCallback done) {
  http::HttpRequest request;
  request.method  = "GET";
  request.target  = std::move(target);
  request.headers = http::jsonHeaders(bearer_token);

  struct Pending {
    TransferConfig config;
    ServerConfigCallback done;
  };
  auto pending =
      std::make_shared<Pending>(Pending{std::move(base), std::move(done)});

  TTL_LOG(Debug) << "fetchServerConfig(" << request.target << ")";
  client.send(
      std::move(request),
      [pending](http::HttpResponse response) {
        if (!response.ok()) {
          TransferError err = makeError(ErrorKind::kInvalidConfig,
                                        describeErrorBody(response.body));
          err.status = response.status;
          pending->done(std::unexpected(std::move(err)));
          return;
        }
        if (auto merged = applyServerConfig(pending->config, response.body);
            !merged) {
          pending->done(std::unexpected(std::move(merged.error())));
          return;
        }
        pending->done(std::move(pending->config));
      },
      [pending](int code) {
        TransferError err = makeError(ErrorKind::kInvalidConfig,
                                      "server config unavailable");
        err.code = code;
        pending->done(std::unexpected(std::move(err)));
      });
}

}  // namespace chunkline::transfer
