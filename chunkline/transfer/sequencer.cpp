#include "sequencer.hpp"

#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <string>
#include <utility>

#include "base64.hpp"
#include "chunk_id.hpp"
#include "chunker.hpp"
#include "envelope.hpp"

namespace chunkline::transfer {

std::string_view toString(ChunkedTransfer::State state) noexcept {
  switch (state) {
    case ChunkedTransfer::State::kIdle:
      return "Idle";
    case ChunkedTransfer::State::kSending:
      return "Sending";
    case ChunkedTransfer::State::kCompleted:
      return "Completed";
    case ChunkedTransfer::State::kFailed:
      return "Failed";
  }
  return "Unknown";
}

ChunkedTransfer::ChunkedTransfer(http::IHttpClient& client, std::string target,
                                 std::string bearer_token,
                                 NormalizedPayload payload,
                                 TransferConfig config, DelayFn delay)
    : client_(client),
      target_(std::move(target)),
      bearer_token_(std::move(bearer_token)),
      payload_(std::move(payload)),
      config_(std::move(config)),
      delay_(std::move(delay)),
      self_(std::make_shared<ChunkedTransfer*>(this)) {}

ChunkedTransfer::~ChunkedTransfer() {
  if (state_ == State::kSending) {
    TTL_LOG(Info) << "Transfer " << chunk_id_ << " dropped at chunk "
                  << (current_ + 1) << "/" << total_;
  }
  self_.reset();
}

void ChunkedTransfer::start() {
  if (state_ != State::kIdle) {
    TTL_LOG(Error) << "start() in state " << toString(state_);
    return;
  }

  state_      = State::kSending;
  started_at_ = std::chrono::steady_clock::now();

  if (auto valid = config_.validate(); !valid) {
    fail(std::move(valid.error()));
    return;
  }
  chunk_size_ = config_.chunkSize();
  total_      = Chunker(payload_.bytes, chunk_size_).count();
  current_    = 0;

  auto id = makeChunkId();
  if (!id.has_value()) {
    TransferError err = makeError(ErrorKind::kEncoding, "no chunk id");
    err.code          = errno;
    fail(std::move(err));
    return;
  }
  chunk_id_ = std::move(*id);

  TTL_LOG(Info) << "Transfer " << chunk_id_ << " -> " << target_ << " : "
                << payload_.bytes.size() << " bytes, " << total_
                << " chunk(s) of " << chunk_size_
                << (payload_.is_binary ? ", binary" : ", json");

  sendChunk(0);
}

void ChunkedTransfer::cancel() {
  if (state_ == State::kCompleted || state_ == State::kFailed) {
    return;
  }
  if (state_ == State::kIdle) {
    TTL_LOG(Info) << "Transfer cancelled before start";
    TransferError err = makeError(ErrorKind::kCancelled, "");
    err.code          = ECANCELED;
    fail(std::move(err));
    return;
  }
  TTL_LOG(Info) << "Transfer " << chunk_id_ << " cancelled at chunk "
                << (current_ + 1) << "/" << total_;
  TransferError err = chunkError(ErrorKind::kCancelled, current_);
  err.code          = ECANCELED;
  fail(std::move(err));
}

void ChunkedTransfer::sendChunk(size_t index) {
  if (state_ != State::kSending) {
    return;
  }
  if (index >= total_) {
    TransferError err = chunkError(ErrorKind::kIncompleteTransfer, index);
    err.detail        = "no response for the final chunk";
    fail(std::move(err));
    return;
  }
  current_ = index;

  const auto slice = Chunker(payload_.bytes, chunk_size_).slice(index);

  ChunkEnvelope envelope;
  envelope.chunk_id     = chunk_id_;
  envelope.chunk_index  = index;
  envelope.total_chunks = total_;
  envelope.chunk_data   = base64::encode(slice);
  envelope.is_binary    = payload_.is_binary;

  auto body = encodeEnvelope(envelope);
  if (!body) {
    TransferError err = std::move(body.error());
    err.chunk_index   = index;
    err.total_chunks  = total_;
    fail(std::move(err));
    return;
  }

  TTL_LOG(Debug) << "Transfer " << chunk_id_ << " : chunk " << (index + 1) << "/"
                 << total_ << ", " << slice.size() << " bytes ("
                 << (index * 100 / total_) << "% done)";

  http::HttpRequest request;
  request.method  = "POST";
  request.target  = target_;
  request.headers = http::jsonHeaders(bearer_token_);
  request.body    = std::move(*body);

  std::weak_ptr<ChunkedTransfer*> weak = self_;
  client_.send(
      std::move(request),
      [weak, index](http::HttpResponse response) {
        if (auto self = weak.lock()) {
          (*self)->onResponse(index, std::move(response));
        }
      },
      [weak, index](int err) {
        if (auto self = weak.lock()) {
          (*self)->onTransportFailure(index, err);
        }
      });
}

void ChunkedTransfer::onResponse(size_t index, http::HttpResponse response) {
  if (state_ != State::kSending || index != current_) {
    TTL_LOG(Debug) << "Transfer " << chunk_id_ << " : stale response for chunk "
                   << (index + 1) << " ignored";
    return;
  }

  if (!response.ok()) {
    TransferError err = chunkError(ErrorKind::kChunkTransmission, index);
    err.status        = response.status;
    err.detail        = response.reason;
    const std::string body = describeErrorBody(response.body);
    if (!body.empty()) {
      err.detail += err.detail.empty() ? body : ", " + body;
    }
    fail(std::move(err));
    return;
  }

  if (index + 1 == total_) {
    // An ack for the last chunk means the receiver is still missing some.
    if (auto ack = parseAck(response.body); ack && ack->received < ack->total) {
      TransferError err = chunkError(ErrorKind::kIncompleteTransfer, index);
      err.detail = "receiver has " + std::to_string(ack->received) + " of " +
                   std::to_string(ack->total) + " chunks";
      fail(std::move(err));
      return;
    }
    complete(std::move(response));
    return;
  }

  auto ack = parseAck(response.body);
  if (!ack) {
    TransferError err = std::move(ack.error());
    err.chunk_index   = index;
    err.total_chunks  = total_;
    fail(std::move(err));
    return;
  }
  TTL_LOG(Debug) << "Transfer " << chunk_id_ << " : ack " << ack->received
                 << "/" << ack->total;

  advance(index);
}

void ChunkedTransfer::advance(size_t index) {
  const size_t next = index + 1;
  if (!config_.paceAfter(index, total_)) {
    sendChunk(next);
    return;
  }

  TTL_LOG(Trace) << "Transfer " << chunk_id_ << " : pacing "
                 << config_.pacing_delay.count() << "ms after chunk "
                 << (index + 1);
  std::weak_ptr<ChunkedTransfer*> weak = self_;
  delay_(config_.pacing_delay, [weak, next]() {
    if (auto self = weak.lock()) {
      (*self)->sendChunk(next);
    }
  });
}

void ChunkedTransfer::onTransportFailure(size_t index, int err) {
  if (state_ != State::kSending || index != current_) {
    return;
  }
  TransferError error = chunkError(ErrorKind::kChunkTransmission, index);
  error.code          = err;
  fail(std::move(error));
}

void ChunkedTransfer::complete(http::HttpResponse response) {
  state_ = State::kCompleted;
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at_);
  TTL_LOG(Info) << "Transfer " << chunk_id_ << " completed : " << total_
                << " chunk(s), HTTP " << response.status << ", "
                << elapsed.count() << "ms";

  CompletedCallback cb = std::move(on_completed_);
  cb(std::move(response));
}

void ChunkedTransfer::fail(TransferError err) {
  state_ = State::kFailed;
  TTL_LOG(Error) << "Transfer " << chunk_id_ << " failed : " << err.describe();

  FailedCallback cb = std::move(on_failure_);
  cb(std::move(err));
}

TransferError ChunkedTransfer::chunkError(ErrorKind kind, size_t index) const {
  TransferError err{.kind = kind};
  err.chunk_index  = index;
  err.total_chunks = total_;
  return err;
}

}  // namespace chunkline::transfer
