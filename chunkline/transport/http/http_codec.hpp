#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <chunkline/transport/byte_buffer.hpp>
#include <chunkline/transport/conveyor.hpp>
#include <chunkline/transport/event.hpp>

#include "http_message.hpp"

namespace chunkline::http {

constexpr size_t kMaxHeaderBytes = 64 * 1024;
constexpr size_t kMaxBodyBytes   = 256 * 1024 * 1024;

// Serializes a message into HTTP/1.1 wire form. Content-Length is always
// rewritten to match the body.
[[nodiscard]] std::string encodeRequest(const HttpRequest& request);
[[nodiscard]] std::string encodeResponse(const HttpResponse& response);

// HTTP/1.1 framing stage.
//
// Client role: OutboundHttpRequest -> OutboundBytes, and
// InboundBytes -> InboundHttpResponse.
// Server role: OutboundHttpResponse -> OutboundBytes, and
// InboundBytes -> InboundHttpRequest.
//
// Bodies are delimited by Content-Length, chunked transfer coding, or
// (responses only) the peer closing the connection. Malformed input and
// oversized heads or bodies are reported with ctx.failure(EPROTO / EMSGSIZE)
// and the stage stops parsing.
class HttpCodec {
public:
  enum class Role : uint8_t { kClient, kServer };

  explicit HttpCodec(Role role, size_t max_body = kMaxBodyBytes)
      : role_(role), max_body_(max_body) {}

  void onOutbound(StageContext& ctx, OutboundHttpRequest& evt);
  void onOutbound(StageContext& ctx, OutboundHttpResponse& evt);

  void onInbound(StageContext& ctx, InboundBytes& evt);
  void onInbound(StageContext& ctx, InboundTransportInactive& evt);

private:
  enum class State : uint8_t {
    kHead,
    kBody,
    kChunkSize,
    kChunkData,
    kTrailers,
    kUntilClose,
    kBroken,
  };

  // Each step returns false when more input is needed.
  bool parseHead(StageContext& ctx);
  bool parseBody(StageContext& ctx);
  bool parseChunkSize(StageContext& ctx);
  bool parseChunkData(StageContext& ctx);
  bool parseTrailers(StageContext& ctx);

  bool appendBody(StageContext& ctx, size_t n);
  void emit(StageContext& ctx);
  void fail(StageContext& ctx, int err);

  Role role_;
  size_t max_body_;

  State state_ = State::kHead;
  ByteBuf in_;
  size_t pending_ = 0;

  HttpRequest request_;
  HttpResponse response_;
};

}  // namespace chunkline::http
