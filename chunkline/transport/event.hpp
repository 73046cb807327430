#pragma once
#include <variant>

#include "byte_buffer.hpp"
#include "http/http_message.hpp"

// Transport lifecycle events
struct InboundTransportInactive {};
struct InboundTransportError {
  int err;
};

// Data events
struct InboundBytes {
  ByteBuf buf;
};

struct OutboundBytes {
  ByteBuf buf;
};

// Message events, produced and consumed by the HTTP codec stage
struct InboundHttpRequest {
  chunkline::http::HttpRequest request;
};

struct InboundHttpResponse {
  chunkline::http::HttpResponse response;
};

struct OutboundHttpRequest {
  chunkline::http::HttpRequest request;
};

struct OutboundHttpResponse {
  chunkline::http::HttpResponse response;
};

using Event =
    std::variant<InboundTransportInactive, InboundTransportError, InboundBytes,
                 OutboundBytes, InboundHttpRequest, InboundHttpResponse,
                 OutboundHttpRequest, OutboundHttpResponse>;
