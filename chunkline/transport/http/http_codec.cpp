#include "http_codec.hpp"

#include <algorithm>
#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <charconv>
#include <string_view>
#include <utility>

namespace chunkline::http {

namespace {

constexpr std::string_view kCrlf       = "\r\n";
constexpr std::string_view kHeadEnd    = "\r\n\r\n";
constexpr std::string_view kVersion    = "HTTP/1.1";
constexpr size_t kMaxChunkLineBytes    = 1024;

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

bool parseHeaderLines(std::string_view lines, Headers& out) {
  while (!lines.empty()) {
    const size_t eol       = lines.find(kCrlf);
    const std::string_view line = lines.substr(0, eol);
    lines.remove_prefix(eol == std::string_view::npos ? lines.size()
                                                      : eol + kCrlf.size());
    if (line.empty()) {
      continue;
    }
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0 || line.front() == ' ' ||
        line.front() == '\t') {
      return false;
    }
    out.emplace_back(std::string(line.substr(0, colon)),
                     std::string(trim(line.substr(colon + 1))));
  }
  return true;
}

bool parseStatusLine(std::string_view line, HttpResponse& out) {
  // HTTP/1.x SP 3DIGIT [SP reason]
  if (line.size() < 12 || !line.starts_with("HTTP/1.") || line[8] != ' ') {
    return false;
  }
  int status = 0;
  auto [ptr, ec] = std::from_chars(line.data() + 9, line.data() + 12, status);
  if (ec != std::errc{} || ptr != line.data() + 12 || status < 100 ||
      status > 999) {
    return false;
  }
  out.status = status;
  out.reason = std::string(trim(line.substr(12)));
  return true;
}

bool parseRequestLine(std::string_view line, HttpRequest& out) {
  const size_t sp1 = line.find(' ');
  if (sp1 == std::string_view::npos || sp1 == 0) {
    return false;
  }
  const size_t sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || sp2 == sp1 + 1) {
    return false;
  }
  if (!line.substr(sp2 + 1).starts_with("HTTP/1.")) {
    return false;
  }
  out.method = std::string(line.substr(0, sp1));
  out.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
  return true;
}

bool isChunked(const Headers& headers) {
  const auto te = findHeader(headers, "Transfer-Encoding");
  if (!te) {
    return false;
  }
  // chunked must be the final coding.
  std::string_view value = trim(*te);
  const size_t comma     = value.rfind(',');
  if (comma != std::string_view::npos) {
    value = trim(value.substr(comma + 1));
  }
  return equalsIgnoreCase(value, "chunked");
}

void writeHeaders(std::string& out, const Headers& headers, size_t body_size) {
  for (const auto& [name, value] : headers) {
    out.append(name).append(": ").append(value).append(kCrlf);
  }
  out.append("Content-Length: ").append(std::to_string(body_size)).append(kCrlf);
  out.append(kCrlf);
}

Headers withoutFraming(const Headers& headers) {
  Headers out;
  out.reserve(headers.size());
  for (const auto& header : headers) {
    if (equalsIgnoreCase(header.first, "Content-Length") ||
        equalsIgnoreCase(header.first, "Transfer-Encoding")) {
      continue;
    }
    out.push_back(header);
  }
  return out;
}

}  // namespace

std::string encodeRequest(const HttpRequest& request) {
  std::string out;
  out.reserve(256 + request.body.size());
  out.append(request.method)
      .append(" ")
      .append(request.target.empty() ? "/" : request.target)
      .append(" ")
      .append(kVersion)
      .append(kCrlf);
  writeHeaders(out, withoutFraming(request.headers), request.body.size());
  out.append(request.body);
  return out;
}

std::string encodeResponse(const HttpResponse& response) {
  std::string out;
  out.reserve(256 + response.body.size());
  out.append(kVersion)
      .append(" ")
      .append(std::to_string(response.status))
      .append(" ")
      .append(response.reason.empty() ? "Status" : response.reason)
      .append(kCrlf);
  writeHeaders(out, withoutFraming(response.headers), response.body.size());
  out.append(response.body);
  return out;
}

void HttpCodec::onOutbound(StageContext& ctx, OutboundHttpRequest& evt) {
  const std::string wire = encodeRequest(evt.request);
  TTL_LOG(Debug) << "encodeRequest(" << evt.request.method << " "
                 << evt.request.target << ") : " << wire.size() << " bytes";

  ByteBuf out;
  if (!out.write(wire)) {
    ctx.failure(ENOMEM);
    return;
  }
  OutboundBytes bytes{std::move(out)};
  ctx.fireOutbound(bytes);
}

void HttpCodec::onOutbound(StageContext& ctx, OutboundHttpResponse& evt) {
  const std::string wire = encodeResponse(evt.response);
  TTL_LOG(Debug) << "encodeResponse(" << evt.response.status << ") : "
                 << wire.size() << " bytes";

  ByteBuf out;
  if (!out.write(wire)) {
    ctx.failure(ENOMEM);
    return;
  }
  OutboundBytes bytes{std::move(out)};
  ctx.fireOutbound(bytes);
}

void HttpCodec::onInbound(StageContext& ctx, InboundBytes& evt) {
  if (state_ == State::kBroken) {
    return;
  }

  const size_t n = evt.buf.readableBytes();
  in_.write(std::move(evt.buf), n);

  bool progress = true;
  while (progress && state_ != State::kBroken) {
    switch (state_) {
      case State::kHead:
        progress = in_.readableBytes() > 0 && parseHead(ctx);
        break;
      case State::kBody:
        progress = parseBody(ctx);
        break;
      case State::kChunkSize:
        progress = parseChunkSize(ctx);
        break;
      case State::kChunkData:
        progress = parseChunkData(ctx);
        break;
      case State::kTrailers:
        progress = parseTrailers(ctx);
        break;
      case State::kUntilClose:
        appendBody(ctx, in_.readableBytes());
        progress = false;
        break;
      case State::kBroken:
        progress = false;
        break;
    }
  }
}

void HttpCodec::onInbound(StageContext& ctx, InboundTransportInactive& evt) {
  if (state_ == State::kUntilClose) {
    emit(ctx);
  } else if (state_ != State::kHead || in_.readableBytes() > 0) {
    if (state_ != State::kBroken) {
      TTL_LOG(Error) << "Connection closed mid-message";
      fail(ctx, EPROTO);
    }
  }
  ctx.fireInbound(evt);
}

bool HttpCodec::parseHead(StageContext& ctx) {
  const size_t end = in_.find(kHeadEnd);
  if (end == ByteBuf::npos) {
    if (in_.readableBytes() > kMaxHeaderBytes) {
      TTL_LOG(Error) << "Header block exceeds limit of " << kMaxHeaderBytes;
      fail(ctx, EMSGSIZE);
    }
    return false;
  }
  if (end > kMaxHeaderBytes) {
    TTL_LOG(Error) << "Header block exceeds limit of " << kMaxHeaderBytes;
    fail(ctx, EMSGSIZE);
    return false;
  }

  std::string head;
  in_.readString(head, end + kHeadEnd.size());
  std::string_view view(head);
  view.remove_suffix(kHeadEnd.size());

  const size_t eol = view.find(kCrlf);
  const std::string_view start_line = view.substr(0, eol);
  const std::string_view lines =
      eol == std::string_view::npos ? std::string_view{} : view.substr(eol + 2);

  Headers* headers = nullptr;
  bool ok          = false;
  if (role_ == Role::kClient) {
    response_ = HttpResponse{};
    ok        = parseStatusLine(start_line, response_);
    headers   = &response_.headers;
  } else {
    request_ = HttpRequest{};
    ok       = parseRequestLine(start_line, request_);
    headers  = &request_.headers;
  }

  if (!ok || !parseHeaderLines(lines, *headers)) {
    TTL_LOG(Error) << "Malformed message head: " << start_line;
    fail(ctx, EPROTO);
    return false;
  }

  if (role_ == Role::kClient && response_.status >= 100 &&
      response_.status < 200) {
    TTL_LOG(Debug) << "Skipping interim response " << response_.status;
    return true;
  }

  if (isChunked(*headers)) {
    state_ = State::kChunkSize;
    return true;
  }

  if (const auto length = findHeader(*headers, "Content-Length")) {
    const std::string_view value = trim(*length);
    size_t parsed                = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
      TTL_LOG(Error) << "Bad Content-Length: " << value;
      fail(ctx, EPROTO);
      return false;
    }
    if (parsed > max_body_) {
      TTL_LOG(Error) << "Body size " << parsed << " exceeds limit of "
                     << max_body_;
      fail(ctx, EMSGSIZE);
      return false;
    }
    pending_ = parsed;
    state_   = State::kBody;
    return true;
  }

  const bool bodyless =
      role_ == Role::kServer || response_.status == 204 ||
      response_.status == 304;
  if (bodyless) {
    emit(ctx);
    return true;
  }

  state_ = State::kUntilClose;
  return true;
}

bool HttpCodec::parseBody(StageContext& ctx) {
  if (pending_ > 0) {
    const size_t take = std::min(pending_, in_.readableBytes());
    if (take == 0) {
      return false;
    }
    if (!appendBody(ctx, take)) {
      return false;
    }
    pending_ -= take;
  }
  if (pending_ == 0) {
    emit(ctx);
    return true;
  }
  return false;
}

bool HttpCodec::parseChunkSize(StageContext& ctx) {
  const size_t eol = in_.find(kCrlf);
  if (eol == ByteBuf::npos) {
    if (in_.readableBytes() > kMaxChunkLineBytes) {
      fail(ctx, EPROTO);
    }
    return false;
  }

  std::string line;
  in_.readString(line, eol + kCrlf.size());
  std::string_view size_part(line.data(), eol);
  const size_t ext = size_part.find(';');
  if (ext != std::string_view::npos) {
    size_part = size_part.substr(0, ext);
  }
  size_part = trim(size_part);

  size_t size = 0;
  auto [ptr, ec] = std::from_chars(size_part.data(),
                                   size_part.data() + size_part.size(), size, 16);
  if (size_part.empty() || ec != std::errc{} ||
      ptr != size_part.data() + size_part.size()) {
    TTL_LOG(Error) << "Bad chunk size line: " << size_part;
    fail(ctx, EPROTO);
    return false;
  }

  if (size == 0) {
    state_ = State::kTrailers;
    return true;
  }
  if (size > max_body_) {
    TTL_LOG(Error) << "Chunk size " << size << " exceeds limit of " << max_body_;
    fail(ctx, EMSGSIZE);
    return false;
  }
  pending_ = size;
  state_   = State::kChunkData;
  return true;
}

bool HttpCodec::parseChunkData(StageContext& ctx) {
  if (in_.readableBytes() < pending_ + kCrlf.size()) {
    return false;
  }
  if (!appendBody(ctx, pending_)) {
    return false;
  }
  char crlf[2];
  in_.peek(crlf, 2);
  if (crlf[0] != '\r' || crlf[1] != '\n') {
    TTL_LOG(Error) << "Missing CRLF after chunk data";
    fail(ctx, EPROTO);
    return false;
  }
  in_.advance(2);
  pending_ = 0;
  state_   = State::kChunkSize;
  return true;
}

bool HttpCodec::parseTrailers(StageContext& ctx) {
  const size_t eol = in_.find(kCrlf);
  if (eol == ByteBuf::npos) {
    if (in_.readableBytes() > kMaxHeaderBytes) {
      fail(ctx, EMSGSIZE);
    }
    return false;
  }
  in_.advance(eol + kCrlf.size());
  if (eol == 0) {
    emit(ctx);
  }
  return true;
}

bool HttpCodec::appendBody(StageContext& ctx, size_t n) {
  std::string& body = role_ == Role::kClient ? response_.body : request_.body;
  if (body.size() + n > max_body_) {
    TTL_LOG(Error) << "Body size exceeds limit of " << max_body_;
    fail(ctx, EMSGSIZE);
    return false;
  }
  std::string part;
  in_.readString(part, n);
  body.append(part);
  return true;
}

void HttpCodec::emit(StageContext& ctx) {
  state_   = State::kHead;
  pending_ = 0;
  if (role_ == Role::kClient) {
    TTL_LOG(Debug) << "InboundHttpResponse(" << response_.status << ") : "
                   << response_.body.size() << " bytes";
    InboundHttpResponse evt{std::exchange(response_, HttpResponse{})};
    ctx.fireInbound(evt);
  } else {
    TTL_LOG(Debug) << "InboundHttpRequest(" << request_.method << " "
                   << request_.target << ") : " << request_.body.size()
                   << " bytes";
    InboundHttpRequest evt{std::exchange(request_, HttpRequest{})};
    ctx.fireInbound(evt);
  }
}

void HttpCodec::fail(StageContext& ctx, int err) {
  state_ = State::kBroken;
  in_    = ByteBuf{};
  ctx.failure(err);
}

}  // namespace chunkline::http
