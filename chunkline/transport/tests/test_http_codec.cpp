#include <gtest/gtest.h>

#include <bits/ttl/ttl.hpp>
#include <cerrno>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <chunkline/transport/conveyor.hpp>
#include <chunkline/transport/event.hpp>
#include <chunkline/transport/http/http_codec.hpp>
#include <chunkline/transport/transport.hpp>

using namespace chunkline::http;

namespace {

struct NullTransport final : ITransport {
  Conveyor* pipeline_ptr = nullptr;

  Conveyor& pipeline() noexcept override { return *pipeline_ptr; }

  int write(ByteBuf& /*unused*/) override { return 0; }

  void readableStateChanged(bool /*unused*/) override {}

  void shutdown(int /*unused*/) override {}

  [[nodiscard]] const char* otherEndpoint() const override { return "test"; }

  [[nodiscard]] const char* selfEndpoint() const override { return "test"; }
};

// Collects whatever leaves either end of the codec.
struct Recorder {
  std::string wire;
  std::vector<HttpResponse> responses;
  std::vector<HttpRequest> requests;
  std::vector<int> errors;
  size_t closed = 0;
};

struct WireTap {
  Recorder* rec;

  void onOutbound(StageContext& /*ctx*/, OutboundBytes& evt) {
    std::string out;
    evt.buf.readString(out, evt.buf.readableBytes());
    rec->wire += out;
  }
};

struct MessageSink {
  Recorder* rec;

  void onInbound(StageContext& /*ctx*/, InboundHttpResponse& evt) {
    rec->responses.push_back(std::move(evt.response));
  }

  void onInbound(StageContext& /*ctx*/, InboundHttpRequest& evt) {
    rec->requests.push_back(std::move(evt.request));
  }

  void onInbound(StageContext& /*ctx*/, InboundTransportError& evt) {
    rec->errors.push_back(evt.err);
  }

  void onInbound(StageContext& /*ctx*/, InboundTransportInactive& /*evt*/) {
    ++rec->closed;
  }
};

}  // namespace

class HttpCodecTest : public ::testing::Test {
protected:
  NullTransport transport_;
  Conveyor pipeline_{&transport_};
  Recorder rec_;

  void SetUp() override {
    bits::ttl::Ttl::init("discard://");
    transport_.pipeline_ptr = &pipeline_;
  }

  void TearDown() override { bits::ttl::Ttl::shutdown(); }

  void install(HttpCodec::Role role, size_t max_body = kMaxBodyBytes) {
    pipeline_.addLast<WireTap>(&rec_);
    pipeline_.addLast<HttpCodec>(role, max_body);
    pipeline_.addLast<MessageSink>(&rec_);
  }

  void feed(std::string_view bytes) {
    ByteBuf buf;
    ASSERT_TRUE(buf.write(bytes));
    pipeline_.fireInbound(InboundBytes{std::move(buf)});
  }
};

TEST_F(HttpCodecTest, EncodesRequestWithContentLength) {
  install(HttpCodec::Role::kClient);

  HttpRequest request;
  request.target  = "/api/chat";
  request.headers = jsonHeaders("secret");
  request.headers.emplace_back("Content-Length", "999");
  request.body = R"({"a":1})";
  pipeline_.fireOutbound(OutboundHttpRequest{request});

  EXPECT_EQ(rec_.wire,
            "POST /api/chat HTTP/1.1\r\n"
            "Content-Type: application/json\r\n"
            "Authorization: Bearer secret\r\n"
            "Content-Length: 7\r\n"
            "\r\n"
            R"({"a":1})");
}

TEST_F(HttpCodecTest, ParsesContentLengthResponseSplitAcrossReads) {
  install(HttpCodec::Role::kClient);

  feed("HTTP/1.1 200 OK\r\nContent-Ty");
  feed("pe: application/json\r\nContent-Length: 11\r\n\r\n{\"ok\":");
  EXPECT_TRUE(rec_.responses.empty());
  feed("true}");

  ASSERT_EQ(rec_.responses.size(), 1U);
  const auto& response = rec_.responses[0];
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.reason, "OK");
  EXPECT_EQ(response.body, R"({"ok":true})");
  EXPECT_EQ(findHeader(response.headers, "content-type").value_or(""),
            "application/json");
  EXPECT_TRUE(rec_.errors.empty());
}

TEST_F(HttpCodecTest, ParsesChunkedResponse) {
  install(HttpCodec::Role::kClient);

  feed(
      "HTTP/1.1 200 OK\r\n"
      "Transfer-Encoding: chunked\r\n"
      "\r\n"
      "5;ext=1\r\nhello\r\n"
      "7\r\n, world\r\n"
      "0\r\n"
      "X-Trailer: yes\r\n"
      "\r\n");

  ASSERT_EQ(rec_.responses.size(), 1U);
  EXPECT_EQ(rec_.responses[0].body, "hello, world");
}

TEST_F(HttpCodecTest, CloseDelimitedBodyEndsOnInactive) {
  install(HttpCodec::Role::kClient);

  feed("HTTP/1.0 500 Internal Server Error\r\n\r\n{\"detail\":\"boom\"}");
  EXPECT_TRUE(rec_.responses.empty());

  pipeline_.fireInbound(InboundTransportInactive{});

  ASSERT_EQ(rec_.responses.size(), 1U);
  EXPECT_EQ(rec_.responses[0].status, 500);
  EXPECT_FALSE(rec_.responses[0].ok());
  EXPECT_EQ(rec_.responses[0].body, R"({"detail":"boom"})");
  EXPECT_EQ(rec_.closed, 1U);
}

TEST_F(HttpCodecTest, SkipsInterimResponse) {
  install(HttpCodec::Role::kClient);

  feed(
      "HTTP/1.1 100 Continue\r\n\r\n"
      "HTTP/1.1 204 No Content\r\n\r\n");

  ASSERT_EQ(rec_.responses.size(), 1U);
  EXPECT_EQ(rec_.responses[0].status, 204);
  EXPECT_TRUE(rec_.responses[0].body.empty());
}

TEST_F(HttpCodecTest, MalformedStatusLineFails) {
  install(HttpCodec::Role::kClient);

  feed("HTTX/1.1 200 OK\r\n\r\n");
  feed("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

  EXPECT_TRUE(rec_.responses.empty());
  ASSERT_EQ(rec_.errors.size(), 1U);
  EXPECT_EQ(rec_.errors[0], EPROTO);
}

TEST_F(HttpCodecTest, OversizedHeadFails) {
  install(HttpCodec::Role::kClient);

  feed("HTTP/1.1 200 OK\r\n");
  feed("X-Filler: " + std::string(kMaxHeaderBytes, 'x'));

  ASSERT_EQ(rec_.errors.size(), 1U);
  EXPECT_EQ(rec_.errors[0], EMSGSIZE);
}

TEST_F(HttpCodecTest, OversizedBodyFails) {
  install(HttpCodec::Role::kClient, /*max_body=*/16);

  feed("HTTP/1.1 200 OK\r\nContent-Length: 17\r\n\r\n");

  ASSERT_EQ(rec_.errors.size(), 1U);
  EXPECT_EQ(rec_.errors[0], EMSGSIZE);
}

TEST_F(HttpCodecTest, ConnectionLostMidBodyFails) {
  install(HttpCodec::Role::kClient);

  feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
  pipeline_.fireInbound(InboundTransportInactive{});

  EXPECT_TRUE(rec_.responses.empty());
  ASSERT_EQ(rec_.errors.size(), 1U);
  EXPECT_EQ(rec_.errors[0], EPROTO);
  EXPECT_EQ(rec_.closed, 1U);
}

TEST_F(HttpCodecTest, ServerRoleParsesPipelinedRequests) {
  install(HttpCodec::Role::kServer);

  feed(
      "POST /upload HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc"
      "GET /backend/config HTTP/1.1\r\nHost: x\r\n\r\n");

  ASSERT_EQ(rec_.requests.size(), 2U);
  EXPECT_EQ(rec_.requests[0].method, "POST");
  EXPECT_EQ(rec_.requests[0].target, "/upload");
  EXPECT_EQ(rec_.requests[0].body, "abc");
  EXPECT_EQ(rec_.requests[1].method, "GET");
  EXPECT_EQ(rec_.requests[1].target, "/backend/config");
  EXPECT_TRUE(rec_.requests[1].body.empty());
}

TEST_F(HttpCodecTest, ServerRoleEncodesResponse) {
  install(HttpCodec::Role::kServer);

  HttpResponse response;
  response.status = 200;
  response.reason = "OK";
  response.body   = "done";
  pipeline_.fireOutbound(OutboundHttpResponse{response});

  EXPECT_EQ(rec_.wire, "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\ndone");
}
