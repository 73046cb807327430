#include <gtest/gtest.h>

#include <bits/queue.hpp>
#include <bits/ttl/ttl.hpp>
#include <cerrno>
#include <chrono>
#include <optional>
#include <string>

#include <chunkline/transport/event_watcher/event_watcher.hpp>
#include <chunkline/transport/http/http_client.hpp>
#include <chunkline/transport/http/url.hpp>
#include <chunkline/transport/tests/loopback_server.hpp>

using namespace std::chrono_literals;
using namespace chunkline::http;
using chunkline::io::EventWatcher;
using chunkline::test_support::LoopbackHttpServer;

template <typename T>
using Q = bits::MPMCBlockingQueue<T>;

class HttpClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    // DEBUG: bits::ttl::Ttl::init("stdout://");
    bits::ttl::Ttl::init("discard://");
  }

  void TearDown() override { bits::ttl::Ttl::shutdown(); }

  template <typename T>
  static std::optional<T> await(EventWatcher& ew, Q<T>& q,
                                int max_iterations = 200) {
    std::optional<T> value;
    for (int i = 0; i < max_iterations && !value.has_value(); ++i) {
      ew.loop(10);
      value = q.tryPop();
    }
    return value;
  }
};

TEST_F(HttpClientTest, PostRoundTrip) {
  // Arrange
  EventWatcher ew{};
  LoopbackHttpServer server(ew, [](const HttpRequest& request) {
    HttpResponse response;
    response.status = 200;
    response.reason = "OK";
    response.body   = "echo:" + request.body;
    return std::optional<HttpResponse>(std::move(response));
  });
  auto address = server.start();
  ASSERT_TRUE(address.has_value()) << "Deadline";

  HttpClient client(*address, ew);
  Q<HttpResponse> responses;
  Q<int> failures;

  HttpRequest request;
  request.target  = "/api/chat";
  request.headers = jsonHeaders("token-1");
  request.body    = R"({"prompt":"hi"})";

  // Act
  client.send(
      std::move(request),
      [&](HttpResponse response) { responses.push(std::move(response)); },
      [&](int err) { failures.push(err); });
  auto response = await(ew, responses);

  // Assert
  ASSERT_TRUE(response.has_value()) << "Deadline";
  EXPECT_EQ(response->status, 200);
  EXPECT_EQ(response->body, R"(echo:{"prompt":"hi"})");
  EXPECT_FALSE(failures.tryPop().has_value());

  ASSERT_EQ(server.requests().size(), 1U);
  const auto& seen = server.requests()[0];
  EXPECT_EQ(seen.method, "POST");
  EXPECT_EQ(seen.target, "/api/chat");
  EXPECT_EQ(findHeader(seen.headers, "Authorization").value_or(""),
            "Bearer token-1");
  EXPECT_EQ(findHeader(seen.headers, "Host").value_or(""), *address);
  EXPECT_EQ(findHeader(seen.headers, "Connection").value_or(""), "close");

  // Exchanges are released on a later iteration.
  for (int i = 0; i < 10 && client.inflight() > 0; ++i) {
    ew.loop(10);
  }
  EXPECT_EQ(client.inflight(), 0U);
}

TEST_F(HttpClientTest, HostHeaderNamesTheOriginNotTheDialedAddress) {
  // Arrange
  EventWatcher ew{};
  LoopbackHttpServer server(ew, [](const HttpRequest& /*request*/) {
    HttpResponse response;
    response.status = 200;
    response.reason = "OK";
    return std::optional<HttpResponse>(std::move(response));
  });
  auto address = server.start();
  ASSERT_TRUE(address.has_value()) << "Deadline";

  auto url = parseUrl("http://api.example.com/backend/chat");
  ASSERT_TRUE(url.has_value());
  HttpClient client(url->hostHeader(), *address, ew);
  Q<HttpResponse> responses;

  // Act
  client.send(
      HttpRequest{}, [&](HttpResponse response) { responses.push(std::move(response)); },
      [](int err) { FAIL() << "onFailure: " << err; });
  auto response = await(ew, responses);

  // Assert
  ASSERT_TRUE(response.has_value()) << "Deadline";
  ASSERT_EQ(server.requests().size(), 1U);
  EXPECT_EQ(findHeader(server.requests()[0].headers, "Host").value_or(""),
            "api.example.com");
}

TEST_F(HttpClientTest, ErrorStatusIsAResponse) {
  // Arrange
  EventWatcher ew{};
  LoopbackHttpServer server(ew, [](const HttpRequest& /*request*/) {
    HttpResponse response;
    response.status = 500;
    response.reason = "Internal Server Error";
    response.body   = R"({"detail":"boom"})";
    return std::optional<HttpResponse>(std::move(response));
  });
  auto address = server.start();
  ASSERT_TRUE(address.has_value()) << "Deadline";

  HttpClient client(*address, ew);
  Q<HttpResponse> responses;

  // Act
  client.send(
      HttpRequest{}, [&](HttpResponse response) { responses.push(std::move(response)); },
      [](int err) { FAIL() << "onFailure: " << err; });
  auto response = await(ew, responses);

  // Assert
  ASSERT_TRUE(response.has_value()) << "Deadline";
  EXPECT_EQ(response->status, 500);
  EXPECT_FALSE(response->ok());
  EXPECT_EQ(response->body, R"({"detail":"boom"})");
}

TEST_F(HttpClientTest, DialFailureIsReportedAfterSendReturns) {
  // Arrange
  EventWatcher ew{};
  HttpClient client("not-an-address", ew);
  Q<int> failures;

  // Act
  client.send(
      HttpRequest{}, [](HttpResponse /*response*/) { FAIL() << "onResponse"; },
      [&](int err) { failures.push(err); });

  // Assert
  EXPECT_FALSE(failures.tryPop().has_value());
  auto err = await(ew, failures);
  ASSERT_TRUE(err.has_value()) << "Deadline";
  EXPECT_EQ(*err, EINVAL);
}

TEST_F(HttpClientTest, ConnectionRefused) {
  // Arrange: grab a free port, then stop listening on it.
  EventWatcher ew{};
  std::optional<std::string> address;
  {
    LoopbackHttpServer server(ew, [](const HttpRequest&) {
      return std::optional<HttpResponse>();
    });
    address = server.start();
  }
  ASSERT_TRUE(address.has_value()) << "Deadline";

  HttpClient client(*address, ew);
  Q<int> failures;

  // Act
  client.send(
      HttpRequest{}, [](HttpResponse) { FAIL() << "onResponse"; },
      [&](int err) { failures.push(err); });
  auto err = await(ew, failures);

  // Assert
  ASSERT_TRUE(err.has_value()) << "Deadline";
  EXPECT_EQ(*err, ECONNREFUSED);
}

TEST_F(HttpClientTest, UnansweredRequestTimesOut) {
  // Arrange
  EventWatcher ew{};
  LoopbackHttpServer server(ew, [](const HttpRequest&) {
    return std::optional<HttpResponse>();
  });
  auto address = server.start();
  ASSERT_TRUE(address.has_value()) << "Deadline";

  HttpClient client(*address, ew, 200ms);
  Q<int> failures;

  // Act
  client.send(
      HttpRequest{}, [](HttpResponse) { FAIL() << "onResponse"; },
      [&](int err) { failures.push(err); });
  auto err = await(ew, failures);

  // Assert
  ASSERT_TRUE(err.has_value()) << "Deadline";
  EXPECT_EQ(*err, ETIMEDOUT);
  EXPECT_EQ(server.requests().size(), 1U);
}

TEST_F(HttpClientTest, DestroyedClientDropsCallbacks) {
  // Arrange
  EventWatcher ew{};
  LoopbackHttpServer server(ew, [](const HttpRequest&) {
    return std::optional<HttpResponse>();
  });
  auto address = server.start();
  ASSERT_TRUE(address.has_value()) << "Deadline";

  // Act
  {
    HttpClient client(*address, ew, 100ms);
    client.send(
        HttpRequest{}, [](HttpResponse) { FAIL() << "onResponse"; },
        [](int err) { FAIL() << "onFailure: " << err; });
    ew.loop(10);
  }
  for (int i = 0; i < 30; ++i) {
    ew.loop(10);
  }

  // Assert: nothing fired after destruction
  SUCCEED();
}

TEST(UrlTest, Parse) {
  auto url = parseUrl("http://127.0.0.1:8080/api/speech2text?x=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "127.0.0.1");
  EXPECT_EQ(url->port, 8080);
  EXPECT_EQ(url->target, "/api/speech2text?x=1");
  EXPECT_EQ(url->authority(), "127.0.0.1:8080");
  EXPECT_EQ(url->hostHeader(), "127.0.0.1:8080");

  auto bare = parseUrl("http://example.com");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->port, 80);
  EXPECT_EQ(bare->target, "/");
  EXPECT_EQ(bare->hostHeader(), "example.com");

  EXPECT_FALSE(parseUrl("https://example.com/").has_value());
  EXPECT_FALSE(parseUrl("http://:80/").has_value());
  EXPECT_FALSE(parseUrl("http://host:0/").has_value());
  EXPECT_FALSE(parseUrl("http://host:99999/").has_value());
  EXPECT_FALSE(parseUrl("http://user@host/").has_value());
}

TEST(UrlTest, JoinPath) {
  EXPECT_EQ(joinPath("/api/", "/backend/config"), "/api/backend/config");
  EXPECT_EQ(joinPath("", "backend/config"), "/backend/config");
  EXPECT_EQ(joinPath("api", "/backend/config"), "/api/backend/config");
}

TEST(UrlTest, ResolveNumericAndLocalhost) {
  EXPECT_EQ(resolveIPv4("10.1.2.3").value_or(""), "10.1.2.3");
  EXPECT_EQ(resolveIPv4("localhost").value_or(""), "127.0.0.1");
}
