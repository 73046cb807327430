#include <gtest/gtest.h>

#include <cerrno>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <chunkline/transport/conveyor.hpp>
#include <chunkline/transport/event.hpp>
#include <chunkline/transport/transport.hpp>

namespace {

struct TestTransport final : ITransport {
  Conveyor* pipeline_ptr = nullptr;
  size_t written         = 0;

  Conveyor& pipeline() noexcept override { return *pipeline_ptr; }

  int write(ByteBuf& buf) override {
    const size_t n = buf.readableBytes();
    written += n;
    buf.advance(n);
    return static_cast<int>(n);
  }

  void readableStateChanged(bool /*unused*/) override {}

  void shutdown(int /*unused*/) override {}

  [[nodiscard]] const char* otherEndpoint() const override { return "test"; }

  [[nodiscard]] const char* selfEndpoint() const override { return "test"; }
};

struct MockStage {
  std::function<void(StageContext&)> on_added = [](auto&) {
  };
  std::function<void(StageContext&)> on_inbound = [](auto&) {
  };
  std::function<void(StageContext&)> on_outbound = [](auto&) {
  };

  void onAdded(StageContext& ctx) { on_added(ctx); }

  template <typename E>
  void onInbound(StageContext& ctx, E& evt) {
    on_inbound(ctx);
    ctx.fireInbound(evt);
  }

  template <typename E>
  void onOutbound(StageContext& ctx, E& evt) {
    on_outbound(ctx);
    ctx.fireOutbound(evt);
  }
};

}  // namespace

class ConveyorTest : public ::testing::Test {
protected:
  TestTransport transport_;
  Conveyor pipeline_{&transport_};

  void SetUp() override { transport_.pipeline_ptr = &pipeline_; }
};

TEST_F(ConveyorTest, InboundFlowsForwardOutboundBackward) {
  std::vector<size_t> inbound;
  std::vector<size_t> outbound;

  for (size_t id = 1; id <= 3; ++id) {
    pipeline_.addLast<MockStage>(MockStage{
        .on_inbound  = [&, id](auto&) { inbound.push_back(id); },
        .on_outbound = [&, id](auto&) { outbound.push_back(id); },
    });
  }
  ASSERT_EQ(pipeline_.size(), 3U);

  pipeline_.fireInbound(InboundTransportInactive{});
  pipeline_.fireOutbound(OutboundBytes{});

  EXPECT_EQ(inbound, (std::vector<size_t>{1, 2, 3}));
  EXPECT_EQ(outbound, (std::vector<size_t>{3, 2, 1}));
}

TEST_F(ConveyorTest, EmptyPipeline) {
  pipeline_.fireInbound(InboundTransportInactive{});
  pipeline_.fireOutbound(OutboundBytes{});

  SUCCEED();
}

TEST_F(ConveyorTest, OnAddedSeesIndexAndTransport) {
  std::vector<size_t> indices;
  ITransport* transport = nullptr;

  for (int i = 0; i < 3; ++i) {
    pipeline_.addLast<MockStage>(MockStage{
        .on_added =
            [&](auto& ctx) {
              indices.push_back(ctx.index());
              transport = &ctx.transport();
            },
    });
  }

  EXPECT_EQ(indices, (std::vector<size_t>{0, 1, 2}));
  EXPECT_EQ(transport, &transport_);
}

TEST_F(ConveyorTest, TypedDispatchSkipsUnhandledEvents) {
  size_t bytes_count    = 0;
  size_t inactive_count = 0;
  size_t tail_count     = 0;

  struct TypedStage {
    size_t* bytes;
    size_t* inactive;

    void onInbound(StageContext& ctx, InboundBytes& evt) {
      ++(*bytes);
      ctx.fireInbound(evt);
    }

    void onInbound(StageContext& ctx, InboundTransportInactive& evt) {
      ++(*inactive);
      ctx.fireInbound(evt);
    }
  };

  pipeline_.addLast<TypedStage>(&bytes_count, &inactive_count);
  pipeline_.addLast<MockStage>(MockStage{
      .on_inbound = [&](auto&) { ++tail_count; },
  });

  pipeline_.fireInbound(InboundBytes{});
  pipeline_.fireInbound(InboundTransportInactive{});
  pipeline_.fireInbound(InboundTransportError{EPIPE});

  EXPECT_EQ(bytes_count, 1U);
  EXPECT_EQ(inactive_count, 1U);
  EXPECT_EQ(tail_count, 3U);
}

TEST_F(ConveyorTest, InboundToOutbound) {
  size_t outbound_count = 0;
  std::string echoed;

  // Answers every inbound chunk with the same bytes.
  struct Echo {
    void onInbound(StageContext& ctx, InboundBytes& evt) {
      OutboundBytes out{std::move(evt.buf)};
      ctx.fireOutbound(out);
    }
  };

  struct Capture {
    size_t* count;
    std::string* text;

    void onOutbound(StageContext& ctx, OutboundBytes& evt) {
      ++(*count);
      std::string part;
      evt.buf.readString(part, evt.buf.readableBytes());
      *text += part;
    }
  };

  pipeline_.addLast<Capture>(&outbound_count, &echoed);
  pipeline_.addLast<Echo>();

  ByteBuf buf;
  ASSERT_TRUE(buf.write(std::string_view("ping")));
  pipeline_.fireInbound(InboundBytes{std::move(buf)});

  EXPECT_EQ(outbound_count, 1U);
  EXPECT_EQ(echoed, "ping");
}

TEST_F(ConveyorTest, FailureReachesLaterStagesOnly) {
  int head_err = 0;
  int tail_err = 0;

  struct Watch {
    int* err;
    void onInbound(StageContext& ctx, InboundTransportError& evt) {
      *err = evt.err;
      ctx.fireInbound(evt);
    }
  };

  struct Breaker {
    void onInbound(StageContext& ctx, InboundBytes& /*evt*/) {
      ctx.failure(EPROTO);
    }
  };

  pipeline_.addLast<Watch>(&head_err);
  pipeline_.addLast<Breaker>();
  pipeline_.addLast<Watch>(&tail_err);

  pipeline_.fireInbound(InboundBytes{});

  EXPECT_EQ(head_err, 0);
  EXPECT_EQ(tail_err, EPROTO);
}

TEST_F(ConveyorTest, OutboundBytesReachTransport) {
  struct Writer {
    void onOutbound(StageContext& ctx, OutboundBytes& evt) {
      ctx.transport().write(evt.buf);
    }
  };

  pipeline_.addLast<Writer>();
  pipeline_.addLast<MockStage>();

  ByteBuf buf;
  ASSERT_TRUE(buf.write(std::string_view("hello")));
  pipeline_.fireOutbound(OutboundBytes{std::move(buf)});

  EXPECT_EQ(transport_.written, 5U);
}
