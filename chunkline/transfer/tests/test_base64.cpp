#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include <chunkline/transfer/base64.hpp>

using namespace chunkline::transfer;

namespace {

Bytes bytesOf(std::string_view text) { return {text.begin(), text.end()}; }

}  // namespace

TEST(Base64Test, EncodesKnownVectors) {
  EXPECT_EQ(base64::encode(Bytes{}), "");
  EXPECT_EQ(base64::encode(bytesOf("f")), "Zg==");
  EXPECT_EQ(base64::encode(bytesOf("fo")), "Zm8=");
  EXPECT_EQ(base64::encode(bytesOf("foo")), "Zm9v");
  EXPECT_EQ(base64::encode(bytesOf("foobar")), "Zm9vYmFy");
  EXPECT_EQ(base64::encode(Bytes{0xFB, 0xFF}), "+/8=");
}

TEST(Base64Test, EverySingleByteRoundTrips) {
  for (int b = 0; b < 256; ++b) {
    const Bytes input{static_cast<uint8_t>(b)};
    const std::string text = base64::encode(input);
    EXPECT_EQ(text.size(), 4U) << b;
    auto back = base64::decode(text);
    ASSERT_TRUE(back.has_value()) << b << ": " << back.error().describe();
    EXPECT_EQ(*back, input) << b;
  }

  Bytes all(256);
  for (size_t i = 0; i < all.size(); ++i) {
    all[i] = static_cast<uint8_t>(i);
  }
  auto back = base64::decode(base64::encode(all));
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, all);
}

TEST(Base64Test, EmptyTextDecodesToNothing) {
  auto back = base64::decode("");
  ASSERT_TRUE(back.has_value()) << back.error().describe();
  EXPECT_TRUE(back->empty());
}

TEST(Base64Test, EncodeSpansBlockBoundaries) {
  Bytes input(base64::kBlockBytes * 3 + 1);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<uint8_t>(i * 7 + 3);
  }

  const std::string text = base64::encode(input);
  EXPECT_EQ(text.size(), base64::encodedSize(input.size()));

  auto back = base64::decode(text);
  ASSERT_TRUE(back.has_value()) << back.error().describe();
  EXPECT_EQ(*back, input);
}

TEST(Base64Test, DecodesDataUri) {
  auto bytes = base64::decode("data:audio/wav;base64,UklGRg==");
  ASSERT_TRUE(bytes.has_value()) << bytes.error().describe();
  EXPECT_EQ(*bytes, bytesOf("RIFF"));

  auto empty = base64::decode("data:application/octet-stream;base64,");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(Base64Test, StripDataUri) {
  EXPECT_EQ(base64::stripDataUri("Zm9v").value_or(""), "Zm9v");
  EXPECT_EQ(base64::stripDataUri("data:text/plain;base64,Zm9v").value_or(""),
            "Zm9v");

  auto no_marker = base64::stripDataUri("data:text/plain,Zm9v");
  ASSERT_FALSE(no_marker.has_value());
  EXPECT_EQ(no_marker.error().kind, ErrorKind::kDecoding);

  EXPECT_FALSE(base64::stripDataUri("text;base64,Zm9v").has_value());
}

TEST(Base64Test, RejectsMalformedInput) {
  for (const char* text : {"Zm9", "Zm9v!A==", "Z===", "Zg==Zg==", "=Zg="}) {
    auto bytes = base64::decode(text);
    ASSERT_FALSE(bytes.has_value()) << text;
    EXPECT_EQ(bytes.error().kind, ErrorKind::kDecoding) << text;
  }
}
