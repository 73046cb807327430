#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "base64.hpp"
#include "errors.hpp"

namespace chunkline::transfer {

// Raw binary content, e.g. an audio file read from disk.
struct Binary {
  Bytes bytes;
  std::string mime_hint = "application/octet-stream";
};

// Binary content already text-encoded; bare base64 or a data URI.
struct EncodedBinary {
  std::string text;
};

// An arbitrary JSON request object.
struct Structured {
  nlohmann::json value;
};

using Payload = std::variant<Binary, EncodedBinary, Structured>;

// Field of a structured request that carries binary content for a
// binary route.
constexpr std::string_view kAudioDataField = "audio_data";

// What is actually split and sent.
struct NormalizedPayload {
  Bytes bytes;
  bool is_binary = false;
};

// Turns a caller payload into one byte sequence. The destination only
// selects the mode: binary routes take decoded bytes, everything else is
// serialized as UTF-8 JSON.
class PayloadNormalizer {
public:
  explicit PayloadNormalizer(std::vector<std::string> binary_routes);

  // True when the path of destination (query ignored) ends with one of
  // the binary routes.
  [[nodiscard]] bool isBinaryDestination(std::string_view destination) const;

  [[nodiscard]] std::expected<NormalizedPayload, TransferError> normalize(
      std::string_view destination, const Payload& payload) const;

  // The JSON body a non-chunked POST of payload would carry.
  [[nodiscard]] static std::expected<std::string, TransferError> toJsonText(
      const Payload& payload);

private:
  std::vector<std::string> binary_routes_;
};

}  // namespace chunkline::transfer
