#include "payload.hpp"

#include <bits/ttl/logger.hpp>
#include <utility>

namespace chunkline::transfer {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

std::string dataUri(const Binary& binary) {
  return "data:" + binary.mime_hint + ";base64," + base64::encode(binary.bytes);
}

std::expected<Bytes, TransferError> decodeBinaryField(std::string_view text) {
  auto bytes = base64::decode(text);
  if (!bytes) {
    return std::unexpected(makeError(ErrorKind::kUnsupportedPayload,
                                     "binary content is not decodable: " +
                                         bytes.error().detail));
  }
  return bytes;
}

std::expected<std::string, TransferError> dump(const nlohmann::json& value) {
  try {
    return value.dump();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorKind::kEncoding, e.what()));
  }
}

Bytes toBytes(const std::string& text) {
  return {text.begin(), text.end()};
}

}  // namespace

PayloadNormalizer::PayloadNormalizer(std::vector<std::string> binary_routes)
    : binary_routes_(std::move(binary_routes)) {}

bool PayloadNormalizer::isBinaryDestination(std::string_view destination) const {
  destination = destination.substr(0, destination.find('?'));
  while (destination.size() > 1 && destination.back() == '/') {
    destination.remove_suffix(1);
  }
  for (const auto& route : binary_routes_) {
    if (!route.empty() && destination.ends_with(route)) {
      return true;
    }
  }
  return false;
}

std::expected<std::string, TransferError> PayloadNormalizer::toJsonText(
    const Payload& payload) {
  return std::visit(
      Overloaded{
          [](const Structured& s) { return dump(s.value); },
          [](const Binary& b) {
            return dump(nlohmann::json{{kAudioDataField, dataUri(b)}});
          },
          [](const EncodedBinary& e) {
            return dump(nlohmann::json{{kAudioDataField, e.text}});
          },
      },
      payload);
}

std::expected<NormalizedPayload, TransferError> PayloadNormalizer::normalize(
    std::string_view destination, const Payload& payload) const {
  if (!isBinaryDestination(destination)) {
    auto text = toJsonText(payload);
    if (!text) {
      return std::unexpected(std::move(text.error()));
    }
    TTL_LOG(Debug) << "normalize(" << destination << ") : JSON, "
                   << text->size() << " bytes";
    return NormalizedPayload{.bytes = toBytes(*text), .is_binary = false};
  }

  if (const auto* binary = std::get_if<Binary>(&payload)) {
    TTL_LOG(Debug) << "normalize(" << destination << ") : raw binary, "
                   << binary->bytes.size() << " bytes";
    return NormalizedPayload{.bytes = binary->bytes, .is_binary = true};
  }

  std::string_view text;
  if (const auto* encoded = std::get_if<EncodedBinary>(&payload)) {
    text = encoded->text;
  } else {
    const auto& value = std::get<Structured>(payload).value;
    const auto it     = value.is_object() ? value.find(kAudioDataField) : value.end();
    if (it == value.end() || !it->is_string()) {
      return std::unexpected(makeError(
          ErrorKind::kUnsupportedPayload,
          std::string(destination) + " expects a string '" +
              std::string(kAudioDataField) + "' field"));
    }
    text = it->get_ref<const std::string&>();
  }

  auto bytes = decodeBinaryField(text);
  if (!bytes) {
    return std::unexpected(std::move(bytes.error()));
  }
  TTL_LOG(Debug) << "normalize(" << destination << ") : decoded binary, "
                 << bytes->size() << " bytes";
  return NormalizedPayload{.bytes = std::move(*bytes), .is_binary = true};
}

}  // namespace chunkline::transfer
