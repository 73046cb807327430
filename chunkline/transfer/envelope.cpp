#include "envelope.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace chunkline::transfer {

namespace {

constexpr size_t kMaxDetailBytes = 512;

std::string truncated(std::string_view text) {
  if (text.size() <= kMaxDetailBytes) {
    return std::string(text);
  }
  return std::string(text.substr(0, kMaxDetailBytes)) + "...(" +
         std::to_string(text.size()) + " bytes)";
}

}  // namespace

std::expected<std::string, TransferError> encodeEnvelope(
    const ChunkEnvelope& envelope) {
  // Field order follows the wire examples.
  nlohmann::ordered_json j;
  j["chunked"]     = true;
  j["chunkId"]     = envelope.chunk_id;
  j["chunkIndex"]  = envelope.chunk_index;
  j["totalChunks"] = envelope.total_chunks;
  j["chunkData"]   = envelope.chunk_data;
  j["isBinary"]    = envelope.is_binary;
  try {
    return j.dump();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorKind::kEncoding, e.what()));
  }
}

std::expected<ChunkEnvelope, TransferError> decodeEnvelope(std::string_view body) {
  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::unexpected(
        makeError(ErrorKind::kDecoding, "envelope is not a JSON object"));
  }
  try {
    if (!j.at("chunked").get<bool>()) {
      return std::unexpected(
          makeError(ErrorKind::kDecoding, "envelope is not chunked"));
    }
    ChunkEnvelope envelope;
    envelope.chunk_id     = j.at("chunkId").get<std::string>();
    envelope.chunk_index  = j.at("chunkIndex").get<size_t>();
    envelope.total_chunks = j.at("totalChunks").get<size_t>();
    envelope.chunk_data   = j.at("chunkData").get<std::string>();
    envelope.is_binary    = j.at("isBinary").get<bool>();
    if (envelope.total_chunks == 0 ||
        envelope.chunk_index >= envelope.total_chunks) {
      return std::unexpected(makeError(ErrorKind::kDecoding,
                                       "chunkIndex out of range"));
    }
    return envelope;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorKind::kDecoding, e.what()));
  }
}

std::expected<ChunkAck, TransferError> parseAck(std::string_view body) {
  auto reject = [&]() {
    return std::unexpected(makeError(ErrorKind::kAcknowledgment,
                                     "unexpected ack " + truncated(body)));
  };

  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return reject();
  }

  const auto status   = j.find("status");
  const auto received = j.find("received");
  const auto total    = j.find("total");
  if (status == j.end() || !status->is_string() ||
      status->get_ref<const std::string&>() != kChunkReceived) {
    return reject();
  }
  if (received == j.end() || !received->is_number_unsigned() ||
      total == j.end() || !total->is_number_unsigned()) {
    return reject();
  }
  return ChunkAck{.received = received->get<size_t>(),
                  .total    = total->get<size_t>()};
}

std::string describeErrorBody(std::string_view body) {
  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (!j.is_discarded()) {
    return truncated(j.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace));
  }
  return truncated(body);
}

}  // namespace chunkline::transfer
