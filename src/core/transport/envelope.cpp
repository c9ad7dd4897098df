#include "core/transport/envelope.hpp"

#include <nlohmann/json.hpp>

namespace transport {

using json = nlohmann::json;

bool parse_envelope(const uint8_t *data, size_t len, InboundMessage &out,
                    std::string &err) {
  err.clear();

  const json doc = json::parse(data, data + len, nullptr, false);
  if (doc.is_discarded()) {
    err = "envelope is not valid JSON";
    return false;
  }
  if (!doc.is_object()) {
    err = "envelope must be a JSON object";
    return false;
  }

  const auto type_it = doc.find("type");
  if (type_it == doc.end() || !type_it->is_string()) {
    err = "envelope is missing string field 'type'";
    return false;
  }
  const std::string type = type_it->get<std::string>();

  if (type == "ack") {
    Acknowledgment ack;
    const auto id_it = doc.find("reqId");
    if (id_it != doc.end() && !id_it->is_null()) {
      if (!id_it->is_number_unsigned() || id_it->get<uint64_t>() > 0xFFFFFFFFu) {
        err = "ack envelope 'reqId' must be an integer in [0, 4294967295]";
        return false;
      }
      ack.request_id = static_cast<uint32_t>(id_it->get<uint64_t>());
    }
    out = ack;
    return true;
  }

  if (type != "binary") {
    out = UnknownMessage{type};
    return true;
  }

  const auto data_it = doc.find("data");
  if (data_it == doc.end() || !data_it->is_array()) {
    err = "binary envelope is missing array field 'data'";
    return false;
  }

  BinaryFrame frame;
  frame.bytes.reserve(data_it->size());
  for (const auto &v : *data_it) {
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFF) {
      err = "binary envelope 'data' must hold integers in [0, 255]";
      return false;
    }
    frame.bytes.push_back(static_cast<uint8_t>(v.get<uint64_t>()));
  }

  out = std::move(frame);
  return true;
}

std::string encode_binary_envelope(const std::vector<uint8_t> &frame) {
  json doc;
  doc["type"] = "binary";
  doc["data"] = frame;
  return doc.dump();
}

std::string encode_ack_envelope(std::optional<uint32_t> request_id) {
  json doc;
  doc["type"] = "ack";
  if (request_id) {
    doc["reqId"] = *request_id;
  }
  return doc.dump();
}

} // namespace transport
