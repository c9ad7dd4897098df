#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace transport {

// {"type":"binary","data":[...]}
struct BinaryFrame {
  std::vector<uint8_t> bytes;
};

// {"type":"ack","reqId":N}: flow-control acknowledgment, never answered.
// request_id is empty when the host omits reqId.
struct Acknowledgment {
  std::optional<uint32_t> request_id;
};

// Any other "type"; logged and dropped.
struct UnknownMessage {
  std::string type;
};

using InboundMessage = std::variant<BinaryFrame, Acknowledgment, UnknownMessage>;

// Parses one UTF-8 JSON envelope. Returns false and sets err when the text is
// not JSON, is not an object, lacks a string "type", a binary envelope's
// "data" is not an array of integers in [0, 255], or an ack's "reqId" is not
// a u32.
bool parse_envelope(const uint8_t *data, size_t len, InboundMessage &out,
                    std::string &err);

// Wraps an outbound frame as {"type":"binary","data":[...]}.
std::string encode_binary_envelope(const std::vector<uint8_t> &frame);

std::string encode_ack_envelope(std::optional<uint32_t> request_id = {});

} // namespace transport
