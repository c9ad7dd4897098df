#include "core/handlers.hpp"

#include <cstdio>
#include <iostream>
#include <string>

namespace handlers {

using bridge_protocol::ByteView;
using bridge_protocol::Command;
using bridge_protocol::ErrorCode;
using bridge_protocol::FrameHeader;

StreamPtr handle_ping(const FrameHeader &header) {
  return bridge_protocol::make_single_frame_stream(
      bridge_protocol::encode_pong(header.request_id));
}

StreamPtr handle_read(const FrameHeader &header, ByteView payload,
                      const bridge_fs::FileReader &reader) {
  return reader.read(header.request_id, payload);
}

StreamPtr handle_unknown(const FrameHeader &header) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X",
                static_cast<unsigned>(header.command));
  return bridge_protocol::make_single_frame_stream(bridge_protocol::encode_error(
      header.request_id, ErrorCode::InvalidRequest,
      std::string("Unknown command ") + buf));
}

CommandDispatcher::CommandDispatcher(const bridge_fs::FileReader &reader)
    : reader_(reader) {}

StreamPtr CommandDispatcher::dispatch_frame(const uint8_t *data,
                                            size_t len) const {
  FrameHeader header;
  std::string err;
  if (!bridge_protocol::decode_header(data, len, header, err)) {
    std::cerr << "[Dispatcher] malformed frame: " << err << "\n";
    return bridge_protocol::make_single_frame_stream(
        bridge_protocol::encode_error(0, ErrorCode::InvalidRequest, err));
  }

  const ByteView payload = bridge_protocol::payload_slice(header, data, len);

  switch (static_cast<Command>(header.command)) {
  case Command::Ping:
    return handle_ping(header);
  case Command::Read:
    return handle_read(header, payload, reader_);
  default:
    // PONG, READ_RESPONSE and ERROR are replies, not requests.
    return handle_unknown(header);
  }
}

StreamPtr CommandDispatcher::dispatch(const transport::InboundMessage &msg) const {
  if (const auto *frame = std::get_if<transport::BinaryFrame>(&msg)) {
    return dispatch_frame(frame->bytes.data(), frame->bytes.size());
  }
  if (const auto *unknown = std::get_if<transport::UnknownMessage>(&msg)) {
    std::cerr << "[Dispatcher] dropping message of unknown type '"
              << unknown->type << "'\n";
  }
  return bridge_protocol::make_empty_stream();
}

} // namespace handlers
