#include "protocol/frame.hpp"

#include <cstring>

#include "protocol/byte_order.hpp"

namespace bridge_protocol {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "NOT_FOUND";
  case ErrorCode::PermissionDenied:
    return "PERMISSION_DENIED";
  case ErrorCode::IoError:
    return "IO_ERROR";
  case ErrorCode::InvalidRequest:
    return "INVALID_REQUEST";
  }
  return "UNKNOWN";
}

bool decode_header(const uint8_t *data, size_t len, FrameHeader &out,
                   std::string &err) {
  err.clear();

  if (data == nullptr || len < kHeaderSize) {
    err = "Message too short";
    return false;
  }

  const uint32_t magic = decode_u32_le(data);
  if (magic != kMagic) {
    err = "Invalid magic";
    return false;
  }

  out.magic = magic;
  out.command = data[4];
  out.flags = data[5];
  // bytes 6..7 are reserved
  out.request_id = decode_u32_le(data + 8);
  out.payload_length = decode_u32_le(data + 12);
  return true;
}

ByteView payload_slice(const FrameHeader &header, const uint8_t *data,
                       size_t len) {
  ByteView view;
  if (data == nullptr || len < kHeaderSize || header.payload_length == 0) {
    return view;
  }

  const size_t available = len - kHeaderSize;
  if (static_cast<uint64_t>(header.payload_length) > available) {
    return view;
  }

  view.data = data + kHeaderSize;
  view.size = header.payload_length;
  return view;
}

std::vector<uint8_t> encode_frame(Command command, uint8_t flags,
                                  uint32_t request_id, const uint8_t *payload,
                                  size_t payload_len) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + payload_len);

  append_u32_le(out, kMagic);
  out.push_back(static_cast<uint8_t>(command));
  out.push_back(flags);
  out.push_back(0);
  out.push_back(0);
  append_u32_le(out, request_id);
  append_u32_le(out, static_cast<uint32_t>(payload_len));

  if (payload_len > 0) {
    out.insert(out.end(), payload, payload + payload_len);
  }
  return out;
}

std::vector<uint8_t> encode_ping(uint32_t request_id) {
  return encode_frame(Command::Ping, 0, request_id, nullptr, 0);
}

std::vector<uint8_t> encode_pong(uint32_t request_id) {
  return encode_frame(Command::Pong, 0, request_id, nullptr, 0);
}

std::vector<uint8_t> encode_read_request(uint32_t request_id, uint64_t offset,
                                         uint64_t length,
                                         const std::string &path) {
  std::vector<uint8_t> payload;
  payload.reserve(16 + path.size());
  append_u64_le(payload, offset);
  append_u64_le(payload, length);
  payload.insert(payload.end(), path.begin(), path.end());
  return encode_frame(Command::Read, 0, request_id, payload.data(),
                      payload.size());
}

std::vector<uint8_t> encode_read_response(uint32_t request_id, uint64_t offset,
                                          const uint8_t *chunk,
                                          size_t chunk_len, bool is_last) {
  const size_t payload_len = 8 + chunk_len;

  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + payload_len);

  append_u32_le(out, kMagic);
  out.push_back(static_cast<uint8_t>(Command::ReadResponse));
  out.push_back(is_last ? kFlagLastChunk : 0);
  out.push_back(0);
  out.push_back(0);
  append_u32_le(out, request_id);
  append_u32_le(out, static_cast<uint32_t>(payload_len));
  append_u64_le(out, offset);

  if (chunk_len > 0) {
    out.insert(out.end(), chunk, chunk + chunk_len);
  }
  return out;
}

std::vector<uint8_t> encode_error(uint32_t request_id, ErrorCode code,
                                  const std::string &message) {
  std::vector<uint8_t> payload;
  payload.reserve(4 + message.size());
  append_u32_le(payload, static_cast<uint32_t>(code));
  payload.insert(payload.end(), message.begin(), message.end());
  return encode_frame(Command::Error, 0, request_id, payload.data(),
                      payload.size());
}

bool decode_read_request(ByteView payload, ReadRequest &out,
                         std::string &err) {
  err.clear();

  if (payload.size < 16) {
    err = "Payload too short";
    return false;
  }

  out.offset = decode_u64_le(payload.data);
  out.length = decode_u64_le(payload.data + 8);

  const uint8_t *path_bytes = payload.data + 16;
  const size_t path_len = payload.size - 16;

  if (path_len == 0) {
    err = "Missing path";
    return false;
  }
  if (!is_valid_utf8(path_bytes, path_len)) {
    err = "Path is not valid UTF-8";
    return false;
  }
  if (std::memchr(path_bytes, 0, path_len) != nullptr) {
    err = "Path contains NUL byte";
    return false;
  }

  out.path.assign(reinterpret_cast<const char *>(path_bytes), path_len);
  return true;
}

bool decode_read_response(ByteView payload, ReadResponse &out,
                          std::string &err) {
  err.clear();

  if (payload.size < 8) {
    err = "READ_RESPONSE payload too short";
    return false;
  }

  out.offset = decode_u64_le(payload.data);
  out.data.assign(payload.data + 8, payload.data + payload.size);
  return true;
}

bool decode_error(ByteView payload, ErrorPayload &out, std::string &err) {
  err.clear();

  if (payload.size < 4) {
    err = "ERROR payload too short";
    return false;
  }

  out.code = static_cast<ErrorCode>(decode_u32_le(payload.data));
  out.message.assign(reinterpret_cast<const char *>(payload.data + 4),
                     payload.size - 4);
  return true;
}

bool is_valid_utf8(const uint8_t *data, size_t len) {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = data[i];

    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }

    if (len - i <= extra) {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k) {
      const uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }

    i += extra + 1;
  }
  return true;
}

} // namespace bridge_protocol
