#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bridge_protocol {

// "REPL" read as a little-endian u32.
constexpr uint32_t kMagic = 0x5245504Cu;
constexpr size_t kHeaderSize = 16;

// Transfer unit for READ_RESPONSE chunks.
constexpr uint64_t kDefaultChunkBytes = 8ull * 1024ull * 1024ull;

// Largest chunk whose READ_RESPONSE payload (8-byte offset + data) still fits
// the u32 payloadLength field.
constexpr uint64_t kMaxChunkBytes = 0xFFFFFFFFull - 8ull;

enum class Command : uint8_t {
  Ping = 0x00,
  Pong = 0x01,
  Read = 0x02,
  ReadResponse = 0x03,
  Error = 0xFF,
};

constexpr uint8_t kFlagLastChunk = 0x02;

enum class ErrorCode : uint32_t {
  NotFound = 1,
  PermissionDenied = 2,
  IoError = 3,
  InvalidRequest = 4,
};

const char *error_code_name(ErrorCode code);

struct FrameHeader {
  uint32_t magic = kMagic;
  uint8_t command = 0;
  uint8_t flags = 0;
  uint32_t request_id = 0;
  uint32_t payload_length = 0;

  bool is_last_chunk() const { return (flags & kFlagLastChunk) != 0; }
};

// Non-owning view of bytes inside an inbound buffer.
struct ByteView {
  const uint8_t *data = nullptr;
  size_t size = 0;

  bool empty() const { return size == 0; }
};

struct ReadRequest {
  uint64_t offset = 0;
  uint64_t length = 0;
  std::string path;
};

struct ReadResponse {
  uint64_t offset = 0;
  std::vector<uint8_t> data;
};

struct ErrorPayload {
  ErrorCode code = ErrorCode::InvalidRequest;
  std::string message;
};

// Decodes the fixed 16-byte header.
// Returns false and sets err when the buffer is shorter than the header or the
// magic does not match. payload_length is not checked here; use
// payload_slice() to extract the payload.
bool decode_header(const uint8_t *data, size_t len, FrameHeader &out,
                   std::string &err);

// Payload bytes following the header. A nominal payload_length larger than the
// bytes actually present degrades to an empty payload.
ByteView payload_slice(const FrameHeader &header, const uint8_t *data,
                       size_t len);

std::vector<uint8_t> encode_frame(Command command, uint8_t flags,
                                  uint32_t request_id, const uint8_t *payload,
                                  size_t payload_len);

std::vector<uint8_t> encode_ping(uint32_t request_id);
std::vector<uint8_t> encode_pong(uint32_t request_id);

std::vector<uint8_t> encode_read_request(uint32_t request_id, uint64_t offset,
                                         uint64_t length,
                                         const std::string &path);

// payload = u64 offset + chunk bytes; flags carry kFlagLastChunk iff is_last.
std::vector<uint8_t> encode_read_response(uint32_t request_id, uint64_t offset,
                                          const uint8_t *chunk,
                                          size_t chunk_len, bool is_last);

// payload = u32 code + UTF-8 message bytes, no terminator.
std::vector<uint8_t> encode_error(uint32_t request_id, ErrorCode code,
                                  const std::string &message);

// Decodes a READ payload: 16 bytes of offset/length then a UTF-8 path.
// On failure err holds a message suitable for an INVALID_REQUEST reply.
bool decode_read_request(ByteView payload, ReadRequest &out, std::string &err);

bool decode_read_response(ByteView payload, ReadResponse &out,
                          std::string &err);

bool decode_error(ByteView payload, ErrorPayload &out, std::string &err);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above
// U+10FFFF.
bool is_valid_utf8(const uint8_t *data, size_t len);

} // namespace bridge_protocol
