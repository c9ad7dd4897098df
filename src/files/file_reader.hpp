#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "files/mapped_file.hpp"
#include "files/path_validator.hpp"
#include "protocol/frame.hpp"
#include "protocol/response_stream.hpp"

namespace bridge_fs {

/**
 * @brief READ_RESPONSE frames for one mapped byte range.
 *
 * Chunks are encoded on demand, at most chunk_bytes each, in ascending offset
 * order. Only the final chunk carries the last-chunk flag. An empty range
 * yields a single empty chunk flagged last. The mapping is released as soon as
 * the final chunk has been produced.
 *
 * Before each chunk the file is re-checked; if it has been truncated below the
 * chunk's end the stream yields one IO_ERROR frame instead and ends.
 */
class ChunkedReadStream : public bridge_protocol::ResponseStream {
public:
  ChunkedReadStream(MappedFile file, uint32_t request_id, uint64_t offset,
                    uint64_t length, uint64_t chunk_bytes);

  bool next(std::vector<uint8_t> &out) override;
  bool done() const override;
  std::optional<uint32_t> request_id() const override { return request_id_; }

  // Repositions the cursor to an absolute file offset inside the served range
  // so delivery can resume from there. Returns false if the offset is outside
  // [begin, end) or the mapping has already been released.
  bool rewind_to(uint64_t file_offset);

  uint64_t begin_offset() const { return begin_; }
  uint64_t end_offset() const { return end_; }
  uint64_t cursor() const { return cursor_; }

private:
  MappedFile file_;
  uint32_t request_id_;
  uint64_t begin_;
  uint64_t end_;
  uint64_t cursor_;
  uint64_t chunk_bytes_;
  bool emitted_last_ = false;
};

// Maps an errno from opening a file to the protocol error code. ELOOP means a
// symlink was met on the resolved path, which is treated as a denial.
bridge_protocol::ErrorCode classify_open_errno(int error_number);

// Executes READ requests: decode, authorize, map, clamp, and chunk.
class FileReader {
public:
  FileReader(const PathValidator &validator,
             const doppler_bridge::LimitsConfig &limits);

  // Always returns a stream yielding either exactly one ERROR frame or one or
  // more READ_RESPONSE frames.
  std::unique_ptr<bridge_protocol::ResponseStream>
  read(uint32_t request_id, bridge_protocol::ByteView payload) const;

private:
  std::unique_ptr<bridge_protocol::ResponseStream>
  fail(uint32_t request_id, bridge_protocol::ErrorCode code,
       const std::string &message) const;

  const PathValidator &validator_;
  doppler_bridge::LimitsConfig limits_;
};

} // namespace bridge_fs
