#include "files/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace bridge_fs {

using bridge_protocol::ByteView;
using bridge_protocol::ErrorCode;
using bridge_protocol::ReadRequest;
using bridge_protocol::ResponseStream;

ChunkedReadStream::ChunkedReadStream(MappedFile file, uint32_t request_id,
                                     uint64_t offset, uint64_t length,
                                     uint64_t chunk_bytes)
    : file_(std::move(file)), request_id_(request_id), begin_(offset),
      end_(offset + length), cursor_(offset), chunk_bytes_(chunk_bytes) {}

bool ChunkedReadStream::done() const { return emitted_last_; }

bool ChunkedReadStream::next(std::vector<uint8_t> &out) {
  if (emitted_last_) {
    return false;
  }

  const uint64_t n = std::min(chunk_bytes_, end_ - cursor_);
  const bool is_last = cursor_ + n >= end_;

  int error_number = 0;
  if (n > 0 && !file_.covers(cursor_ + n, error_number)) {
    const std::string message =
        error_number != 0
            ? std::string("Stat failed: ") + std::strerror(error_number)
            : std::string("File changed during read");
    std::cerr << "[FileReader] request " << request_id_
              << " aborted at offset " << cursor_ << ": " << message << "\n";
    out = bridge_protocol::encode_error(request_id_, ErrorCode::IoError,
                                        message);
    emitted_last_ = true;
    file_.reset();
    return true;
  }
  const uint8_t *chunk = n > 0 ? file_.data() + cursor_ : nullptr;

  out = bridge_protocol::encode_read_response(request_id_, cursor_, chunk,
                                              static_cast<size_t>(n), is_last);
  cursor_ += n;

  if (is_last) {
    emitted_last_ = true;
    file_.reset();
  }
  return true;
}

bool ChunkedReadStream::rewind_to(uint64_t file_offset) {
  if (!file_.is_open()) {
    return false;
  }
  if (file_offset < begin_ || (file_offset >= end_ && begin_ != end_)) {
    return false;
  }
  if (begin_ == end_ && file_offset != begin_) {
    return false;
  }

  cursor_ = file_offset;
  emitted_last_ = false;
  return true;
}

FileReader::FileReader(const PathValidator &validator,
                       const doppler_bridge::LimitsConfig &limits)
    : validator_(validator), limits_(limits) {}

std::unique_ptr<ResponseStream>
FileReader::fail(uint32_t request_id, ErrorCode code,
                 const std::string &message) const {
  std::cerr << "[FileReader] request " << request_id << " failed: "
            << bridge_protocol::error_code_name(code) << " (" << message
            << ")\n";
  return bridge_protocol::make_single_frame_stream(
      bridge_protocol::encode_error(request_id, code, message));
}

ErrorCode classify_open_errno(int error_number) {
  switch (error_number) {
  case ENOENT:
  case ENOTDIR:
    return ErrorCode::NotFound;
  case EACCES:
  case EPERM:
  case ELOOP:
    return ErrorCode::PermissionDenied;
  default:
    return ErrorCode::IoError;
  }
}

std::unique_ptr<ResponseStream> FileReader::read(uint32_t request_id,
                                                 ByteView payload) const {
  ReadRequest req;
  std::string err;
  if (!bridge_protocol::decode_read_request(payload, req, err)) {
    return fail(request_id, ErrorCode::InvalidRequest, err);
  }

  const std::optional<std::string> resolved = validator_.resolve(req.path);
  if (!resolved) {
    return fail(request_id, ErrorCode::PermissionDenied,
                "Path not in allowed directory");
  }

  // Open the checked path, not the requested one, so a symlink swapped in
  // after validation is refused rather than followed.
  MappedFile file;
  MapFailure failure;
  if (!file.open(*resolved, failure)) {
    switch (failure.stage) {
    case MapFailure::Stage::Open: {
      const ErrorCode code = classify_open_errno(failure.error_number);
      if (code == ErrorCode::NotFound) {
        return fail(request_id, code, "File not found");
      }
      if (code == ErrorCode::PermissionDenied) {
        return fail(request_id, code, "Permission denied");
      }
      return fail(request_id, code,
                  std::string("Open failed: ") +
                      std::strerror(failure.error_number));
    }
    case MapFailure::Stage::Stat:
      return fail(request_id, ErrorCode::IoError,
                  std::string("Stat failed: ") +
                      std::strerror(failure.error_number));
    case MapFailure::Stage::NotRegular:
      return fail(request_id, ErrorCode::IoError, "Not a regular file");
    case MapFailure::Stage::Map:
      return fail(request_id, ErrorCode::IoError,
                  std::string("Map failed: ") +
                      std::strerror(failure.error_number));
    }
  }

  const uint64_t file_size = file.size();
  if (req.offset >= file_size) {
    return fail(request_id, ErrorCode::InvalidRequest,
                "Offset beyond file end");
  }

  uint64_t actual = std::min(req.length, file_size - req.offset);
  actual = std::min(actual, limits_.max_read_bytes);

  return std::make_unique<ChunkedReadStream>(std::move(file), request_id,
                                             req.offset, actual,
                                             limits_.chunk_bytes);
}

} // namespace bridge_fs
