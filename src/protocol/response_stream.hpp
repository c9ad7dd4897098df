#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace bridge_protocol {

// Finite, lazily produced sequence of outbound frames for one request.
class ResponseStream {
public:
  virtual ~ResponseStream() = default;

  // Produces the next frame into out. Returns false once exhausted.
  virtual bool next(std::vector<uint8_t> &out) = 0;

  virtual bool done() const = 0;

  // Request the frames answer, when acks must be matched against it.
  virtual std::optional<uint32_t> request_id() const { return std::nullopt; }
};

// Stream over frames that were built eagerly (pong, error, or nothing).
class FrameListStream : public ResponseStream {
public:
  FrameListStream() = default;
  explicit FrameListStream(std::vector<std::vector<uint8_t>> frames)
      : frames_(std::move(frames)) {}

  bool next(std::vector<uint8_t> &out) override {
    if (done()) {
      return false;
    }
    out = std::move(frames_[pos_++]);
    return true;
  }

  bool done() const override { return pos_ >= frames_.size(); }

private:
  std::vector<std::vector<uint8_t>> frames_;
  size_t pos_ = 0;
};

inline std::unique_ptr<ResponseStream> make_empty_stream() {
  return std::make_unique<FrameListStream>();
}

inline std::unique_ptr<ResponseStream>
make_single_frame_stream(std::vector<uint8_t> frame) {
  std::vector<std::vector<uint8_t>> frames;
  frames.push_back(std::move(frame));
  return std::make_unique<FrameListStream>(std::move(frames));
}

} // namespace bridge_protocol
