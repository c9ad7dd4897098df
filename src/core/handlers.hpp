#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "core/transport/envelope.hpp"
#include "files/file_reader.hpp"
#include "protocol/frame.hpp"
#include "protocol/response_stream.hpp"

namespace handlers {

using StreamPtr = std::unique_ptr<bridge_protocol::ResponseStream>;

StreamPtr handle_ping(const bridge_protocol::FrameHeader &header);

StreamPtr handle_read(const bridge_protocol::FrameHeader &header,
                      bridge_protocol::ByteView payload,
                      const bridge_fs::FileReader &reader);

StreamPtr handle_unknown(const bridge_protocol::FrameHeader &header);

// Routes inbound messages to the handlers above. Holds no per-request state.
class CommandDispatcher {
public:
  explicit CommandDispatcher(const bridge_fs::FileReader &reader);

  // Decodes one binary frame and dispatches on its command byte. A frame that
  // fails header decoding yields an INVALID_REQUEST error with request id 0.
  StreamPtr dispatch_frame(const uint8_t *data, size_t len) const;

  // Acknowledgments and unknown envelope types produce an empty stream.
  StreamPtr dispatch(const transport::InboundMessage &msg) const;

private:
  const bridge_fs::FileReader &reader_;
};

} // namespace handlers
