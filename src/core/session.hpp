#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <deque>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "core/handlers.hpp"
#include "core/transport/envelope.hpp"
#include "core/transport/framed_stdio.hpp"

namespace bridge_core {

struct SessionOptions {
  uint32_t max_message_bytes = transport::kMaxInboundBytes;
  // Frames of one response that may be written before an ack is required.
  // 0 disables flow control.
  uint32_t window = 0;
  // Binary frames held while awaiting an ack; further ones are dropped.
  size_t max_pending_messages = 64;
};

// Process exit codes returned by Session::run()
constexpr int kExitOk = 0;
constexpr int kExitReadError = 2;
constexpr int kExitWriteError = 5;

/**
 * @brief Single-threaded request loop over a framed stdio channel.
 *
 * Each inbound envelope is dispatched and every frame of its response is
 * written, in order, before the next envelope is handled. With a non-zero
 * window the loop blocks between frames of a multi-frame response until the
 * host acknowledges that response. Acks carrying another request's id are
 * ignored. Binary frames that arrive during the wait are queued, up to
 * max_pending_messages, and handled afterwards.
 *
 * Malformed envelopes, unknown envelope types, and zero-length or oversized
 * messages are logged and dropped. Only EOF and stream failures end run().
 */
class Session {
public:
  Session(std::istream &in, std::ostream &out,
          const handlers::CommandDispatcher &dispatcher,
          const SessionOptions &options);

  // Runs until EOF or a fatal transport error; returns the exit code.
  int run();

  uint64_t messages_handled() const { return messages_handled_; }
  uint64_t frames_written() const { return frames_written_; }
  uint64_t messages_dropped() const { return messages_dropped_; }

private:
  enum class Next { Message, Eof, Error };

  // Reads the next usable envelope from the stream, skipping dropped ones.
  Next read_message(transport::InboundMessage &msg);

  // Next message to handle: queued ones first.
  Next next_message(transport::InboundMessage &msg);

  // Writes every frame of stream, honoring the ack window.
  Next serve(bridge_protocol::ResponseStream &stream);

  // Blocks until one ack for request_id (or an ack without an id) has been
  // received, queueing other binary frames.
  Next await_ack(std::optional<uint32_t> request_id);

  bool write_envelope(const std::vector<uint8_t> &frame);

  std::istream &in_;
  std::ostream &out_;
  const handlers::CommandDispatcher &dispatcher_;
  SessionOptions options_;

  std::deque<transport::InboundMessage> pending_;
  std::vector<uint8_t> buffer_;
  std::string io_err_;
  bool write_failed_ = false;

  uint64_t messages_handled_ = 0;
  uint64_t frames_written_ = 0;
  uint64_t messages_dropped_ = 0;
};

} // namespace bridge_core
