#include "core/session.hpp"

#include <iostream>

namespace bridge_core {

Session::Session(std::istream &in, std::ostream &out,
                 const handlers::CommandDispatcher &dispatcher,
                 const SessionOptions &options)
    : in_(in), out_(out), dispatcher_(dispatcher), options_(options) {}

Session::Next Session::read_message(transport::InboundMessage &msg) {
  while (true) {
    buffer_.clear();
    const transport::ReadStatus status =
        transport::read_frame(in_, buffer_, io_err_, options_.max_message_bytes);

    switch (status) {
    case transport::ReadStatus::Eof:
      return Next::Eof;
    case transport::ReadStatus::Error:
      std::cerr << "[Session] read_frame error: " << io_err_ << "\n";
      return Next::Error;
    case transport::ReadStatus::Skipped:
      std::cerr << "[Session] dropped message: " << io_err_ << "\n";
      continue;
    case transport::ReadStatus::Ok:
      break;
    }

    std::string err;
    if (!transport::parse_envelope(buffer_.data(), buffer_.size(), msg, err)) {
      std::cerr << "[Session] dropped message: " << err << "\n";
      continue;
    }
    return Next::Message;
  }
}

Session::Next Session::next_message(transport::InboundMessage &msg) {
  if (!pending_.empty()) {
    msg = std::move(pending_.front());
    pending_.pop_front();
    return Next::Message;
  }
  return read_message(msg);
}

bool Session::write_envelope(const std::vector<uint8_t> &frame) {
  const std::string envelope = transport::encode_binary_envelope(frame);
  if (!transport::write_frame(
          out_, reinterpret_cast<const uint8_t *>(envelope.data()),
          envelope.size(), io_err_)) {
    std::cerr << "[Session] write_frame error: " << io_err_ << "\n";
    write_failed_ = true;
    return false;
  }
  ++frames_written_;
  return true;
}

Session::Next Session::await_ack(std::optional<uint32_t> request_id) {
  while (true) {
    transport::InboundMessage msg;
    const Next next = read_message(msg);
    if (next != Next::Message) {
      return next;
    }

    if (const auto *ack = std::get_if<transport::Acknowledgment>(&msg)) {
      if (!request_id || !ack->request_id || *ack->request_id == *request_id) {
        return Next::Message;
      }
      std::cerr << "[Session] ignoring ack for request " << *ack->request_id
                << " while streaming request " << *request_id << "\n";
      continue;
    }
    if (const auto *unknown = std::get_if<transport::UnknownMessage>(&msg)) {
      std::cerr << "[Session] dropping message of unknown type '"
                << unknown->type << "' while awaiting ack\n";
      continue;
    }
    if (pending_.size() >= options_.max_pending_messages) {
      ++messages_dropped_;
      std::cerr << "[Session] pending queue full (" << pending_.size()
                << "); dropping message received while awaiting ack\n";
      continue;
    }
    pending_.push_back(std::move(msg));
  }
}

Session::Next Session::serve(bridge_protocol::ResponseStream &stream) {
  std::vector<uint8_t> frame;
  uint32_t unacked = 0;

  while (stream.next(frame)) {
    if (!write_envelope(frame)) {
      return Next::Error;
    }
    if (stream.done() || options_.window == 0) {
      continue;
    }

    ++unacked;
    while (unacked >= options_.window) {
      const Next next = await_ack(stream.request_id());
      if (next != Next::Message) {
        if (next == Next::Eof) {
          std::cerr << "[Session] EOF while awaiting ack; abandoning response\n";
        }
        return next;
      }
      --unacked;
    }
  }
  return Next::Message;
}

int Session::run() {
  while (true) {
    transport::InboundMessage msg;
    Next next = next_message(msg);
    if (next == Next::Eof) {
      return kExitOk;
    }
    if (next == Next::Error) {
      return kExitReadError;
    }

    ++messages_handled_;
    handlers::StreamPtr stream = dispatcher_.dispatch(msg);

    next = serve(*stream);
    if (next == Next::Eof) {
      return kExitOk;
    }
    if (next == Next::Error) {
      return write_failed_ ? kExitWriteError : kExitReadError;
    }
  }
}

} // namespace bridge_core
