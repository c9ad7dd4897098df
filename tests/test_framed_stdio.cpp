#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/transport/framed_stdio.hpp"

using namespace transport;

namespace {

std::string prefixed(const std::string &body, uint32_t len) {
  std::string out;
  out.push_back(static_cast<char>(len & 0xFF));
  out.push_back(static_cast<char>((len >> 8) & 0xFF));
  out.push_back(static_cast<char>((len >> 16) & 0xFF));
  out.push_back(static_cast<char>((len >> 24) & 0xFF));
  return out + body;
}

std::string prefixed(const std::string &body) {
  return prefixed(body, static_cast<uint32_t>(body.size()));
}

} // namespace

TEST(FramedStdio, WriteThenReadRoundTrip) {
  std::stringstream stream;
  std::string err;
  const std::string body = "{\"type\":\"ack\"}";
  ASSERT_TRUE(write_frame(stream,
                          reinterpret_cast<const uint8_t *>(body.data()),
                          body.size(), err))
      << err;

  const std::string raw = stream.str();
  ASSERT_EQ(raw.size(), 4 + body.size());
  EXPECT_EQ(static_cast<uint8_t>(raw[0]), body.size());
  EXPECT_EQ(raw[1], 0);

  std::vector<uint8_t> out;
  EXPECT_EQ(read_frame(stream, out, err), ReadStatus::Ok);
  EXPECT_EQ(std::string(out.begin(), out.end()), body);
  EXPECT_EQ(read_frame(stream, out, err), ReadStatus::Eof);
  EXPECT_TRUE(err.empty());
}

TEST(FramedStdio, CleanEofOnEmptyInput) {
  std::istringstream in("");
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err), ReadStatus::Eof);
}

TEST(FramedStdio, TruncatedHeaderIsError) {
  std::istringstream in(std::string("\x05\x00", 2));
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err), ReadStatus::Error);
  EXPECT_FALSE(err.empty());
}

TEST(FramedStdio, TruncatedPayloadIsError) {
  std::istringstream in(prefixed("abc", 10));
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err), ReadStatus::Error);
}

TEST(FramedStdio, ZeroLengthIsSkipped) {
  std::istringstream in(prefixed("", 0) + prefixed("next"));
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err), ReadStatus::Skipped);
  EXPECT_EQ(read_frame(in, out, err), ReadStatus::Ok);
  EXPECT_EQ(std::string(out.begin(), out.end()), "next");
}

TEST(FramedStdio, OversizedFrameIsDrainedAndStreamStaysInSync) {
  std::istringstream in(prefixed(std::string(64, 'x')) + prefixed("ok"));
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err, 16), ReadStatus::Skipped);
  EXPECT_NE(err.find("exceeds max"), std::string::npos);
  EXPECT_EQ(read_frame(in, out, err, 16), ReadStatus::Ok);
  EXPECT_EQ(std::string(out.begin(), out.end()), "ok");
}

TEST(FramedStdio, OversizedFrameCutShortIsError) {
  std::istringstream in(prefixed("short", 1000));
  std::vector<uint8_t> out;
  std::string err;
  EXPECT_EQ(read_frame(in, out, err, 16), ReadStatus::Error);
}

TEST(FramedStdio, WriteRejectsEmptyAndOversized) {
  std::stringstream stream;
  std::string err;
  const uint8_t data[8] = {};
  EXPECT_FALSE(write_frame(stream, data, 0, err));
  EXPECT_FALSE(write_frame(stream, data, 8, err, 4));
  EXPECT_TRUE(stream.str().empty());
}

TEST(FramedStdio, WriteToFailedStreamReportsError) {
  std::stringstream stream;
  stream.setstate(std::ios::badbit);
  std::string err;
  const uint8_t data[2] = {1, 2};
  EXPECT_FALSE(write_frame(stream, data, 2, err));
  EXPECT_FALSE(err.empty());
}
