/**
 * @file test_frame.cpp
 * @brief Message framing tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <vector>

#include "frame.hpp"
#include "hssim/protocol.hpp"
#include "memory_stream.hpp"

using namespace hssim;
using hssim::test::MemoryStream;
using hssim::test::request_bytes;

/* ========================================================================= */
/* Header codec                                                              */
/* ========================================================================= */

TEST_CASE("Header decoding")
{
  const uint8_t raw[] = {0x03, 0x02, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12};
  const MessageHeader header = internal::decode_header(raw);

  CHECK(header.type == 0x03);
  CHECK(header.device_id == 0x02);
  CHECK(header.length == 0x1234);       // little-endian
  CHECK(header.sequence == 0x12345678);  // little-endian
}

TEST_CASE("Header encoding")
{
  MessageHeader header;
  header.type = 0x80;
  header.device_id = 0x05;
  header.length = 0x0102;
  header.sequence = 0xA1B2C3D4;

  std::vector<uint8_t> out;
  internal::encode_header(header, out);

  const std::vector<uint8_t> expected = {0x80, 0x05, 0x02, 0x01, 0xD4, 0xC3, 0xB2, 0xA1};
  CHECK(out == expected);
}

/* ========================================================================= */
/* Reading messages                                                          */
/* ========================================================================= */

TEST_CASE("Reading messages")
{
  SUBCASE("Empty stream is a clean end")
  {
    MemoryStream stream(std::vector<uint8_t>{});
    Message msg;
    CHECK(internal::read_message(stream, msg) == Status::END_OF_STREAM);
  }

  SUBCASE("Message without payload")
  {
    MemoryStream stream(request_bytes(0x07, 0x01, 42, {}));
    Message msg;
    REQUIRE(internal::read_message(stream, msg) == Status::OK);
    CHECK(msg.header.type == 0x07);
    CHECK(msg.header.device_id == 0x01);
    CHECK(msg.header.length == 0);
    CHECK(msg.header.sequence == 42);
    CHECK(msg.payload.empty());
  }

  SUBCASE("Payload is assembled across short reads")
  {
    const std::vector<uint8_t> payload = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
    MemoryStream stream(request_bytes(0x03, 0x00, 7, payload), 1);
    Message msg;
    REQUIRE(internal::read_message(stream, msg) == Status::OK);
    CHECK(msg.payload == payload);
  }

  SUBCASE("Back-to-back messages")
  {
    std::vector<uint8_t> bytes = request_bytes(0x01, 0x00, 1, {0xAA});
    const std::vector<uint8_t> second = request_bytes(0x02, 0x00, 2, {});
    bytes.insert(bytes.end(), second.begin(), second.end());

    MemoryStream stream(bytes);
    Message msg;
    REQUIRE(internal::read_message(stream, msg) == Status::OK);
    CHECK(msg.header.sequence == 1);
    REQUIRE(internal::read_message(stream, msg) == Status::OK);
    CHECK(msg.header.sequence == 2);
    CHECK(internal::read_message(stream, msg) == Status::END_OF_STREAM);
  }

  SUBCASE("Partial header is truncation")
  {
    MemoryStream stream(std::vector<uint8_t>{0x03, 0x00, 0x02});
    Message msg;
    CHECK(internal::read_message(stream, msg) == Status::TRUNCATED);
  }

  SUBCASE("Missing payload is truncation")
  {
    std::vector<uint8_t> bytes = request_bytes(0x03, 0x00, 1, {0x20, 0x00});
    bytes.pop_back();
    MemoryStream stream(bytes);
    Message msg;
    CHECK(internal::read_message(stream, msg) == Status::TRUNCATED);
  }

  SUBCASE("Header followed by nothing is truncation")
  {
    std::vector<uint8_t> bytes = request_bytes(0x03, 0x00, 1, {0x20, 0x00});
    bytes.resize(HEADER_SIZE);
    MemoryStream stream(bytes);
    Message msg;
    CHECK(internal::read_message(stream, msg) == Status::TRUNCATED);
  }

  SUBCASE("Read failure")
  {
    MemoryStream stream(std::vector<uint8_t>{0x03});
    stream.fail_at_end = true;
    Message msg;
    CHECK(internal::read_message(stream, msg) == Status::IO_ERROR);
  }
}

/* ========================================================================= */
/* Writing replies                                                           */
/* ========================================================================= */

TEST_CASE("Writing replies")
{
  MemoryStream stream(std::vector<uint8_t>{});

  SUBCASE("Reply echoes device and sequence")
  {
    REQUIRE(internal::write_response(stream, 0x03, 0x01020304, {0x21, 0x6A}) == Status::OK);

    const std::vector<uint8_t> expected = {0x80, 0x03, 0x02, 0x00, 0x04,
                                           0x03, 0x02, 0x01, 0x21, 0x6A};
    CHECK(stream.output == expected);
  }

  SUBCASE("Empty reply is a bare header")
  {
    REQUIRE(internal::write_response(stream, 0x00, 9, {}) == Status::OK);
    REQUIRE(stream.output.size() == HEADER_SIZE);
    CHECK(stream.output[0] == static_cast<uint8_t>(MessageType::RESPONSE));
    CHECK(stream.output[2] == 0x00);
    CHECK(stream.output[3] == 0x00);
  }

  SUBCASE("Oversized payload is rejected")
  {
    const std::vector<uint8_t> big(0x10000, 0x00);
    CHECK(internal::write_response(stream, 0x00, 0, big) == Status::INVALID_ARG);
    CHECK(stream.output.empty());
  }

  SUBCASE("Write failure")
  {
    stream.fail_writes = true;
    CHECK(internal::write_response(stream, 0x00, 0, {0x01}) == Status::IO_ERROR);
  }
}

TEST_CASE("Status messages")
{
  CHECK(std::strcmp(status_message(Status::OK), "ok") == 0);
  CHECK(std::strcmp(status_message(Status::TRUNCATED), "stream closed inside a message") == 0);
}
