/**
 * Unit tests for the serial frame codec
 *
 * Byte stuffing, the 8-bit checksum and the frame layout must match the
 * panel firmware bit for bit.
 */
#include <panoctl/frame_codec.h>

#include "../TestUtil.h"
#include <random>
#include <set>
#include <stdexcept>
#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

void test_escape_reserved_bytes(void) {
  std::vector<uint8_t> raw = {0x5A, 0x5B, 0x41};
  std::vector<uint8_t> expected = {0x5B, 0x01, 0x5B, 0x02, 0x41};

  std::vector<uint8_t> escaped = escape_payload(raw);

  TEST_ASSERT_EQUAL(5, escaped.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected.data(), escaped.data(), expected.size());
  TEST_ASSERT_EQUAL_HEX8((0x5B + 0x01 + 0x5B + 0x02 + 0x41) % 256, frame_checksum(escaped));
}

void test_frame_of_reserved_bytes(void) {
  std::vector<uint8_t> frame = encode_frame({0x5A, 0x5B, 0x41});
  std::vector<uint8_t> expected = {0x5A, 0x00, 0x05, 0x5B, 0x01, 0x5B, 0x02, 0x41, 0xFA, 0x5A};

  TEST_ASSERT_EQUAL(expected.size(), frame.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected.data(), frame.data(), expected.size());
}

void test_plain_bytes_pass_through(void) {
  std::vector<uint8_t> raw = {'P', 'O', 'S', 'T', 0x00, 0xFF, 0x59, 0x5C};
  std::vector<uint8_t> escaped = escape_payload(raw);

  TEST_ASSERT_EQUAL(raw.size(), escaped.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(raw.data(), escaped.data(), raw.size());
}

void test_empty_message(void) {
  std::vector<uint8_t> frame = encode_frame({});
  std::vector<uint8_t> expected = {0x5A, 0x00, 0x00, 0x00, 0x5A};
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected.data(), frame.data(), expected.size());

  std::vector<uint8_t> decoded = {0x01};
  TEST_ASSERT_TRUE(decode_frame(frame, decoded));
  TEST_ASSERT_EQUAL(0, decoded.size());
}

void test_checksum_wraps(void) {
  std::vector<uint8_t> bytes(3, 0xFF);
  TEST_ASSERT_EQUAL_HEX8(0xFD, frame_checksum(bytes));
  TEST_ASSERT_EQUAL_HEX8(0x00, frame_checksum({}));
}

void test_checksum_is_byte_sum(void) {
  std::vector<uint8_t> a = {0x10, 0x20, 0x30};
  std::vector<uint8_t> b = {0x30, 0x20, 0x10};
  TEST_ASSERT_EQUAL_HEX8(0x60, frame_checksum(a));
  TEST_ASSERT_EQUAL_HEX8(frame_checksum(a), frame_checksum(a));
  TEST_ASSERT_EQUAL_HEX8(frame_checksum(a), frame_checksum(b));
}

void test_length_field_and_markers(void) {
  std::vector<uint8_t> raw(300, 0x5A);
  raw.push_back('x');
  std::vector<uint8_t> frame = encode_frame(raw);
  size_t escaped_len = escape_payload(raw).size();

  TEST_ASSERT_EQUAL(601, escaped_len);
  TEST_ASSERT_EQUAL(escaped_len + FRAME_OVERHEAD, frame.size());
  TEST_ASSERT_EQUAL_HEX8(FRAME_MARKER, frame.front());
  TEST_ASSERT_EQUAL_HEX8(FRAME_MARKER, frame.back());
  TEST_ASSERT_EQUAL(escaped_len, (static_cast<size_t>(frame[1]) << 8) | frame[2]);
}

void test_escaped_output_has_no_bare_marker(void) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> byte(0, 255);

  for (int round = 0; round < 200; round++) {
    std::vector<uint8_t> raw(1 + round % 64);
    for (auto& b : raw) b = static_cast<uint8_t>(byte(rng));

    std::vector<uint8_t> escaped = escape_payload(raw);
    for (size_t i = 0; i < escaped.size(); i++) {
      TEST_ASSERT_NOT_EQUAL(FRAME_MARKER, escaped[i]);
      if (escaped[i] == ESCAPE_MARKER) {
        TEST_ASSERT_TRUE(i + 1 < escaped.size());
        uint8_t code = escaped[++i];
        TEST_ASSERT_TRUE(code == ESCAPED_FRAME_MARKER || code == ESCAPED_ESCAPE_MARKER);
      }
    }
  }
}

void test_escape_is_injective(void) {
  // Every 2-byte message over a small alphabet that includes both reserved bytes.
  const uint8_t alphabet[] = {0x00, 0x01, 0x02, 0x5A, 0x5B};
  std::set<std::vector<uint8_t>> seen;
  int count = 0;

  for (uint8_t a : alphabet) {
    for (uint8_t b : alphabet) {
      seen.insert(escape_payload({a, b}));
      count++;
    }
  }
  TEST_ASSERT_EQUAL(count, seen.size());
}

void test_decode_recovers_message(void) {
  std::mt19937 rng(99);
  std::uniform_int_distribution<int> byte(0, 255);

  for (int round = 0; round < 100; round++) {
    std::vector<uint8_t> raw(round * 7);
    for (auto& b : raw) b = static_cast<uint8_t>(byte(rng));

    std::vector<uint8_t> decoded;
    TEST_ASSERT_TRUE(decode_frame(encode_frame(raw), decoded));
    TEST_ASSERT_TRUE(raw == decoded);
  }
}

void test_decode_rejects_bad_checksum(void) {
  std::vector<uint8_t> frame = encode_frame({'a', 'b', 'c'});
  frame[frame.size() - 2] ^= 0x01;

  std::vector<uint8_t> decoded;
  TEST_ASSERT_FALSE(decode_frame(frame, decoded));
}

void test_decode_rejects_bad_length(void) {
  std::vector<uint8_t> frame = encode_frame({'a', 'b', 'c'});
  frame[2] = 0x04;

  std::vector<uint8_t> decoded;
  TEST_ASSERT_FALSE(decode_frame(frame, decoded));
}

void test_decode_rejects_bad_markers(void) {
  std::vector<uint8_t> frame = encode_frame({'a'});
  std::vector<uint8_t> decoded;

  std::vector<uint8_t> no_start = frame;
  no_start.front() = 0x00;
  TEST_ASSERT_FALSE(decode_frame(no_start, decoded));

  std::vector<uint8_t> no_end = frame;
  no_end.back() = 0x00;
  TEST_ASSERT_FALSE(decode_frame(no_end, decoded));

  TEST_ASSERT_FALSE(decode_frame({0x5A, 0x00, 0x5A}, decoded));
}

void test_unescape_rejects_invalid_sequences(void) {
  std::vector<uint8_t> raw;
  TEST_ASSERT_FALSE(unescape_payload({0x41, 0x5B}, raw));
  TEST_ASSERT_FALSE(unescape_payload({0x5B, 0x03}, raw));
  TEST_ASSERT_FALSE(unescape_payload({0x41, 0x5A, 0x41}, raw));
}

void test_oversize_payload_throws(void) {
  // 40000 markers escape to 80000 bytes, past the 16-bit length field.
  std::vector<uint8_t> raw(40000, 0x5A);
  bool thrown = false;
  try {
    encode_frame(raw);
  } catch (const std::length_error&) {
    thrown = true;
  }
  TEST_ASSERT_TRUE(thrown);
}

void test_largest_payload_fits(void) {
  std::vector<uint8_t> raw(MAX_ESCAPED_PAYLOAD, 'a');
  std::vector<uint8_t> frame = encode_frame(raw);
  TEST_ASSERT_EQUAL(MAX_ESCAPED_PAYLOAD + FRAME_OVERHEAD, frame.size());
  TEST_ASSERT_EQUAL_HEX8(0xFF, frame[1]);
  TEST_ASSERT_EQUAL_HEX8(0xFF, frame[2]);
}

int main(void) {
  UNITY_BEGIN();

  // escaping and checksum
  RUN_TEST(test_escape_reserved_bytes);
  RUN_TEST(test_frame_of_reserved_bytes);
  RUN_TEST(test_plain_bytes_pass_through);
  RUN_TEST(test_empty_message);
  RUN_TEST(test_checksum_wraps);
  RUN_TEST(test_checksum_is_byte_sum);

  // frame layout
  RUN_TEST(test_length_field_and_markers);
  RUN_TEST(test_escaped_output_has_no_bare_marker);
  RUN_TEST(test_escape_is_injective);

  // decoding
  RUN_TEST(test_decode_recovers_message);
  RUN_TEST(test_decode_rejects_bad_checksum);
  RUN_TEST(test_decode_rejects_bad_length);
  RUN_TEST(test_decode_rejects_bad_markers);
  RUN_TEST(test_unescape_rejects_invalid_sequences);

  // limits
  RUN_TEST(test_oversize_payload_throws);
  RUN_TEST(test_largest_payload_fits);

  return UNITY_END();
}
