#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Framing: [0x5A][len(2, BE)][escaped payload...][sum8][0x5A]
//
// len and sum8 both cover the escaped payload, not the raw message.

constexpr std::uint8_t FRAME_MARKER = 0x5A;
constexpr std::uint8_t ESCAPE_MARKER = 0x5B;
constexpr std::uint8_t ESCAPED_FRAME_MARKER = 0x01;
constexpr std::uint8_t ESCAPED_ESCAPE_MARKER = 0x02;

constexpr std::size_t FRAME_OVERHEAD = 5;
constexpr std::size_t MAX_ESCAPED_PAYLOAD = 0xFFFF;

/**
 * Byte-stuff a raw message.
 * 0x5A -> 0x5B 0x01, 0x5B -> 0x5B 0x02, everything else passes through.
 */
std::vector<std::uint8_t> escape_payload(const std::vector<std::uint8_t>& raw);

/**
 * Reverse escape_payload().
 * @param escaped Escaped payload
 * @param raw Receives the original bytes
 * @return false on a dangling escape byte, an unknown escape code or a bare frame marker
 */
bool unescape_payload(const std::vector<std::uint8_t>& escaped, std::vector<std::uint8_t>& raw);

// Unsigned 8-bit sum with wraparound.
std::uint8_t frame_checksum(const std::vector<std::uint8_t>& escaped);

/**
 * Wrap a raw message into a complete frame.
 * @throws std::length_error if the escaped payload does not fit the 16-bit length field
 */
std::vector<std::uint8_t> encode_frame(const std::vector<std::uint8_t>& message);

/**
 * Validate a complete frame and recover the raw message.
 * @return false on bad markers, length mismatch, checksum mismatch or bad escaping
 */
bool decode_frame(const std::vector<std::uint8_t>& frame, std::vector<std::uint8_t>& message);
