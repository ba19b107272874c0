#include <panoctl/frame_codec.h>
#include <stdexcept>
#include <string>

std::vector<std::uint8_t> escape_payload(const std::vector<std::uint8_t>& raw) {
    std::vector<std::uint8_t> out;
    out.reserve(raw.size() * 2);

    for (std::uint8_t b : raw) {
        if (b == FRAME_MARKER) {
            out.push_back(ESCAPE_MARKER);
            out.push_back(ESCAPED_FRAME_MARKER);
        } else if (b == ESCAPE_MARKER) {
            out.push_back(ESCAPE_MARKER);
            out.push_back(ESCAPED_ESCAPE_MARKER);
        } else {
            out.push_back(b);
        }
    }

    return out;
}

bool unescape_payload(const std::vector<std::uint8_t>& escaped, std::vector<std::uint8_t>& raw) {
    raw.clear();
    raw.reserve(escaped.size());

    for (size_t i = 0; i < escaped.size(); i++) {
        std::uint8_t b = escaped[i];

        if (b == FRAME_MARKER) {
            return false;
        }
        if (b != ESCAPE_MARKER) {
            raw.push_back(b);
            continue;
        }

        if (i + 1 >= escaped.size()) {
            return false;
        }

        std::uint8_t code = escaped[++i];
        if (code == ESCAPED_FRAME_MARKER) {
            raw.push_back(FRAME_MARKER);
        } else if (code == ESCAPED_ESCAPE_MARKER) {
            raw.push_back(ESCAPE_MARKER);
        } else {
            return false;
        }
    }

    return true;
}

std::uint8_t frame_checksum(const std::vector<std::uint8_t>& escaped) {
    std::uint8_t sum = 0;
    for (std::uint8_t b : escaped) {
        sum = static_cast<std::uint8_t>(sum + b);
    }
    return sum;
}

std::vector<std::uint8_t> encode_frame(const std::vector<std::uint8_t>& message) {
    std::vector<std::uint8_t> escaped = escape_payload(message);

    if (escaped.size() > MAX_ESCAPED_PAYLOAD) {
        throw std::length_error("escaped payload is " + std::to_string(escaped.size()) +
                                " bytes, frame limit is " + std::to_string(MAX_ESCAPED_PAYLOAD));
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(escaped.size() + FRAME_OVERHEAD);

    frame.push_back(FRAME_MARKER);
    frame.push_back(static_cast<std::uint8_t>((escaped.size() >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(escaped.size() & 0xFF));
    frame.insert(frame.end(), escaped.begin(), escaped.end());
    frame.push_back(frame_checksum(escaped));
    frame.push_back(FRAME_MARKER);

    return frame;
}

bool decode_frame(const std::vector<std::uint8_t>& frame, std::vector<std::uint8_t>& message) {
    if (frame.size() < FRAME_OVERHEAD) {
        return false;
    }
    if (frame.front() != FRAME_MARKER || frame.back() != FRAME_MARKER) {
        return false;
    }

    size_t length = (static_cast<size_t>(frame[1]) << 8) | frame[2];
    if (length != frame.size() - FRAME_OVERHEAD) {
        return false;
    }

    std::vector<std::uint8_t> escaped(frame.begin() + 3, frame.begin() + 3 + length);
    if (frame_checksum(escaped) != frame[3 + length]) {
        return false;
    }

    return unescape_payload(escaped, message);
}
