#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Wire command names understood by the panel firmware.
#define CMD_TELEMETRY      "all"
#define CMD_MEDIA_DELETE   "mediaDelete"
#define CMD_SCREEN_CONFIG  "waterBlockScreenId"
// Legacy flow: file announced over the serial link.
#define CMD_TRANSPORT      "transport"
#define CMD_TRANSPORTED    "transported"

#define SEQ_NUMBER_MODULUS 100000

// Header text of one command, before it is framed.
//
//   POST <cmd> 1\r\n
//   SeqNumber=..\r\n ... msgId=..\r\n
//   \r\n
//   <json body>
struct CommandMessage {
    std::string command_name;
    std::int64_t sequence_number = 0;
    std::int64_t ack_number = -1;
    std::string body;
    std::int64_t content_length = 0;
    std::int64_t timestamp_ms = 0;

    // Only meaningful to a richer protocol variant; the firmware parser
    // still expects the keys.
    std::int64_t file_name = -1;
    std::int64_t file_size = -1;
    std::int64_t content_range = -1;
    std::int64_t counter = -1;
    std::int64_t msg_id = -1;

    static CommandMessage make(const std::string& command_name, const std::string& json_body,
                               std::int64_t now_ms);

    std::string serialize() const;
};

std::int64_t epoch_millis();

std::vector<std::uint8_t> build_command(const std::string& command_name, const std::string& json_body);
