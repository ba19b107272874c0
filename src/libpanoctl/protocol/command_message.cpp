#include <panoctl/command_message.h>
#include <chrono>
#include <sstream>

std::int64_t epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

CommandMessage CommandMessage::make(const std::string& command_name, const std::string& json_body,
                                    std::int64_t now_ms) {
    CommandMessage msg;
    msg.command_name = command_name;
    msg.sequence_number = now_ms % SEQ_NUMBER_MODULUS;
    msg.body = json_body;
    msg.content_length = static_cast<std::int64_t>(json_body.size());
    msg.timestamp_ms = now_ms;
    return msg;
}

std::string CommandMessage::serialize() const {
    std::ostringstream out;

    out << "POST " << command_name << " 1\r\n";
    out << "SeqNumber=" << sequence_number << "\r\n";
    out << "AckNumber=" << ack_number << "\r\n";
    out << "ContentLength=" << content_length << "\r\n";
    out << "ContentType=json\r\n";
    out << "FileName=" << file_name << "\r\n";
    out << "FileSize=" << file_size << "\r\n";
    out << "ContentRange=" << content_range << "\r\n";
    out << "Counter=" << counter << "\r\n";
    out << "Date=" << timestamp_ms << "\r\n";
    out << "msgId=" << msg_id << "\r\n";
    out << "\r\n";
    out << body;

    return out.str();
}

std::vector<std::uint8_t> build_command(const std::string& command_name, const std::string& json_body) {
    std::string text = CommandMessage::make(command_name, json_body, epoch_millis()).serialize();
    return std::vector<std::uint8_t>(text.begin(), text.end());
}
