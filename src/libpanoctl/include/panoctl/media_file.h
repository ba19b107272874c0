#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include "step_result.h"

/**
 * MD5 of a local file as lowercase hex
 * @param path Local file
 * @param md5_hex Receives 32 hex characters
 * @param size Receives the number of bytes hashed
 */
StepResult compute_file_md5(const std::string& path, std::string& md5_hex, std::uint64_t& size);

// Lowercase extension without the dot, "png" when the file has none.
std::string media_extension(const std::string& path);

// "YYYY-MM-DD_HH-MM-SS-mmm.<ext>" in local time.
std::string generate_remote_name(const std::string& extension);
std::string generate_remote_name(const std::string& extension, std::time_t seconds, int millis);

std::string remote_media_path(const std::string& remote_name);
