#pragma once

#include <cstdint>
#include <string>
#include "step_result.h"

#define DEVICE_MEDIA_DIR "/sdcard/pcMedia"

/**
 * Out-of-band file transfer to the panel (the image bytes never go over
 * the serial link in the current flow).
 */
class IFileAgent {
public:
    virtual ~IFileAgent() = default;

    /**
     * Block until a device is reachable
     * @return failure if the target device is ambiguous or the wait itself fails
     */
    virtual StepResult wait_until_device_ready() = 0;

    /**
     * Copy a local file to the device
     * @param local_path Host path
     * @param remote_path Absolute device path
     * @return failure with the agent's diagnostic output
     */
    virtual StepResult push(const std::string& local_path, const std::string& remote_path) = 0;

    /**
     * Size of a file on the device
     * @param remote_path Absolute device path
     * @param size Receives the size in bytes
     */
    virtual StepResult stat_size(const std::string& remote_path, std::uint64_t& size) = 0;
};
