#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct NetworkInfo {
    std::uint64_t upload = 0;
    std::uint64_t download = 0;
};

// Not measured; the panel overlays expect these figures.
#define FIXED_MEMORY_SPEED_MHZ 3200
#define FIXED_CPU_SPEED_MHZ 3000
#define FIXED_CPU_VOLTAGE 1.0f

struct MemoryInfo {
    std::uint64_t total = 0;   // MB
    std::uint64_t used = 0;    // MB
    std::uint8_t load = 0;     // percent
    std::uint8_t temperature = 0;
    std::uint32_t speed = 0;   // MHz
};

struct CpuInfo {
    std::uint8_t load = 0;
    std::uint8_t temperature = 0;
    std::uint32_t speed_average = 0;
    std::uint32_t power = 0;
    float voltage = 0.0f;
    std::uint8_t usage = 0;
};

struct GpuInfo {
    std::uint8_t load = 0;
    std::uint8_t temperature = 0;
    std::uint32_t fan = 0;
    std::uint32_t speed = 0;
    std::uint32_t power = 0;
    float voltage = 0.0f;
};

struct DiskInfo {
    std::uint64_t total = 0;   // GB
    std::uint64_t used = 0;    // GB
    std::uint8_t load = 0;
    std::uint8_t activity = 0;
    std::uint8_t temperature = 0;
    std::uint64_t read_speed = 0;
    std::uint64_t write_speed = 0;
};

struct FanInfo {
    bool on_board = false;
    std::string name;
    std::uint32_t value = 0;
};

struct MotherboardInfo {
    std::uint8_t temperature = 0;
    std::uint8_t pch_temperature = 0;
};

// Payload of the "all" command. The device shows these values on its
// overlays, so a snapshot is taken right before each send.
struct TelemetrySnapshot {
    NetworkInfo network;
    MemoryInfo memory;
    CpuInfo cpu;
    GpuInfo gpu;
    DiskInfo disk;
    std::vector<FanInfo> fans;
    MotherboardInfo motherboard;
    std::int64_t timestamp = 0;
};

void to_json(nlohmann::json& j, const NetworkInfo& v);
void to_json(nlohmann::json& j, const MemoryInfo& v);
void to_json(nlohmann::json& j, const CpuInfo& v);
void to_json(nlohmann::json& j, const GpuInfo& v);
void to_json(nlohmann::json& j, const DiskInfo& v);
void to_json(nlohmann::json& j, const FanInfo& v);
void to_json(nlohmann::json& j, const MotherboardInfo& v);
void to_json(nlohmann::json& j, const TelemetrySnapshot& v);

class ITelemetrySource {
public:
    virtual ~ITelemetrySource() = default;

    // Fresh reading; never cached between calls.
    virtual TelemetrySnapshot read() = 0;
};

/**
 * Host telemetry from /proc, /sys/class/thermal, /sys/class/hwmon,
 * nvidia-smi (if present) and statvfs("/").
 * Readings that are unavailable stay at zero.
 */
class SysfsTelemetrySource : public ITelemetrySource {
public:
    explicit SysfsTelemetrySource(const std::string& root = "");

    TelemetrySnapshot read() override;

    int read_cpu_temp() const;
    int read_gpu_temp() const;
    int read_cpu_load() const;
    void read_memory(MemoryInfo& mem) const;
    void read_disk(DiskInfo& disk) const;

private:
    // Prefix for /proc and /sys paths, used to point tests at a fake tree.
    std::string root_;
};

// Parses the kB value of a /proc/meminfo line, 0 when malformed.
std::uint64_t parse_meminfo_value(const std::string& line);
