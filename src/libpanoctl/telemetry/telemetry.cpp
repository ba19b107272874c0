#include <panoctl/telemetry.h>
#include <panoctl/command_message.h>
#include <sys/statvfs.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <algorithm>

using json = nlohmann::json;

void to_json(json& j, const NetworkInfo& v) {
    j = json{{"upload", v.upload}, {"download", v.download}};
}

void to_json(json& j, const MemoryInfo& v) {
    j = json{{"total", v.total}, {"used", v.used}, {"load", v.load},
             {"temperature", v.temperature}, {"speed", v.speed}};
}

void to_json(json& j, const CpuInfo& v) {
    j = json{{"load", v.load}, {"temperature", v.temperature},
             {"speedAverage", v.speed_average}, {"power", v.power},
             {"voltage", v.voltage}, {"usage", v.usage}};
}

void to_json(json& j, const GpuInfo& v) {
    j = json{{"load", v.load}, {"temperature", v.temperature}, {"fan", v.fan},
             {"speed", v.speed}, {"power", v.power}, {"voltage", v.voltage}};
}

void to_json(json& j, const DiskInfo& v) {
    j = json{{"total", v.total}, {"used", v.used}, {"load", v.load},
             {"activity", v.activity}, {"temperature", v.temperature},
             {"readSpeed", v.read_speed}, {"writeSpeed", v.write_speed}};
}

void to_json(json& j, const FanInfo& v) {
    j = json{{"onBoard", v.on_board}, {"name", v.name}, {"value", v.value}};
}

void to_json(json& j, const MotherboardInfo& v) {
    j = json{{"temperature", v.temperature}, {"pchTemperature", v.pch_temperature}};
}

void to_json(json& j, const TelemetrySnapshot& v) {
    j = json{
        {"network", v.network},
        {"memory", v.memory},
        {"cpu", v.cpu},
        {"gpu", v.gpu},
        {"disk", v.disk},
        {"fans", v.fans},
        {"motherboard", v.motherboard},
        {"timestamp", v.timestamp},
    };
}

static bool read_first_line(const std::string& path, std::string& line) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    return static_cast<bool>(std::getline(file, line));
}

static int read_millidegrees(const std::string& path) {
    std::string line;
    if (!read_first_line(path, line)) {
        return -1;
    }
    try {
        int milli = std::stoi(line);
        if (milli < 0) return -1;
        return milli / 1000;
    } catch (const std::exception&) {
        return -1;
    }
}

static std::uint8_t clamp_u8(long v) {
    return static_cast<std::uint8_t>(std::max(0L, std::min(255L, v)));
}

std::uint64_t parse_meminfo_value(const std::string& line) {
    std::istringstream stream(line);
    std::string key;
    std::uint64_t value = 0;
    if (!(stream >> key >> value)) {
        return 0;
    }
    return value;
}

SysfsTelemetrySource::SysfsTelemetrySource(const std::string& root)
    : root_(root) {}

int SysfsTelemetrySource::read_cpu_temp() const {
    for (int i = 0; i < 10; i++) {
        int t = read_millidegrees(root_ + "/sys/class/thermal/thermal_zone" + std::to_string(i) + "/temp");
        if (t >= 0) return t;
    }

    // coretemp / k10temp
    for (int i = 0; i < 10; i++) {
        int t = read_millidegrees(root_ + "/sys/class/hwmon/hwmon" + std::to_string(i) + "/temp1_input");
        if (t >= 0) return t;
    }

    return -1;
}

int SysfsTelemetrySource::read_gpu_temp() const {
    if (root_.empty()) {
        FILE* pipe = popen("nvidia-smi --query-gpu=temperature.gpu --format=csv,noheader,nounits 2>/dev/null", "r");
        if (pipe) {
            char buffer[64];
            std::string out;
            while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
                out += buffer;
            }
            int status = pclose(pipe);
            if (status == 0 && !out.empty()) {
                try {
                    return std::stoi(out);
                } catch (const std::exception&) {
                }
            }
        }
    }

    // amdgpu exposes its sensor under the DRM card
    for (const char* card : {"card0", "card1"}) {
        for (int i = 0; i < 5; i++) {
            int t = read_millidegrees(root_ + "/sys/class/drm/" + card + "/device/hwmon/hwmon" +
                                      std::to_string(i) + "/temp1_input");
            if (t >= 0) return t;
        }
    }

    return -1;
}

// 1-minute load average scaled so that a load of 4 reads as 100%.
int SysfsTelemetrySource::read_cpu_load() const {
    std::string line;
    if (!read_first_line(root_ + "/proc/loadavg", line)) {
        return -1;
    }

    std::istringstream stream(line);
    float load_1min = 0.0f;
    if (!(stream >> load_1min)) {
        return -1;
    }
    return static_cast<int>(std::min(100.0f, load_1min * 25.0f));
}

void SysfsTelemetrySource::read_memory(MemoryInfo& mem) const {
    std::ifstream file(root_ + "/proc/meminfo");
    std::uint64_t total = 0;
    std::uint64_t available = 0;

    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("MemTotal:", 0) == 0) {
            total = parse_meminfo_value(line);
        } else if (line.rfind("MemAvailable:", 0) == 0) {
            available = parse_meminfo_value(line);
        }
    }

    std::uint64_t used = total > available ? total - available : 0;
    mem.total = total / 1024;
    mem.used = used / 1024;
    mem.load = total > 0 ? static_cast<std::uint8_t>((used * 100) / total) : 0;
}

void SysfsTelemetrySource::read_disk(DiskInfo& disk) const {
    std::string mount = root_.empty() ? "/" : root_;

    struct statvfs st;
    if (statvfs(mount.c_str(), &st) != 0 || st.f_blocks == 0) {
        return;
    }

    std::uint64_t total = static_cast<std::uint64_t>(st.f_blocks) * st.f_frsize;
    std::uint64_t avail = static_cast<std::uint64_t>(st.f_bfree) * st.f_frsize;
    std::uint64_t used = total - avail;

    const std::uint64_t gb = 1024ULL * 1024ULL * 1024ULL;
    disk.total = total / gb;
    disk.used = used / gb;
    disk.load = static_cast<std::uint8_t>((used * 100) / total);
}

TelemetrySnapshot SysfsTelemetrySource::read() {
    TelemetrySnapshot snap;
    snap.timestamp = epoch_millis();

    int cpu_temp = read_cpu_temp();
    int gpu_temp = read_gpu_temp();
    int cpu_load = read_cpu_load();

    snap.cpu.temperature = cpu_temp >= 0 ? clamp_u8(cpu_temp) : 0;
    snap.cpu.load = cpu_load >= 0 ? clamp_u8(cpu_load) : 0;
    snap.cpu.usage = snap.cpu.load;
    snap.cpu.speed_average = FIXED_CPU_SPEED_MHZ;
    snap.cpu.voltage = FIXED_CPU_VOLTAGE;
    snap.gpu.temperature = gpu_temp >= 0 ? clamp_u8(gpu_temp) : 0;

    read_memory(snap.memory);
    snap.memory.speed = FIXED_MEMORY_SPEED_MHZ;
    read_disk(snap.disk);

    return snap;
}
