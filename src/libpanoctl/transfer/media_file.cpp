#include <panoctl/media_file.h>
#include <panoctl/file_agent.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

StepResult compute_file_md5(const std::string& path, std::string& md5_hex, std::uint64_t& size) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return StepResult::fail("Cannot open " + path + ": " + strerror(errno));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return StepResult::fail("MD5 initialisation failed");
    }

    std::vector<char> buffer(64 * 1024);
    size = 0;
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize n = file.gcount();
        if (n <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return StepResult::fail("MD5 update failed");
        }
        size += static_cast<std::uint64_t>(n);
    }
    if (file.bad()) {
        return StepResult::fail("Read error on " + path);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return StepResult::fail("MD5 finalisation failed");
    }

    md5_hex.clear();
    char hex[3];
    for (unsigned int i = 0; i < digest_len; i++) {
        snprintf(hex, sizeof(hex), "%02x", digest[i]);
        md5_hex += hex;
    }
    return StepResult::ok();
}

std::string media_extension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);

    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) {
        return "png";
    }

    std::string ext = base.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string generate_remote_name(const std::string& extension, std::time_t seconds, int millis) {
    struct tm local;
    localtime_r(&seconds, &local);

    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);

    char name[64];
    snprintf(name, sizeof(name), "%s-%03d", stamp, millis);
    return std::string(name) + "." + extension;
}

std::string generate_remote_name(const std::string& extension) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return generate_remote_name(extension, static_cast<std::time_t>(ms / 1000), static_cast<int>(ms % 1000));
}

std::string remote_media_path(const std::string& remote_name) {
    return std::string(DEVICE_MEDIA_DIR) + "/" + remote_name;
}
