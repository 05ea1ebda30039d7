#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace quantbox {
namespace utils {

// Host-side settings consumed by SandboxConfig; not part of the isolation policy.
struct SandboxSettings {
    std::string interpreter;
    std::string enginePath;
    std::string tempDir = "/tmp";
    uint64_t maxOutputBytes = 1024 * 1024;
    std::vector<std::string> envPassthrough;
};

struct LogSettings {
    std::string level = "info";
    std::string file;
    uint64_t maxFileBytes = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

// Flat "section.key = value" store. Every known key has a documented default;
// unknown keys read from a file are kept but reported.
class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path) const;
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, int64_t value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    std::vector<std::string> keys(const std::string& prefix = "") const;
    static bool isKnownKey(const std::string& key);

    SandboxSettings getSandboxSettings() const;
    void setSandboxSettings(const SandboxSettings& settings);
    LogSettings getLogSettings() const;

    void onChange(std::function<void(const std::string&)> callback);

    std::string getConfigPath() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
