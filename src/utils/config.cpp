#include "utils/config.h"
#include "utils/logger.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>

namespace quantbox {
namespace utils {

namespace {

struct KeySpec {
    const char* name;
    const char* fallback;
    const char* help;
};

// Defaults that depend on the build or the environment are filled in by defaultFor().
const KeySpec KNOWN_KEYS[] = {
    {"sandbox.interpreter", "", "python executable; empty searches PATH for python3"},
    {"sandbox.engine_path", "", "directory holding the quantbox_safe module"},
    {"sandbox.temp_dir", "/tmp", "where guarded programs are written"},
    {"sandbox.max_output_bytes", "1048576", "per-stream capture limit"},
    {"sandbox.env_passthrough", "", "comma separated variables copied into the child"},
    {"log.level", "info", "trace, debug, info, warn, error or off"},
    {"log.file", "", "log file; empty logs to stderr only"},
    {"log.max_size", "10485760", "rotate the log file past this many bytes"},
    {"log.max_files", "5", "rotated files kept"},
};

const KeySpec* findSpec(const std::string& key) {
    for (const auto& spec : KNOWN_KEYS) {
        if (key == spec.name) return &spec;
    }
    return nullptr;
}

std::string defaultFor(const KeySpec& spec) {
    std::string key = spec.name;
    if (key == "sandbox.temp_dir") {
        const char* tmp = std::getenv("TMPDIR");
        if (tmp && *tmp) return tmp;
    }
#ifdef QUANTBOX_ENGINE_DIR
    if (key == "sandbox.engine_path") return QUANTBOX_ENGINE_DIR;
#endif
    return spec.fallback;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> items;
    std::istringstream iss(raw);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

}

struct Config::Impl {
    std::map<std::string, std::string> values;
    std::string path;
    std::function<void(const std::string&)> listener;
    mutable std::mutex mtx;

    void seed() {
        values.clear();
        for (const auto& spec : KNOWN_KEYS) values[spec.name] = defaultFor(spec);
    }

    void assign(const std::string& key, const std::string& value) {
        std::function<void(const std::string&)> notify;
        {
            std::lock_guard<std::mutex> lock(mtx);
            values[key] = value;
            notify = listener;
        }
        if (notify) notify(key);
    }

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = values.find(key);
        if (it == values.end()) return false;
        out = it->second;
        return true;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    impl_->seed();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::reset() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->seed();
    impl_->path.clear();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::vector<std::string> unknown;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->path = path;
        std::string line;
        int lineNo = 0;
        while (std::getline(file, line)) {
            lineNo++;
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            size_t eq = line.find('=');
            std::string key = eq == std::string::npos ? "" : trim(line.substr(0, eq));
            if (key.empty()) {
                unknown.push_back(path + ":" + std::to_string(lineNo) + " ignored");
                continue;
            }
            if (!findSpec(key)) unknown.push_back("unknown key " + key);
            impl_->values[key] = trim(line.substr(eq + 1));
        }
    }

    for (const auto& note : unknown) {
        LOG_WARN("config: " + note);
    }
    return true;
}

bool Config::save(const std::string& path) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string target = path.empty() ? impl_->path : path;
    if (target.empty()) return false;

    std::ofstream file(target);
    if (!file.is_open()) return false;

    file << "# quantbox configuration\n";
    std::string section;
    for (const auto& entry : impl_->values) {
        std::string prefix = entry.first.substr(0, entry.first.find('.'));
        if (prefix != section) {
            file << "\n";
            section = prefix;
        }
        if (const KeySpec* spec = findSpec(entry.first)) file << "# " << spec->help << "\n";
        file << entry.first << " = " << entry.second << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string raw;
    return impl_->lookup(key, raw) ? raw : def;
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string raw;
    if (!impl_->lookup(key, raw) || raw.empty()) return def;
    try {
        size_t used = 0;
        int64_t v = std::stoll(raw, &used);
        return used == raw.size() ? v : def;
    } catch (const std::exception&) {
        return def;
    }
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::string raw;
    if (!impl_->lookup(key, raw)) return {};
    return splitList(raw);
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->assign(key, value);
}

void Config::set(const std::string& key, int64_t value) {
    impl_->assign(key, std::to_string(value));
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& v : values) {
        if (!joined.empty()) joined += ",";
        joined += v;
    }
    impl_->assign(key, joined);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> out;
    for (auto it = impl_->values.lower_bound(prefix); it != impl_->values.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.push_back(it->first);
    }
    return out;
}

bool Config::isKnownKey(const std::string& key) {
    return findSpec(key) != nullptr;
}

SandboxSettings Config::getSandboxSettings() const {
    SandboxSettings s;
    s.interpreter = getString("sandbox.interpreter");
    s.enginePath = getString("sandbox.engine_path");
    s.tempDir = getString("sandbox.temp_dir", "/tmp");
    if (s.tempDir.empty()) s.tempDir = "/tmp";
    int64_t cap = getInt64("sandbox.max_output_bytes", 1024 * 1024);
    s.maxOutputBytes = cap > 0 ? static_cast<uint64_t>(cap) : 1024 * 1024;
    s.envPassthrough = getList("sandbox.env_passthrough");
    return s;
}

void Config::setSandboxSettings(const SandboxSettings& s) {
    set("sandbox.interpreter", s.interpreter);
    set("sandbox.engine_path", s.enginePath);
    set("sandbox.temp_dir", s.tempDir);
    set("sandbox.max_output_bytes", static_cast<int64_t>(s.maxOutputBytes));
    setList("sandbox.env_passthrough", s.envPassthrough);
}

LogSettings Config::getLogSettings() const {
    LogSettings s;
    s.level = getString("log.level", "info");
    s.file = getString("log.file");
    int64_t size = getInt64("log.max_size", 10 * 1024 * 1024);
    if (size > 0) s.maxFileBytes = static_cast<uint64_t>(size);
    int64_t files = getInt64("log.max_files", 5);
    if (files >= 0) s.maxFiles = static_cast<uint32_t>(files);
    return s;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->listener = std::move(callback);
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

}
}
