#include "partvault/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace partvault::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    // Stream extraction wraps "-5" around instead of failing
    auto raw = get(key);
    if (raw && raw->find('-') != std::string::npos) {
        return default_value;
    }
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["owner.id"] = "default";
    values_["transport.api_host"] = "api.telegram.org";
    values_["transport.upload_timeout_s"] = "90";
    values_["transport.metadata_timeout_s"] = "20";
    values_["transport.fetch_timeout_s"] = "120";
    values_["storage.data_dir"] = "~/.partvault";
    values_["storage.download_dir"] = "downloads";
    values_["transfer.chunk_size"] = "19922944";
    values_["upload.max_attempts"] = "10";
    values_["upload.retry_delay_ms"] = "5000";
    values_["upload.inter_part_delay_ms"] = "1000";
    values_["download.max_workers"] = "35";
    values_["download.max_attempts"] = "5";
    values_["download.base_delay_ms"] = "1000";
    values_["download.jitter_max_ms"] = "500";
    values_["log.level"] = "info";
    values_["log.file"] = "partvault.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();

    return start < end ? std::string(start, end) : std::string();
}

}
