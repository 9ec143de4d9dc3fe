// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

std::string EnvName(const std::string& key) {
    std::string env_key = "SEEDLINE_" + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(), ::toupper);
    return env_key;
}

} // namespace

CConfigParser::CConfigParser() : m_loaded(false) {
}

CConfigParser::~CConfigParser() {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    // Remove comments
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    // Section headers are accepted and ignored
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    // Remove quotes if present
    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    struct stat file_stat;
    if (stat(file_path.c_str(), &file_stat) == 0 && S_ISDIR(file_stat.st_mode)) {
        LogPrintf(CONFIG, ERROR, "Config path %s is a directory", file_path.c_str());
        return false;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // Missing file is fine, defaults apply
        LogPrintf(CONFIG, DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings.emplace(key, value);
            LogPrintf(CONFIG, DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }

    m_loaded = true;
    if (!m_settings.empty()) {
        LogPrintf(CONFIG, INFO, "Loaded configuration from %s (%zu settings)",
                  file_path.c_str(), m_settings.size());
    }
    return true;
}

std::optional<std::string> CConfigParser::Lookup(const std::string& key) const {
    auto env_value = GetEnv(EnvName(key));
    if (env_value.has_value()) {
        LogPrintf(CONFIG, DEBUG, "Config: %s = %s (from environment)",
                  key.c_str(), env_value->c_str());
        return env_value;
    }

    // Last occurrence in the file wins
    auto range = m_settings.equal_range(ToLower(key));
    if (range.first == range.second) {
        return std::nullopt;
    }
    auto last = range.second;
    --last;
    return last->second;
}

bool CConfigParser::HasKey(const std::string& key) const {
    return Lookup(key).has_value();
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    auto value = Lookup(key);
    return value.has_value() ? *value : default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    int64_t value = default_value;
    if (!GetInt64Strict(key, value)) {
        LogPrintf(CONFIG, WARN, "Config: Invalid integer value for %s (using default: %lld)",
                  key.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
    return value;
}

bool CConfigParser::GetInt64Strict(const std::string& key, int64_t& value) const {
    auto raw = Lookup(key);
    if (!raw.has_value() || raw->empty()) {
        return true;
    }

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(*raw, &consumed);
        if (consumed != raw->size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception& e) {
        LogPrintf(CONFIG, DEBUG, "Config: %s: %s", key.c_str(), e.what());
        return false;
    }
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    auto raw = Lookup(key);
    if (!raw.has_value() || raw->empty()) {
        return default_value;
    }

    std::string value = ToLower(*raw);

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintf(CONFIG, WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
              key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::string GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    if (home != nullptr) {
        return std::string(home) + "/.seedline";
    }
    return ".seedline";
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;
    return dir + "/seedline.conf";
}
