// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

/**
 * Configuration System
 *
 * Reads seedline.conf (key=value) and allows SEEDLINE_* environment
 * variable overrides.
 */

#ifndef SEEDLINE_UTIL_CONFIG_H
#define SEEDLINE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs (keys are case-insensitive)
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (SEEDLINE_<KEY>)
 */
class CConfigParser {
private:
    std::multimap<std::string, std::string> m_settings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

    // Helper: Last value for key (env first, then file)
    std::optional<std::string> Lookup(const std::string& key) const;

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to seedline.conf
     * @return true if loaded successfully (or file doesn't exist), false on error
     */
    bool LoadConfigFile(const std::string& file_path);

    /** Does the key have a value (environment or file)? */
    bool HasKey(const std::string& key) const;

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * Unparseable values are logged and replaced by the default.
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Strict integer lookup
     * @param[out] value Parsed value (untouched if key absent)
     * @return false only if the key is present but not a valid integer
     */
    bool GetInt64Strict(const std::string& key, int64_t& value) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to seedline.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Get default data directory ($HOME/.seedline)
 */
std::string GetDefaultDataDir();

#endif // SEEDLINE_UTIL_CONFIG_H
