// NeuroShield - Configuration File Parser
// Copyright (c) 2024 NeuroShield Developers
// MIT License
//
// INI-style configuration for the NeuroShield daemon.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs; a bare key is a boolean flag, "nokey" negates it
// - Section headers [section] prefix following keys as "section.key"
// - Values may be quoted: key="value with spaces"
// - Repeating a key builds a list (see GetList)
// - Boolean values: true/false, yes/no, on/off, 1/0
//
// Command-line arguments use the same keys: -key=value, -key value, -flag.

#ifndef NEUROSHIELD_UTIL_CONFIG_H
#define NEUROSHIELD_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace neuroshield {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".neuroshield";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "neuroshield.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration value and where it came from.
 */
struct ConfigEntry {
    std::string value;
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from defaults, files and the command line.
 *
 * Priority (highest first): command line, config file, defaults.
 * A key given on the command line replaces every file value for that key;
 * repeating it on the command line appends, as in a file.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse -key=value style options. Non-option arguments are collected
    /// and available through GetPositionalArgs().
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key) const;

    /// Last value given for the key
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// nullopt if missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    /// nullopt if missing or not a recognized boolean
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Every value given for the key, in order; comma-separated values are split
    std::vector<std::string> GetList(const std::string& key) const;

    /// String value with ~ expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    /// Source of the winning value ("" if missing)
    std::string GetSource(const std::string& key) const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Replace all values for key
    void Set(const std::string& key, const std::string& value);

    /// Set only if no value exists yet
    void SetDefault(const std::string& key, const std::string& value);

    void Clear();
    size_t Size() const { return entries_.size(); }

    // ========================================================================
    // Utilities
    // ========================================================================

    /// $HOME/.neuroshield
    static std::string GetDefaultDataDir();

    /// Expand a leading ~ to the home directory
    static std::string ExpandTilde(const std::string& path);

    static std::optional<bool> ParseBool(const std::string& str);

    /// All keys and values, one "key=value" per line
    std::string Dump() const;

private:
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Append(const std::string& key, ConfigEntry entry);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, std::vector<ConfigEntry>> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* DB = "db";
    constexpr const char* VOTINGPERIOD = "votingperiod";
    constexpr const char* REGTEST = "regtest";
    constexpr const char* MIRRORSTALENESS = "mirrorstaleness";
    constexpr const char* MLFALLBACK = "mlfallback";
    constexpr const char* FUSIONPOLICY = "fusionpolicy";
    constexpr const char* ALLOWLIST = "allowlist";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* GENESIS = "genesis";
}

} // namespace util
} // namespace neuroshield

#endif // NEUROSHIELD_UTIL_CONFIG_H
