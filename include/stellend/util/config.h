// STELLEND - Configuration File Parser
// Copyright (c) 2024 STELLEND Developers
// MIT License
//
// Parses INI-style configuration files for the protocol tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag (true); "nokey" sets it to false

#ifndef STELLEND_UTIL_CONFIG_H
#define STELLEND_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stellend {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name
constexpr const char* DEFAULT_DATADIR_NAME = ".stellend";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "stellend.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Later sources overwrite earlier ones, so the command line is parsed last.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line options of the form -key=value, --key=value or -flag.
     * Non-option arguments are returned in positional order.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[],
                                       std::vector<std::string>* positional = nullptr);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                             const std::string& section = "") const;

    /// Get string value with default
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (returns nullopt if key doesn't exist or is invalid)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                      const std::string& section = "") const;

    /// Get integer value with default
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get unsigned integer value (returns nullopt if missing, invalid or negative)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                        const std::string& section = "") const;

    /// Get unsigned integer value with default
    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                    const std::string& section = "") const;

    /// Get boolean value with default
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get path value (with ~ expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Get all section names (the global section is omitted)
    std::vector<std::string> GetSections() const;

    /// Get all keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Get default data directory path
    static std::string GetDefaultDataDir();

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

    /// Dump all configuration to string
    std::string Dump() const;

private:
    /// Internal key for section:key combination
    std::string MakeKey(const std::string& key, const std::string& section) const;

    /// Parse every line of a stream
    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

    /// Check key characters
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";

    // Sections
    constexpr const char* SECTION_GOVERNANCE = "governance";
    constexpr const char* SECTION_ORACLE = "oracle";
    constexpr const char* SECTION_FLASHLOAN = "flashloan";
    constexpr const char* SECTION_PRICES = "prices";

    // [governance]
    constexpr const char* QUORUM_BPS = "quorum_bps";
    constexpr const char* TIMELOCK = "timelock";

    // [oracle]
    constexpr const char* HEARTBEAT_TTL = "heartbeat_ttl";
    constexpr const char* MODE = "mode";
    constexpr const char* ISOLATE_FAILURES = "isolate_failures";

    // [flashloan]
    constexpr const char* FEE_BPS = "fee_bps";
}

} // namespace util
} // namespace stellend

#endif // STELLEND_UTIL_CONFIG_H
