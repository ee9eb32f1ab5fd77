// STAKELEDGER - Configuration File Parser
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Bare keys are boolean flags; "nokey" negates
// - Environment variable expansion: ${VAR_NAME}

#ifndef STAKELEDGER_UTIL_CONFIG_H
#define STAKELEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakeledger {
namespace util {

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".stakeledger";

/// Default config file name (inside the data directory)
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeledger.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, command-line options and defaults.
 *
 * Priority (highest first): command line, config file, defaults.
 * A file parsed without overwrite never replaces a value that is already set.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // === Parsing ===

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} expanded)
     * @param overwrite If true, replace values that are already set
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments. Options are "-key=value", "-flag" or
     * "-noflag" (one or two dashes); anything else is a positional argument.
     * Command-line values always overwrite.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Positional (non-option) arguments in order of appearance
    const std::vector<std::string>& GetArgs() const { return args_; }

    // === Value Retrieval ===

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Unsigned value; nullopt if missing, negative or malformed
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // === Value Setting ===

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default (lowest priority, replaced by any parsed value)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // === Utilities ===

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// Data directory from "datadir", else the default under $HOME
    std::string GetDataDir() const;

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection,
                   ConfigParseResult& result);

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName,
                                  bool overwrite);

    void Store(ConfigEntry entry, bool overwrite);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> args_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* HELP = "help";

    // Identities
    constexpr const char* CALLER = "caller";
    constexpr const char* OWNER = "owner";
    constexpr const char* CUSTODY = "custody";

    // Ledger genesis parameters
    constexpr const char* ANNUALRATE = "annualrate";
    constexpr const char* COOLDOWN = "cooldown";
    constexpr const char* BASETOKEN = "basetoken";
    constexpr const char* REWARDTOKEN = "rewardtoken";
    constexpr const char* MAXPOSITIONS = "maxpositions";
}

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_CONFIG_H
