// PRICEGATE - Configuration Parser
// Copyright (c) 2024 PRICEGATE Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Bare keys are boolean flags; "nokey" sets key to false
//
// Command-line format: -key=value, -key (flag), -nokey (negated flag).
// Anything not starting with '-' is kept as a positional argument.

#ifndef PRICEGATE_UTIL_CONFIG_H
#define PRICEGATE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pricegate {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

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

    /// "file:line: message" (location parts omitted when unknown)
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Command-line values always overwrite file values for the same key.
 * Files parsed later overwrite earlier ones.
 */
class ConfigManager {
public:
    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Arguments from the last ParseCommandLine that were not options
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Signed integer; nullopt if missing, malformed or out of range
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    /// Unsigned integer over the full uint64 range; signs are rejected
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0 (case-insensitive)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& section, const std::string& value);

    /// "section:key" (or "key" for the global section) -> value
    std::map<std::string, std::string> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    /// Config file to load
    constexpr const char* CONF = "conf";

    /// Section holding price acceptance policy in config files
    constexpr const char* POLICY_SECTION = "policy";

    /// Hex feed id the price must belong to
    constexpr const char* FEED = "feed";

    /// Maximum accepted age in seconds
    constexpr const char* MAXAGE = "maxage";

    /// Required verification level: full | partial:<n>
    constexpr const char* LEVEL = "level";

    /// Override for the current Unix time
    constexpr const char* NOW = "now";

    /// Skip verification level and age checks
    constexpr const char* UNCHECKED = "unchecked";

    /// Check the account discriminator (negate with -nodiscriminator)
    constexpr const char* DISCRIMINATOR = "discriminator";

    /// Enable debug logging
    constexpr const char* DEBUG = "debug";
}

} // namespace util
} // namespace pricegate

#endif // PRICEGATE_UTIL_CONFIG_H
