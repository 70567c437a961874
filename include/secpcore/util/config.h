// SECPCORE - Configuration
// Copyright (c) 2024 SECPCORE Developers
// MIT License
//
// Options for secpcore-cli, read from a key=value file and the command line.
//
// File format: one key=value per line; '#' and ';' start comment lines;
// values may be single or double quoted; a bare key is a flag and
// "nokey" clears it.

#ifndef SECPCORE_UTIL_CONFIG_H
#define SECPCORE_UTIL_CONFIG_H

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace secpcore {
namespace util {

/// Maximum config file size (64 KB)
constexpr size_t MAX_CONFIG_SIZE = 64 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 1024;

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

/**
 * Option store. Later parses overwrite earlier ones; SetDefault never
 * replaces an existing value.
 *
 * Command-line options are accepted only as "--key=value", "--key" or
 * "--nokey". Anything else, including negative numbers such as "-5", is a
 * positional argument, as is everything after a bare "--".
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigParseResult ParseFile(const std::string& filePath);

    /// argv[0] is skipped; positional arguments replace the previous set
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// nullopt if missing or not a boolean word
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// String value with a leading ~ and $VAR / ${VAR} references expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    void SetDefault(const std::string& key, const std::string& value);

    /// true/false, yes/no, on/off, 1/0 in any case
    static std::optional<bool> ParseBool(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_;
};

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* COLOR = "color";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

} // namespace util
} // namespace secpcore

#endif // SECPCORE_UTIL_CONFIG_H
