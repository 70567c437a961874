// SECPCORE - Configuration Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/util/config.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace secpcore {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    return str.substr(start, str.find_last_not_of(whitespace) - start + 1);
}

std::string Unquote(const std::string& str) {
    if (str.length() >= 2 && str.front() == str.back() &&
        (str.front() == '"' || str.front() == '\'')) {
        return str.substr(1, str.length() - 2);
    }
    return str;
}

bool IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

/// Split "key", "nokey" or "key=value" into its key and value
std::pair<std::string, std::string> SplitOption(const std::string& text) {
    size_t eqPos = text.find('=');
    if (eqPos != std::string::npos) {
        return {Trim(text.substr(0, eqPos)), Unquote(Trim(text.substr(eqPos + 1)))};
    }
    if (text.length() > 2 && text.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(text[2]))) {
        return {text.substr(2), "false"};
    }
    return {text, "true"};
}

std::string HomeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "";
}

std::string ExpandPath(const std::string& path) {
    std::string result;

    size_t i = 0;
    if (path == "~" || path.compare(0, 2, "~/") == 0) {
        std::string home = HomeDirectory();
        if (!home.empty()) {
            result = home;
            i = 1;
        }
    }

    while (i < path.length()) {
        if (path[i] != '$' || i + 1 == path.length()) {
            result += path[i++];
            continue;
        }

        bool braced = path[i + 1] == '{';
        size_t nameStart = i + (braced ? 2 : 1);
        size_t nameEnd = nameStart;
        if (braced) {
            nameEnd = path.find('}', nameStart);
        } else {
            while (nameEnd < path.length() &&
                   (std::isalnum(static_cast<unsigned char>(path[nameEnd])) ||
                    path[nameEnd] == '_')) {
                ++nameEnd;
            }
        }

        if (nameEnd == std::string::npos || nameEnd == nameStart) {
            result += path[i++];
            continue;
        }

        if (const char* value = std::getenv(path.substr(nameStart, nameEnd - nameStart).c_str())) {
            result += value;
        }
        i = braced ? nameEnd + 1 : nameEnd;
    }

    return result;
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseStream(std::istream& stream, const std::string& source) {
    std::string line;
    int lineNum = 0;

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }

        auto [key, value] = SplitOption(trimmed);
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        }
        values_[key] = value;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    std::streamoff fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    return ParseStream(file, filePath);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (optionsEnded || arg.compare(0, 2, "--") != 0) {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }

        auto [key, value] = SplitOption(arg.substr(2));
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: '" + arg + "'", "<command-line>");
        }
        values_[key] = value;
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return values_.count(key) != 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower;
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandPath(GetString(key, defaultValue));
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    values_.emplace(key, value);
}

} // namespace util
} // namespace secpcore
