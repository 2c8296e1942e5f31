// VERISCORE - Configuration Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/util/config.h"
#include "veriscore/util/fs.h"

#include <cctype>
#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

namespace veriscore {
namespace util {

namespace {

constexpr const char* COMMAND_LINE = "<command-line>";

std::string Strip(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(" \t\r") - first + 1);
}

bool ValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (unsigned char c : key) {
        if (!std::islower(c) && !std::isdigit(c) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

/// Strips the quotes of a "..." value and resolves its escapes
std::optional<std::string> Unquote(const std::string& value) {
    if (value.empty() || value.front() != '"') {
        return value;
    }
    if (value.size() < 2 || value.back() != '"') {
        return std::nullopt;
    }
    std::string out;
    for (size_t i = 1; i + 1 < value.size(); ++i) {
        char c = value[i];
        if (c == '\\' && i + 2 < value.size()) {
            c = value[++i];
            if (c == 'n') c = '\n';
            else if (c == 't') c = '\t';
        }
        out += c;
    }
    return out;
}

std::string ExpandVariables(const std::string& text) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        const size_t open = text.find("${", pos);
        const size_t close = open == std::string::npos ? open : text.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(text, pos, std::string::npos);
            return out;
        }
        out.append(text, pos, open - pos);
        const std::string name = text.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
}

std::string HomeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    const struct passwd* pw = getpwuid(getuid());
    return pw != nullptr ? pw->pw_dir : "";
}

} // namespace

std::string ConfigError::ToString() const {
    std::string out = origin;
    if (line > 0) {
        out += ":" + std::to_string(line);
    }
    return out.empty() ? message : out + ": " + message;
}

std::string ConfigManager::ExpandPath(const std::string& path) {
    std::string expanded = path;
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const std::string home = HomeDirectory();
        if (!home.empty()) {
            expanded = home + path.substr(1);
        }
    }
    return ExpandVariables(expanded);
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Put(const std::string& key, const std::string& value, ConfigLayer layer,
                        const std::string& origin, int line) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        Entry& entry = it->second;
        if (layer < entry.layer) {
            return;
        }
        if (layer == entry.layer && layer != ConfigLayer::Override) {
            entry.values.push_back(value);
            return;
        }
    }
    entries_[key] = Entry{{value}, layer, origin, line};
}

std::optional<ConfigError> ConfigManager::Assign(const std::string& token, bool fromFile,
                                                 ConfigLayer layer, const std::string& origin,
                                                 int line) {
    const size_t eq = token.find('=');
    std::string key = Strip(token.substr(0, eq));
    std::string value;

    if (eq == std::string::npos) {
        value = "1";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0) {
            key = key.substr(2);
            value = "0";
        }
    } else if (fromFile) {
        auto unquoted = Unquote(Strip(token.substr(eq + 1)));
        if (!unquoted) {
            return ConfigError{"unterminated quoted value for '" + key + "'", origin, line};
        }
        value = ExpandVariables(*unquoted);
    } else {
        value = token.substr(eq + 1);
    }

    if (!ValidKey(key)) {
        return ConfigError{"invalid key '" + key + "'", origin, line};
    }
    Put(key, value, layer, origin, line);
    return std::nullopt;
}

std::optional<ConfigError> ConfigManager::ParseString(const std::string& content,
                                                      const std::string& origin) {
    int lineNumber = 0;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) {
            end = content.size();
        }
        ++lineNumber;
        const std::string line = Strip(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            return ConfigError{"sections are not supported", origin, lineNumber};
        }
        if (auto error = Assign(line, true, ConfigLayer::File, origin, lineNumber)) {
            return error;
        }
    }
    return std::nullopt;
}

std::optional<ConfigError> ConfigManager::ParseFile(const std::string& path) {
    const std::string expanded = ExpandPath(path);
    std::string content;
    if (!fs::ReadFile(expanded, content)) {
        return ConfigError{"cannot read config file", expanded, 0};
    }
    if (content.size() > MAX_CONFIG_SIZE) {
        return ConfigError{"config file larger than " + std::to_string(MAX_CONFIG_SIZE) +
                           " bytes", expanded, 0};
    }
    LOG_DEBUG(LogCategory::CONFIG) << "Reading config " << expanded;
    return ParseString(content, expanded);
}

std::optional<ConfigError> ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        const std::string token = arg.substr(arg[1] == '-' ? 2 : 1);
        if (auto error = Assign(token, false, ConfigLayer::CommandLine, COMMAND_LINE, 0)) {
            error->message = "invalid option '" + arg + "'";
            return error;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.values.back();
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text || text->empty() || text->size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (unsigned char c : *text) {
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text) {
        return std::nullopt;
    }
    std::string lower;
    for (unsigned char c : *text) {
        lower += static_cast<char>(std::tolower(c));
    }
    for (const char* yes : {"1", "true", "yes", "on"}) {
        if (lower == yes) return true;
    }
    for (const char* no : {"0", "false", "no", "off"}) {
        if (lower == no) return false;
    }
    return std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) const {
    std::vector<std::string> items;
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return items;
    }
    for (const auto& value : it->second.values) {
        size_t pos = 0;
        while (pos <= value.size()) {
            size_t comma = value.find(',', pos);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string item = Strip(value.substr(pos, comma - pos));
            if (!item.empty()) {
                items.push_back(std::move(item));
            }
            pos = comma + 1;
        }
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue) const {
    return ExpandPath(GetString(key, defaultValue));
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    Put(key, value, ConfigLayer::Override, "<override>", 0);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    Put(key, value, ConfigLayer::Default, "<default>", 0);
}

void ConfigManager::AllowKey(const std::string& key) {
    allowed_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    if (allowed_.empty()) {
        return warnings;
    }
    for (const auto& [key, entry] : entries_) {
        if (allowed_.count(key) == 0) {
            warnings.push_back(
                ConfigError{"unknown configuration key '" + key + "'", entry.origin, entry.line}
                    .ToString());
        }
    }
    return warnings;
}

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

// ============================================================================
// Standard Keys
// ============================================================================

void AllowStandardKeys(ConfigManager& config) {
    for (const char* key : {ConfigKeys::CONF, ConfigKeys::BUILDDIR, ConfigKeys::AUTOSETUP,
                            ConfigKeys::THREADS, ConfigKeys::OUTDIR, ConfigKeys::LOGLEVEL,
                            ConfigKeys::LOGFILE, ConfigKeys::PRINTTOCONSOLE,
                            ConfigKeys::DEBUG}) {
        config.AllowKey(key);
    }
}

LogOptions GetLogOptions(const ConfigManager& config) {
    LogOptions options;
    options.level = LogLevelFromString(config.GetString(ConfigKeys::LOGLEVEL, "info"));
    options.printToConsole = config.GetBool(ConfigKeys::PRINTTOCONSOLE, true);
    options.file = config.GetPath(ConfigKeys::LOGFILE);

    const auto debug = config.GetList(ConfigKeys::DEBUG);
    if (debug.empty() || config.TryGetBool(ConfigKeys::DEBUG) == false) {
        return options;
    }
    options.level = LogLevel::Debug;
    for (const auto& category : debug) {
        if (category == "1" || category == "all") {
            options.categories.clear();
            break;
        }
        options.categories.push_back(category);
    }
    return options;
}

} // namespace util
} // namespace veriscore
