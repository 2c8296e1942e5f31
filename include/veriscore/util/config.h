// VERISCORE - Configuration
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Flat key=value configuration for the prover tools, assembled from layers.
// A value from a higher layer replaces one from a lower layer; repeating a
// key within one layer builds a list (see GetList).
//
//   Default < File < CommandLine < Override
//
// File syntax: one key=value per line, '#' or ';' comments, double-quoted
// values with \n \t \\ \" escapes, ${VAR} expansion in values. A bare "key"
// means true and "nokey" means false. On the command line the same tokens
// are written with one or two leading dashes; anything else is positional.

#ifndef VERISCORE_UTIL_CONFIG_H
#define VERISCORE_UTIL_CONFIG_H

#include "veriscore/util/logging.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace veriscore {
namespace util {

constexpr const char* DEFAULT_CONFIG_FILENAME = "veriscore.conf";

/// Larger files are rejected unread
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

enum class ConfigLayer {
    Default = 0,
    File = 1,
    CommandLine = 2,
    Override = 3
};

struct ConfigError {
    std::string message;
    std::string origin;     // file path or "<command-line>"
    int line{0};            // 0 when not tied to a line

    /// "origin:line: message"
    std::string ToString() const;
};

class ConfigManager {
public:
    /// nullopt on success
    std::optional<ConfigError> ParseFile(const std::string& path);
    std::optional<ConfigError> ParseString(const std::string& content,
                                           const std::string& origin = "<string>");
    /// argv[0] is skipped; non-option arguments go to Positional()
    std::optional<ConfigError> ParseCommandLine(int argc, const char* const argv[]);

    const std::vector<std::string>& Positional() const { return positional_; }

    bool HasKey(const std::string& key) const;

    /// Last value of the winning layer
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// nullopt if missing, negative or not a plain decimal number
    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;

    /// true/false, yes/no, on/off, 1/0 in any case
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Every value of the winning layer, each split on commas
    std::vector<std::string> GetList(const std::string& key) const;

    /// String value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    /// Override layer; replaces any earlier Set
    void Set(const std::string& key, const std::string& value);
    void SetDefault(const std::string& key, const std::string& value);

    void AllowKey(const std::string& key);

    /// One warning per key that was never allowed; empty if nothing was allowed
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// Expand a leading ~ and every ${VAR}; unset variables expand to ""
    static std::string ExpandPath(const std::string& path);

private:
    struct Entry {
        std::vector<std::string> values;
        ConfigLayer layer{ConfigLayer::Default};
        std::string origin;
        int line{0};
    };

    /// Apply one "key", "nokey" or "key=value" token
    std::optional<ConfigError> Assign(const std::string& token, bool fromFile,
                                      ConfigLayer layer, const std::string& origin, int line);

    void Put(const std::string& key, const std::string& value, ConfigLayer layer,
             const std::string& origin, int line);

    std::map<std::string, Entry> entries_;
    std::set<std::string> allowed_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* BUILDDIR = "builddir";
    constexpr const char* AUTOSETUP = "autosetup";
    constexpr const char* THREADS = "threads";
    constexpr const char* OUTDIR = "outdir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";
}

/// Register every key in ConfigKeys as allowed
void AllowStandardKeys(ConfigManager& config);

/// Logging setup from loglevel, logfile, printtoconsole and debug.
/// debug=<category> turns on Debug for that category only; debug=1 or
/// debug=all for every category.
LogOptions GetLogOptions(const ConfigManager& config);

} // namespace util
} // namespace veriscore

#endif // VERISCORE_UTIL_CONFIG_H
