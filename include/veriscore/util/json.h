// VERISCORE - JSON Value
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// JSON document model for proof artifacts, verification keys and toolchain
// input files. Field elements travel as decimal strings, so numbers are
// integers only; a fractional or out-of-range number is a parse error.
// Objects keep their keys sorted.

#ifndef VERISCORE_UTIL_JSON_H
#define VERISCORE_UTIL_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace veriscore {
namespace util {

/// Malformed document; Offset() is the byte where parsing stopped
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& message, size_t offset);

    size_t Offset() const { return offset_; }

private:
    size_t offset_;
};

/**
 * One JSON value. Lookups never throw: a missing key, an index past the
 * end or an accessor of the wrong type yields null, zero, false or an
 * empty container, so schema checks are written as IsString()/IsArray()
 * tests on the result.
 */
class JSONValue {
public:
    /// Containers deeper than this are rejected by the parser
    static constexpr int MAX_DEPTH = 64;

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() = default;
    JSONValue(std::nullptr_t) {}
    JSONValue(bool b) : data_(b) {}
    JSONValue(int i) : data_(int64_t{i}) {}
    JSONValue(int64_t i) : data_(i) {}
    JSONValue(uint64_t u) : data_(static_cast<int64_t>(u)) {}
    JSONValue(const char* s) : data_(std::string(s)) {}
    JSONValue(std::string s) : data_(std::move(s)) {}
    JSONValue(Array items) : data_(std::move(items)) {}
    JSONValue(Object members) : data_(std::move(members)) {}

    /// Array of strings
    static JSONValue FromStrings(const std::vector<std::string>& values);

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(data_); }
    bool IsBool() const { return std::holds_alternative<bool>(data_); }
    bool IsInt() const { return std::holds_alternative<int64_t>(data_); }
    bool IsString() const { return std::holds_alternative<std::string>(data_); }
    bool IsArray() const { return std::holds_alternative<Array>(data_); }
    bool IsObject() const { return std::holds_alternative<Object>(data_); }

    bool GetBool(bool fallback = false) const;
    int64_t GetInt(int64_t fallback = 0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    /// Turns a non-object into an empty object first
    JSONValue& operator[](const std::string& key);

    /// Element or member count; 0 for scalars
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    /// Turns a non-array into an empty array first
    void Push(JSONValue value);

    bool operator==(const JSONValue& other) const { return data_ == other.data_; }
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    /// Compact, or two-space indented when pretty is set
    std::string ToJSON(bool pretty = false) const;

    /// @throws JSONParseError on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);

private:
    void Write(std::string& out, bool pretty, int depth) const;

    std::variant<std::nullptr_t, bool, int64_t, std::string, Array, Object> data_;
};

} // namespace util
} // namespace veriscore

#endif // VERISCORE_UTIL_JSON_H
