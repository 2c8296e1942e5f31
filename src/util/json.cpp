// VERISCORE - JSON Value Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/util/json.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace veriscore {
namespace util {

JSONParseError::JSONParseError(const std::string& message, size_t offset)
    : std::runtime_error("JSON parse error at offset " + std::to_string(offset) + ": " + message)
    , offset_(offset) {}

namespace {

void AppendQuoted(std::string& out, const std::string& str) {
    out += '"';
    for (unsigned char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

void AppendUtf8(std::string& out, unsigned code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xc0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3f));
    } else {
        out += static_cast<char>(0xe0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (code & 0x3f));
    }
}

/// Recursive-descent parser over one document
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    JSONValue Document() {
        JSONValue value = Value(0);
        SkipSpace();
        if (pos_ != text_.size()) {
            Fail("trailing characters");
        }
        return value;
    }

private:
    [[noreturn]] void Fail(const std::string& message) const {
        throw JSONParseError(message, pos_);
    }

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd() && (Peek() == ' ' || Peek() == '\t' || Peek() == '\n' || Peek() == '\r')) {
            ++pos_;
        }
    }

    void Expect(char c) {
        SkipSpace();
        if (Peek() != c) {
            Fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool Consume(const char* literal) {
        const std::string word(literal);
        if (text_.compare(pos_, word.size(), word) != 0) {
            return false;
        }
        pos_ += word.size();
        return true;
    }

    JSONValue Value(int depth) {
        SkipSpace();
        if (AtEnd()) {
            Fail("unexpected end of input");
        }
        switch (Peek()) {
            case '{': return ObjectValue(depth + 1);
            case '[': return ArrayValue(depth + 1);
            case '"': return JSONValue(StringValue());
            case 't':
                if (Consume("true")) return JSONValue(true);
                break;
            case 'f':
                if (Consume("false")) return JSONValue(false);
                break;
            case 'n':
                if (Consume("null")) return JSONValue();
                break;
            default:
                if (Peek() == '-' || (Peek() >= '0' && Peek() <= '9')) {
                    return NumberValue();
                }
        }
        Fail("unexpected character");
    }

    JSONValue NumberValue() {
        const size_t start = pos_;
        if (Peek() == '-') {
            ++pos_;
        }
        if (!(Peek() >= '0' && Peek() <= '9')) {
            Fail("expected digit");
        }
        while (Peek() >= '0' && Peek() <= '9') {
            ++pos_;
        }
        if (Peek() == '.' || Peek() == 'e' || Peek() == 'E') {
            Fail("fractional numbers are not supported");
        }

        const std::string digits = text_.substr(start, pos_ - start);
        errno = 0;
        const long long value = std::strtoll(digits.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            pos_ = start;
            Fail("integer out of range");
        }
        return JSONValue(static_cast<int64_t>(value));
    }

    unsigned HexQuad() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated \\u escape");
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') {
                code |= static_cast<unsigned>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                code |= static_cast<unsigned>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                code |= static_cast<unsigned>(h - 'A' + 10);
            } else {
                Fail("bad hex digit in \\u escape");
            }
        }
        return code;
    }

    std::string StringValue() {
        Expect('"');
        std::string out;
        for (;;) {
            if (AtEnd()) {
                Fail("unterminated string");
            }
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                Fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (AtEnd()) {
                Fail("unterminated escape");
            }
            switch (text_[pos_++]) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  AppendUtf8(out, HexQuad()); break;
                default:
                    --pos_;
                    Fail("unknown escape");
            }
        }
    }

    JSONValue ArrayValue(int depth) {
        if (depth > JSONValue::MAX_DEPTH) {
            Fail("nesting too deep");
        }
        Expect('[');
        JSONValue::Array items;
        SkipSpace();
        if (Peek() == ']') {
            ++pos_;
            return JSONValue(std::move(items));
        }
        for (;;) {
            items.push_back(Value(depth));
            SkipSpace();
            if (Peek() == ']') {
                ++pos_;
                return JSONValue(std::move(items));
            }
            Expect(',');
        }
    }

    JSONValue ObjectValue(int depth) {
        if (depth > JSONValue::MAX_DEPTH) {
            Fail("nesting too deep");
        }
        Expect('{');
        JSONValue::Object members;
        SkipSpace();
        if (Peek() == '}') {
            ++pos_;
            return JSONValue(std::move(members));
        }
        for (;;) {
            SkipSpace();
            std::string key = StringValue();
            Expect(':');
            members[std::move(key)] = Value(depth);
            SkipSpace();
            if (Peek() == '}') {
                ++pos_;
                return JSONValue(std::move(members));
            }
            Expect(',');
        }
    }

    const std::string& text_;
    size_t pos_{0};
};

} // anonymous namespace

namespace {

const JSONValue NULL_VALUE;
const JSONValue::Array EMPTY_ARRAY;
const JSONValue::Object EMPTY_OBJECT;
const std::string EMPTY_STRING;

} // namespace

// ============================================================================
// Accessors
// ============================================================================

JSONValue JSONValue::FromStrings(const std::vector<std::string>& values) {
    return JSONValue(Array(values.begin(), values.end()));
}

bool JSONValue::GetBool(bool fallback) const {
    const bool* b = std::get_if<bool>(&data_);
    return b ? *b : fallback;
}

int64_t JSONValue::GetInt(int64_t fallback) const {
    const int64_t* i = std::get_if<int64_t>(&data_);
    return i ? *i : fallback;
}

const std::string& JSONValue::GetString() const {
    const std::string* s = std::get_if<std::string>(&data_);
    return s ? *s : EMPTY_STRING;
}

const JSONValue::Array& JSONValue::GetArray() const {
    const Array* a = std::get_if<Array>(&data_);
    return a ? *a : EMPTY_ARRAY;
}

const JSONValue::Object& JSONValue::GetObject() const {
    const Object* o = std::get_if<Object>(&data_);
    return o ? *o : EMPTY_OBJECT;
}

bool JSONValue::HasKey(const std::string& key) const {
    return GetObject().count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    const Object& members = GetObject();
    auto it = members.find(key);
    return it == members.end() ? NULL_VALUE : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (!IsObject()) {
        data_ = Object{};
    }
    return std::get<Object>(data_)[key];
}

size_t JSONValue::Size() const {
    if (IsArray()) return GetArray().size();
    if (IsObject()) return GetObject().size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    const Array& items = GetArray();
    return index < items.size() ? items[index] : NULL_VALUE;
}

void JSONValue::Push(JSONValue value) {
    if (!IsArray()) {
        data_ = Array{};
    }
    std::get<Array>(data_).push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

void JSONValue::Write(std::string& out, bool pretty, int depth) const {
    auto breakLine = [&](int level) {
        if (pretty) {
            out += '\n';
            out.append(static_cast<size_t>(level) * 2, ' ');
        }
    };

    if (IsNull()) {
        out += "null";
    } else if (const bool* b = std::get_if<bool>(&data_)) {
        out += *b ? "true" : "false";
    } else if (const int64_t* i = std::get_if<int64_t>(&data_)) {
        out += std::to_string(*i);
    } else if (const std::string* s = std::get_if<std::string>(&data_)) {
        AppendQuoted(out, *s);
    } else if (const Array* items = std::get_if<Array>(&data_)) {
        out += '[';
        for (size_t n = 0; n < items->size(); ++n) {
            out += n == 0 ? "" : ",";
            breakLine(depth + 1);
            (*items)[n].Write(out, pretty, depth + 1);
        }
        if (!items->empty()) breakLine(depth);
        out += ']';
    } else {
        const Object& members = std::get<Object>(data_);
        out += '{';
        bool first = true;
        for (const auto& [key, value] : members) {
            out += first ? "" : ",";
            first = false;
            breakLine(depth + 1);
            AppendQuoted(out, key);
            out += pretty ? ": " : ":";
            value.Write(out, pretty, depth + 1);
        }
        if (!members.empty()) breakLine(depth);
        out += '}';
    }
}

std::string JSONValue::ToJSON(bool pretty) const {
    std::string out;
    Write(out, pretty, 0);
    return out;
}

JSONValue JSONValue::Parse(const std::string& json) {
    return Parser(json).Document();
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    try {
        return Parser(json).Document();
    } catch (const JSONParseError&) {
        return std::nullopt;
    }
}

} // namespace util
} // namespace veriscore
