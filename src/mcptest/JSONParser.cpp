//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, compact/pretty serializers and JSON-RPC envelope codecs
//==========================================================================================================

#include <charconv>
#include <cmath>
#include <cctype>
#include <cstdio>
#include <sstream>
#include "mcptest/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcptest {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int MaxNestingDepth = 256;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw JSONParseError(std::string(what) + " at offset " + std::to_string(i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate: a low surrogate escape must follow
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("Unpaired high surrogate");
                        }
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Unexpected character");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Expected digits after decimal point");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Expected exponent digits");
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto res = std::from_chars(first, last, v);
            if (res.ec == std::errc() && res.ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: fall back to double like most JSON decoders
        }
        double d = 0.0;
        auto res = std::from_chars(first, last, d);
        if (res.ec != std::errc() || res.ptr != last) fail("Invalid number");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxNestingDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void writeUnicodeEscape(std::ostringstream& oss, unsigned int unit) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04x", unit);
    oss << buf;
}

// Writes one UTF-8 sequence starting at v[i] as \uXXXX escapes (a surrogate pair above U+FFFF) and
// returns the index of its last byte. Malformed sequences become U+FFFD.
std::size_t writeEscapedCodePoint(std::ostringstream& oss, const std::string& v, std::size_t i) {
    const auto lead = static_cast<unsigned char>(v[i]);
    std::size_t extra = 0;
    unsigned int cp = 0;
    if ((lead & 0xE0) == 0xC0) { extra = 1; cp = lead & 0x1Fu; }
    else if ((lead & 0xF0) == 0xE0) { extra = 2; cp = lead & 0x0Fu; }
    else if ((lead & 0xF8) == 0xF0) { extra = 3; cp = lead & 0x07u; }
    else {
        writeUnicodeEscape(oss, 0xFFFD);
        return i;
    }
    if (i + extra >= v.size()) {
        writeUnicodeEscape(oss, 0xFFFD);
        return v.size() - 1;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto c = static_cast<unsigned char>(v[i + k]);
        if ((c & 0xC0) != 0x80) {
            writeUnicodeEscape(oss, 0xFFFD);
            return i + k - 1;
        }
        cp = (cp << 6) | (c & 0x3Fu);
    }
    if (cp > 0xFFFF) {
        cp -= 0x10000;
        writeUnicodeEscape(oss, 0xD800 + (cp >> 10));
        writeUnicodeEscape(oss, 0xDC00 + (cp & 0x3FFu));
    } else {
        writeUnicodeEscape(oss, cp);
    }
    return i + extra;
}

// asciiOnly escapes every non-ASCII character, so the output is pure 7-bit text.
void writeEscapedString(std::ostringstream& oss, const std::string& v, bool asciiOnly = false) {
    oss << '"';
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    writeUnicodeEscape(oss, static_cast<unsigned char>(c));
                } else if (asciiOnly && static_cast<unsigned char>(c) >= 0x80) {
                    i = writeEscapedCodePoint(oss, v, i);
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

// Shortest round-trip form; integral doubles keep a ".0" suffix so the type survives re-parsing.
void writeDouble(std::ostringstream& oss, double v) {
    if (!std::isfinite(v)) {
        oss << "null";
        return;
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string text(buf, res.ptr);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    oss << text;
}

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level, bool asciiOnly) {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (pretty) {
            oss << '\n' << std::string(static_cast<std::size_t>(lvl * indent), ' ');
        }
    };
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            writeDouble(oss, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v, asciiOnly);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (v.empty()) { oss << "[]"; return; }
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                newline(level + 1);
                if (v[k]) writeValue(oss, *v[k], indent, level + 1, asciiOnly); else oss << "null";
            }
            newline(level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (v.empty()) { oss << "{}"; return; }
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                newline(level + 1);
                writeEscapedString(oss, key, asciiOnly);
                oss << (pretty ? ": " : ":");
                if (val) writeValue(oss, *val, indent, level + 1, asciiOnly); else oss << "null";
            }
            newline(level);
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscapedString(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

// Reads a JSON-RPC id member; returns false when the member has a type JSON-RPC does not allow.
bool readId(const JSONValue& obj, JSONRPCId& id) {
    const JSONValue* idVal = obj.find("id");
    if (idVal == nullptr) {
        id = nullptr;
        return true;
    }
    if (std::holds_alternative<std::string>(idVal->value)) {
        id = std::get<std::string>(idVal->value);
        return true;
    }
    if (std::holds_alternative<int64_t>(idVal->value)) {
        id = std::get<int64_t>(idVal->value);
        return true;
    }
    if (std::holds_alternative<std::nullptr_t>(idVal->value)) {
        id = nullptr;
        return true;
    }
    return false;
}
} // namespace

JSONValue parseJSONValue(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("Trailing characters after JSON document");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value, 0, 0, false);
    return oss.str();
}

std::string serializeJSONValuePretty(const JSONValue& value, int indent) {
    std::ostringstream oss;
    writeValue(oss, value, indent < 0 ? 0 : indent, 0, true);
    return oss.str();
}

std::string idToString(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return std::get<std::string>(id);
    if (std::holds_alternative<int64_t>(id)) return std::to_string(std::get<int64_t>(id));
    return "null";
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    try {
        return FromJSON(parseJSONValue(json));
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    oss << ",\"method\":";
    writeEscapedString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << serializeJSONValue(params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    if (!value.isObject()) return false;
    const JSONValue* m = value.find("method");
    if (m == nullptr || !m->isString()) return false;
    if (value.find("id") == nullptr) return false;
    if (!readId(value, id)) return false;
    method = std::get<std::string>(m->value);
    params.reset();
    if (const JSONValue* p = value.find("params")) {
        params = *p;
    }
    return !method.empty();
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    if (result.has_value()) {
        oss << ",\"result\":" << serializeJSONValue(result.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":" << serializeJSONValue(error.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    if (!value.isObject()) return false;
    const JSONValue* r = value.find("result");
    const JSONValue* e = value.find("error");
    if (r == nullptr && e == nullptr) return false;
    if (!readId(value, id)) return false;
    result.reset();
    error.reset();
    if (r != nullptr) result = *r;
    if (e != nullptr) error = *e;
    return true;
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"method\":";
    writeEscapedString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":" << serializeJSONValue(params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    if (!value.isObject()) return false;
    if (value.find("id") != nullptr) return false;
    const JSONValue* m = value.find("method");
    if (m == nullptr || !m->isString()) return false;
    method = std::get<std::string>(m->value);
    params.reset();
    if (const JSONValue* p = value.find("params")) {
        params = *p;
    }
    return !method.empty();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(errorObj);
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcptest
