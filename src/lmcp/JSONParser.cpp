//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializers and JSON-RPC message (de)serialization
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "lmcp/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace lmcp {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int v) : value(static_cast<int64_t>(v)) {}
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
    const auto* obj = std::get_if<Object>(&value);
    if (obj == nullptr) {
        return nullptr;
    }
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                const JSONValue nullValue;
                const JSONValue& l = lhs[i] ? *lhs[i] : nullValue;
                const JSONValue& r = rhs[i] ? *rhs[i] : nullValue;
                if (!(l == r)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [key, val] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end()) return false;
                const JSONValue nullValue;
                if (!((val ? *val : nullValue) == (it->second ? *it->second : nullValue))) return false;
            }
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, val] : members) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue{std::move(obj)};
}

JSONValue MakeArray(std::initializer_list<JSONValue> items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue{std::move(arr)};
}

std::optional<std::string> GetString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<int64_t> GetInt(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&v->value)) return *i;
    if (const auto* d = std::get_if<double>(&v->value)) {
        if (std::isfinite(*d) && std::floor(*d) == *d) return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

std::optional<bool> GetBool(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = obj.find(key);
    if (v == nullptr) return std::nullopt;
    if (const auto* b = std::get_if<bool>(&v->value)) return *b;
    return std::nullopt;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr std::size_t kMaxDepth = 512;

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
    std::size_t depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const { throw JSONParseError(what, i); }

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
        for (int k = 0; k < 4; ++k) {
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
        ++i; // skip opening quote
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
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 6 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate");
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
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid fraction");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double like most JSON stacks
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        ++i; // '['
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue v = parseScalarOrContainer();
        --depth;
        return v;
    }

    JSONValue parseScalarOrContainer() {
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

void serializeString(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeDouble(std::string& out, double v) {
    if (!std::isfinite(v)) {
        out += "null";
        return;
    }
    std::string num = fmt::format("{}", v);
    // Keep a fractional marker so the value parses back as a double
    if (num.find_first_of(".eE") == std::string::npos) {
        num += ".0";
    }
    out += num;
}

void serializeInto(std::string& out, const JSONValue& value, bool sortKeys) {
    std::visit([&out, sortKeys](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            serializeDouble(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            serializeString(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (v[i]) serializeInto(out, *v[i], sortKeys); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<const std::pair<const std::string, std::shared_ptr<JSONValue>>*> members;
            members.reserve(v.size());
            for (const auto& kv : v) members.push_back(&kv);
            if (sortKeys) {
                std::sort(members.begin(), members.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
            }
            out.push_back('{');
            bool first = true;
            for (const auto* kv : members) {
                if (!first) out.push_back(',');
                first = false;
                serializeString(out, kv->first);
                out.push_back(':');
                if (kv->second) serializeInto(out, *kv->second, sortKeys); else out += "null";
            }
            out.push_back('}');
        }
    }, value.value);
}

// Common envelope writer shared by the message types
std::string serializeEnvelope(const std::string& jsonrpc,
                              const JSONRPCId* id,
                              const std::string* method,
                              const std::optional<JSONValue>* params,
                              const std::optional<JSONValue>* result,
                              const std::optional<JSONValue>* error) {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    if (id) obj["id"] = std::make_shared<JSONValue>(IdToJSON(*id));
    if (method) obj["method"] = std::make_shared<JSONValue>(*method);
    if (params && params->has_value()) obj["params"] = std::make_shared<JSONValue>(params->value());
    if (result && result->has_value()) obj["result"] = std::make_shared<JSONValue>(result->value());
    if (error && error->has_value()) obj["error"] = std::make_shared<JSONValue>(error->value());
    return SerializeJSON(JSONValue{std::move(obj)});
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value, false);
    return out;
}

std::string CanonicalJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value, true);
    return out;
}

std::string IdKey(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "s:" + v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "i:" + std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue { return JSONValue(v); }, id);
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) return JSONRPCId{*s};
    if (const auto* i = std::get_if<int64_t>(&v.value)) return JSONRPCId{*i};
    if (const auto* d = std::get_if<double>(&v.value)) {
        // Some peers echo integer ids as 1.0
        if (std::isfinite(*d) && std::floor(*d) == *d) return JSONRPCId{static_cast<int64_t>(*d)};
        return std::nullopt;
    }
    if (v.isNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

MessageKind ClassifyMessage(const JSONValue& msg) {
    if (!msg.isObject()) {
        return MessageKind::Unknown;
    }
    const bool hasMethod = msg.find("method") != nullptr;
    const bool hasId = msg.find("id") != nullptr;
    const bool hasResult = msg.find("result") != nullptr;
    const bool hasError = msg.find("error") != nullptr;
    if (hasMethod) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    if (hasId && (hasResult || hasError)) {
        return MessageKind::Response;
    }
    return MessageKind::Unknown;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    return serializeEnvelope(jsonrpc, &id, &method, &params, nullptr, nullptr);
}

bool JSONRPCRequest::FromJSON(const JSONValue& msg) {
    auto m = GetString(msg, "method");
    const JSONValue* idVal = msg.find("id");
    if (!m || idVal == nullptr) {
        return false;
    }
    auto parsedId = IdFromJSON(*idVal);
    if (!parsedId) {
        return false;
    }
    method = std::move(*m);
    id = std::move(*parsedId);
    if (const JSONValue* p = msg.find("params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    if (error.has_value()) {
        return serializeEnvelope(jsonrpc, &id, nullptr, nullptr, nullptr, &error);
    }
    // A success response always carries a result member, null when unset
    const std::optional<JSONValue> res = result.has_value() ? result : std::optional<JSONValue>(JSONValue(nullptr));
    return serializeEnvelope(jsonrpc, &id, nullptr, nullptr, &res, nullptr);
}

bool JSONRPCResponse::FromJSON(const JSONValue& msg) {
    const JSONValue* idVal = msg.find("id");
    if (idVal == nullptr) {
        return false;
    }
    auto parsedId = IdFromJSON(*idVal);
    if (!parsedId) {
        return false;
    }
    id = std::move(*parsedId);
    result.reset();
    error.reset();
    if (const JSONValue* r = msg.find("result")) result = *r;
    if (const JSONValue* e = msg.find("error")) error = *e;
    return result.has_value() || error.has_value();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    return serializeEnvelope(jsonrpc, nullptr, &method, &params, nullptr, nullptr);
}

bool JSONRPCNotification::FromJSON(const JSONValue& msg) {
    auto m = GetString(msg, "method");
    if (!m || msg.find("id") != nullptr) {
        return false;
    }
    method = std::move(*m);
    if (const JSONValue* p = msg.find("params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace lmcp
