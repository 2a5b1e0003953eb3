// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/request.h"
#include "core/hex.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace rpc {

// ===========================================================================
// JsonValue
// ===========================================================================

int64_t JsonValue::get_int() const {
    if (auto* p = std::get_if<int64_t>(&v_)) return *p;
    if (auto* p = std::get_if<double>(&v_)) {
        if (std::trunc(*p) != *p) {
            throw std::runtime_error("JsonValue: not an integer");
        }
        return static_cast<int64_t>(*p);
    }
    throw std::runtime_error("JsonValue: not an integer");
}

double JsonValue::get_double() const {
    if (auto* p = std::get_if<double>(&v_)) return *p;
    if (auto* p = std::get_if<int64_t>(&v_)) return static_cast<double>(*p);
    throw std::runtime_error("JsonValue: not a number");
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (is_null()) v_ = Object{};
    return as<Object>("object")[key];
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue null_val;
    const auto* obj = std::get_if<Object>(&v_);
    if (!obj) return null_val;
    auto it = obj->find(key);
    return it != obj->end() ? it->second : null_val;
}

void JsonValue::push_back(JsonValue val) {
    if (is_null()) v_ = Array{};
    as<Array>("array").push_back(std::move(val));
}

bool JsonValue::has_key(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&v_);
    return obj && obj->count(key) > 0;
}

size_t JsonValue::size() const {
    if (const auto* a = std::get_if<Array>(&v_)) return a->size();
    if (const auto* o = std::get_if<Object>(&v_)) return o->size();
    if (const auto* s = std::get_if<std::string>(&v_)) return s->size();
    return 0;
}

// ===========================================================================
// Reader
// ===========================================================================

namespace {

constexpr int MAX_DEPTH = 64;

[[noreturn]] void fail(const std::string& what) {
    throw std::runtime_error("JSON: " + what);
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

class JsonReader {
public:
    explicit JsonReader(std::string_view in) : in_(in) {}

    JsonValue read_document() {
        JsonValue v = read_value(0);
        skip_ws();
        if (pos_ != in_.size()) fail("trailing content after value");
        return v;
    }

private:
    std::string_view in_;
    size_t pos_ = 0;

    [[nodiscard]] bool at_end() const { return pos_ >= in_.size(); }

    char next() {
        if (at_end()) fail("unexpected end of input");
        return in_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (!at_end() && in_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void require(char c) {
        if (!consume(c)) fail(std::string("expected '") + c + "'");
    }

    void literal(std::string_view word) {
        if (in_.substr(pos_, word.size()) != word) fail("invalid literal");
        pos_ += word.size();
    }

    JsonValue read_value(int depth) {
        if (depth > MAX_DEPTH) fail("nesting too deep");
        skip_ws();
        if (at_end()) fail("unexpected end of input");

        char c = in_[pos_];
        if (c == '"') return JsonValue(read_string());
        if (c == '{') return read_object(depth);
        if (c == '[') return read_array(depth);
        if (c == 't') { literal("true");  return JsonValue(true); }
        if (c == 'f') { literal("false"); return JsonValue(false); }
        if (c == 'n') { literal("null");  return JsonValue(nullptr); }
        if (c == '-' || is_digit(c)) return read_number();
        fail(std::string("unexpected character '") + c + "'");
    }

    void skip_digits() {
        while (!at_end() && is_digit(in_[pos_])) ++pos_;
    }

    JsonValue read_number() {
        size_t start = pos_;
        bool fractional = false;

        if (in_[pos_] == '-') ++pos_;
        if (at_end() || !is_digit(in_[pos_])) fail("invalid number");
        if (in_[pos_] == '0') {
            ++pos_;
        } else {
            skip_digits();
        }
        if (!at_end() && in_[pos_] == '.') {
            fractional = true;
            ++pos_;
            if (at_end() || !is_digit(in_[pos_])) fail("invalid fraction");
            skip_digits();
        }
        if (!at_end() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            fractional = true;
            ++pos_;
            if (!at_end() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            if (at_end() || !is_digit(in_[pos_])) fail("invalid exponent");
            skip_digits();
        }

        const char* first = in_.data() + start;
        const char* last  = in_.data() + pos_;
        if (!fractional) {
            int64_t i = 0;
            auto [p, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && p == last) return JsonValue(i);
        }
        double d = 0.0;
        auto [p, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || p != last) fail("number out of range");
        return JsonValue(d);
    }

    uint32_t read_hex4() {
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            int d = core::hex_digit_value(next());
            if (d < 0) fail("invalid unicode escape");
            v = (v << 4) | static_cast<uint32_t>(d);
        }
        return v;
    }

    std::string read_string() {
        require('"');
        std::string out;
        for (;;) {
            char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (next() != '\\' || next() != 'u') {
                            fail("missing low surrogate");
                        }
                        uint32_t lo = read_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    JsonValue read_array(int depth) {
        require('[');
        JsonValue::Array arr;
        if (consume(']')) return JsonValue(std::move(arr));
        do {
            arr.push_back(read_value(depth + 1));
        } while (consume(','));
        require(']');
        return JsonValue(std::move(arr));
    }

    JsonValue read_object(int depth) {
        require('{');
        JsonValue::Object obj;
        if (consume('}')) return JsonValue(std::move(obj));
        do {
            skip_ws();
            std::string key = read_string();
            require(':');
            obj[std::move(key)] = read_value(depth + 1);
        } while (consume(','));
        require('}');
        return JsonValue(std::move(obj));
    }
};

// ===========================================================================
// Writer
// ===========================================================================

void write_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

// indent == 0 writes the compact form.
void write_value(std::string& out, const JsonValue& val, int indent, int depth) {
    auto newline = [&](int d) {
        if (indent == 0) return;
        out += '\n';
        out.append(static_cast<size_t>(indent * d), ' ');
    };

    if (val.is_null()) {
        out += "null";
    } else if (val.is_bool()) {
        out += val.get_bool() ? "true" : "false";
    } else if (val.is_int()) {
        out += std::to_string(val.get_int());
    } else if (val.is_double()) {
        double d = val.get_double();
        if (!std::isfinite(d)) {
            out += "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", d);
            out += buf;
        }
    } else if (val.is_string()) {
        write_string(out, val.get_string());
    } else if (val.is_array()) {
        const auto& arr = val.get_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out += ',';
            newline(depth + 1);
            write_value(out, arr[i], indent, depth + 1);
        }
        if (!arr.empty()) newline(depth);
        out += ']';
    } else {
        const auto& obj = val.get_object();
        out += '{';
        bool first = true;
        for (const auto& [key, v] : obj) {
            if (!first) out += ',';
            first = false;
            newline(depth + 1);
            write_string(out, key);
            out += indent == 0 ? ":" : ": ";
            write_value(out, v, indent, depth + 1);
        }
        if (!obj.empty()) newline(depth);
        out += '}';
    }
}

} // namespace

JsonValue parse_json(std::string_view input) {
    if (input.empty()) fail("empty input");
    return JsonReader(input).read_document();
}

std::string json_serialize(const JsonValue& val) {
    std::string out;
    out.reserve(256);
    write_value(out, val, 0, 0);
    return out;
}

std::string json_serialize_pretty(const JsonValue& val, int indent) {
    std::string out;
    out.reserve(512);
    write_value(out, val, indent > 0 ? indent : 2, 0);
    out += '\n';
    return out;
}

// ===========================================================================
// RpcRequest / RpcResponse
// ===========================================================================

RpcRequest RpcRequest::from_json(const JsonValue& val) {
    if (!val.is_object()) {
        throw std::runtime_error("RPC request must be a JSON object");
    }

    RpcRequest req;
    const auto& method = val["method"];
    if (!method.is_string() || method.get_string().empty()) {
        throw std::runtime_error("RPC request missing 'method' string");
    }
    req.method = method.get_string();

    const auto& params = val["params"];
    if (params.is_null()) {
        req.params = JsonValue::array();
    } else if (params.is_array() || params.is_object()) {
        req.params = params;
    } else {
        throw std::runtime_error("RPC 'params' must be an array or object");
    }

    // Numeric ids are echoed back; anything else maps to 0.
    const auto& id = val["id"];
    if (id.is_int()) {
        req.id = id.get_int();
    } else if (id.is_string()) {
        const auto& s = id.get_string();
        int64_t parsed = 0;
        auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
        req.id = (ec == std::errc{} && p == s.data() + s.size()) ? parsed : 0;
    }
    return req;
}

JsonValue RpcResponse::to_json() const {
    JsonValue obj = JsonValue::object();
    obj["jsonrpc"] = "2.0";
    obj["result"]  = result;
    obj["error"]   = error;
    obj["id"]      = id;
    return obj;
}

std::string RpcResponse::serialize() const {
    return json_serialize(to_json());
}

RpcResponse make_result(JsonValue result, int64_t id) {
    RpcResponse resp;
    resp.result = std::move(result);
    resp.id     = id;
    return resp;
}

RpcResponse make_error(RpcError code, const std::string& message, int64_t id) {
    return make_error(code, message, JsonValue(), id);
}

RpcResponse make_error(RpcError code, const std::string& message,
                       const JsonValue& data, int64_t id) {
    RpcResponse resp;
    JsonValue err = JsonValue::object();
    err["code"]    = static_cast<int64_t>(code);
    err["message"] = message;
    if (!data.is_null()) err["data"] = data;
    resp.error = std::move(err);
    resp.id    = id;
    return resp;
}

} // namespace rpc
