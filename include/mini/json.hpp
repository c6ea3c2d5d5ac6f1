#pragma once
// Small JSON reader for index documents and config.json.
// Accepts objects, arrays, strings (with \uXXXX escapes), numbers, bools and
// null. Numbers keep both an integer and a floating view. Not a validating
// parser: trailing garbage after the top-level value is ignored. Nesting deeper
// than max_depth fails the parse.

#include <string>
#include <unordered_map>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace mini {

constexpr int max_depth = 256;

struct Value;
using Object = std::unordered_map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str;
    int64_t number{0};
    double real{0.0};
    bool integral{false};   // number holds the exact value
    bool boolean{false};
    Object object;
    Array array;

    bool isString() const { return type == Type::String; }
    bool isNumber() const { return type == Type::Number; }
    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }
};

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline bool parse_hex4(const std::string& s, size_t& i, uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
        char c = s[i++];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') return true;
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i >= s.size()) return false;
        char esc = s[i++];
        switch (esc) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                uint32_t cp = 0;
                if (!parse_hex4(s, i, cp)) return false;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                    size_t save = i;
                    i += 2;
                    uint32_t lo = 0;
                    if (parse_hex4(s, i, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else {
                        i = save;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(esc); break;
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth);

inline bool parse_number(const std::string& s, size_t& i, Value& out) {
    size_t start = i;
    bool fractional = false;
    while (i < s.size()) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
            i++;
        } else if (c == '.' || c == 'e' || c == 'E') {
            fractional = true;
            i++;
        } else {
            break;
        }
    }
    const std::string text = s.substr(start, i - start);
    char* end = nullptr;
    out.type = Value::Type::Number;
    out.real = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) return false;
    out.number = 0;
    out.integral = false;
    if (!fractional) {
        errno = 0;
        const long long v = std::strtoll(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            out.number = v;
            out.integral = true;
            return true;
        }
    }
    // Only truncate when the double fits; 2^63 itself does not.
    if (std::isfinite(out.real) && out.real > -9223372036854775808.0 && out.real < 9223372036854775808.0) {
        out.number = static_cast<int64_t>(out.real);
    }
    return true;
}

inline bool parse_value(const std::string& s, size_t& i, Value& out, int depth = 0) {
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        return parse_number(s, i, out);
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool; out.boolean = true; i += 4; return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool; out.boolean = false; i += 5; return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null; i += 4; return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object, depth + 1);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array, depth + 1);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth = 1) {
    if (depth > max_depth) return false;
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') {
            i++;
            skip_ws(s, i);
        } else if (i < s.size() && s[i] != '}') {
            return false;
        }
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth = 1) {
    if (depth > max_depth) return false;
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') {
            i++;
            skip_ws(s, i);
        } else if (i < s.size() && s[i] != ']') {
            return false;
        }
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

inline bool parse(const std::string& s, Object& out) {
    size_t i = 0;
    skip_ws(s, i);
    return parse_object(s, i, out);
}

inline bool parse(const std::string& s, Array& out) {
    size_t i = 0;
    skip_ws(s, i);
    return parse_array(s, i, out);
}

inline bool parse(const std::string& s, Value& out) {
    size_t i = 0;
    return parse_value(s, i, out);
}

// Escape a string for embedding between double quotes.
inline std::string escape(const std::string& in) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(in.size() + 2);
    for (unsigned char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

} // namespace mini
