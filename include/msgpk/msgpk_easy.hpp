#pragma once

#include "msgpk/msgpk.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace msgpk::easy {

namespace detail {
inline int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace detail

// Parse hex text such as "82 a1 61 01". Whitespace between digits is ignored.
inline Bytes from_hex(std::string_view text) {
    Bytes out;
    out.reserve(text.size() / 2);
    int hi = -1;
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\t' || c == '\r') continue;
        const int n = detail::hex_nibble(c);
        if (n < 0) {
            throw MsgpkError(ErrorKind::InvalidArgument, std::string("invalid hex digit '") + c + "'");
        }
        if (hi < 0) {
            hi = n;
        } else {
            out.push_back(static_cast<std::uint8_t>((hi << 4) | n));
            hi = -1;
        }
    }
    if (hi >= 0) {
        throw MsgpkError(ErrorKind::InvalidArgument, "hex text has an odd number of digits");
    }
    return out;
}

inline std::string to_hex(const std::uint8_t* data, std::size_t size, bool spaced = false) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * (spaced ? 3 : 2));
    for (std::size_t i = 0; i < size; ++i) {
        if (spaced && i) out.push_back(' ');
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

inline std::string to_hex(const Bytes& data, bool spaced = false) {
    return to_hex(data.data(), data.size(), spaced);
}

inline Value str(std::string s) {
    return Value::make_string(std::move(s));
}

inline Value array_of(std::initializer_list<Value> items) {
    return Value::make_array(Value::Array(items));
}

// Map with string keys, e.g. map_of({{"compact", Value::make_bool(true)}}).
inline Value map_of(std::initializer_list<std::pair<std::string, Value>> entries) {
    Value::Map m;
    for (const auto& [k, v] : entries) {
        m.insert_or_assign(Value::make_string(k), v);
    }
    return Value::make_map(std::move(m));
}

inline void set(Value::Map& root, std::string key, Value v) {
    root.insert_or_assign(Value::make_string(std::move(key)), std::move(v));
}

} // namespace msgpk::easy
