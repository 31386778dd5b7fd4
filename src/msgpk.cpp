
#include "msgpk/msgpk.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <type_traits>

namespace msgpk {

// ------------------------------
// Errors and coding paths
// ------------------------------

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::InsufficientData: return "insufficient data";
        case ErrorKind::InvalidData: return "invalid data";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::InexactConversion: return "inexact conversion";
        case ErrorKind::UnsupportedType: return "unsupported type";
        case ErrorKind::KeyNotFound: return "key not found";
        case ErrorKind::ValueNotFound: return "value not found";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::NestingTooDeep: return "nesting too deep";
        case ErrorKind::Io: return "io";
        case ErrorKind::ZlibError: return "zlib";
    }
    return "unknown";
}

CodingKey CodingKey::named(std::string name) {
    CodingKey k;
    k.name = std::move(name);
    return k;
}

CodingKey CodingKey::indexed(std::size_t i) {
    CodingKey k;
    k.name = "Index " + std::to_string(i);
    k.index = i;
    return k;
}

CodingKey CodingKey::super_key() {
    return named("super");
}

std::string format_coding_path(const CodingPath& path) {
    if (path.empty()) return "<root>";
    std::string out;
    for (const auto& key : path) {
        if (key.index) {
            out += "[" + std::to_string(*key.index) + "]";
        } else {
            if (!out.empty()) out += ".";
            out += key.name;
        }
    }
    return out;
}

static std::string with_path(const std::string& msg, const CodingPath& path) {
    if (path.empty()) return msg;
    return msg + " (at " + format_coding_path(path) + ")";
}

MsgpkError::MsgpkError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

MsgpkError::MsgpkError(ErrorKind k, const std::string& msg, CodingPath path)
    : std::runtime_error(with_path(msg, path)), kind_(k), path_(std::move(path)) {}

ErrorKind MsgpkError::kind() const noexcept { return kind_; }

const CodingPath& MsgpkError::coding_path() const noexcept { return path_; }

// ------------------------------
// Byte helpers (internal)
// ------------------------------

static void append_u16_be(Bytes& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

static void append_u32_be(Bytes& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

static void append_u64_be(Bytes& out, std::uint64_t v) {
    append_u32_be(out, static_cast<std::uint32_t>(v >> 32));
    append_u32_be(out, static_cast<std::uint32_t>(v));
}

// Joins `n` big-endian bytes into a 64-bit accumulator.
static std::uint64_t read_be_from(const std::uint8_t* p, std::size_t n) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        v = (v << 8) | p[i];
    }
    return v;
}

static std::uint32_t float_bits(float f) {
    std::uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

static std::uint64_t double_bits(double d) {
    std::uint64_t u;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

static float float_from_bits(std::uint32_t u) {
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

static double double_from_bits(std::uint64_t u) {
    double d;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

// A cursor over caller-owned bytes, for decode calls that never hand out a remainder.
static ByteCursor borrowed_cursor(const Bytes& data) {
    return ByteCursor(std::shared_ptr<const Bytes>(std::shared_ptr<const Bytes>{}, &data));
}

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t i = 0;
    while (i < size) {
        const std::uint8_t c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (size - i < len) return false;

        for (std::size_t k = 1; k < len; ++k) {
            const std::uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

// ------------------------------
// Kind / Value
// ------------------------------

std::string to_string(Kind k) {
    switch (k) {
        case Kind::Nil: return "nil";
        case Kind::Bool: return "bool";
        case Kind::Int: return "int";
        case Kind::UInt: return "uint";
        case Kind::Float: return "float32";
        case Kind::Double: return "float64";
        case Kind::String: return "string";
        case Kind::Binary: return "binary";
        case Kind::Array: return "array";
        case Kind::Map: return "map";
        case Kind::Extended: return "extended";
        case Kind::Timestamp: return "timestamp";
    }
    return "unknown";
}

Value Value::make_nil() {
    return Value{};
}

Value Value::make_bool(bool b) {
    Value out;
    out.v.emplace<bool>(b);
    return out;
}

Value Value::make_int(std::int64_t i) {
    Value out;
    out.v.emplace<std::int64_t>(i);
    return out;
}

Value Value::make_uint(std::uint64_t u) {
    Value out;
    out.v.emplace<std::uint64_t>(u);
    return out;
}

Value Value::make_float(float f) {
    Value out;
    out.v.emplace<float>(f);
    return out;
}

Value Value::make_double(double d) {
    Value out;
    out.v.emplace<double>(d);
    return out;
}

Value Value::make_string(std::string s) {
    Value out;
    out.v.emplace<std::string>(std::move(s));
    return out;
}

Value Value::make_binary(Bytes b) {
    Value out;
    out.v.emplace<Bytes>(std::move(b));
    return out;
}

Value Value::make_array(Array a) {
    Value out;
    out.v.emplace<Array>(std::move(a));
    return out;
}

Value Value::make_map(Map m) {
    Value out;
    out.v.emplace<Map>(std::move(m));
    return out;
}

Value Value::make_extended(std::int8_t type, Bytes data) {
    if (type == kTimestampType) {
        throw MsgpkError(ErrorKind::InvalidArgument,
                         "extension type -1 is reserved for timestamps; use make_timestamp");
    }
    if (data.size() > 0xFFFFFFFFull) {
        throw MsgpkError(ErrorKind::InvalidArgument, "extension payload exceeds 2^32-1 bytes");
    }
    Value out;
    out.v.emplace<Extended>(Extended{type, std::move(data)});
    return out;
}

Value Value::make_timestamp(std::int64_t seconds, std::uint32_t nanoseconds) {
    return make_timestamp(Timestamp{seconds, nanoseconds});
}

Value Value::make_timestamp(const Timestamp& ts) {
    if (ts.nanoseconds > 999999999u) {
        throw MsgpkError(ErrorKind::InvalidArgument,
                         "timestamp nanoseconds out of range: " + std::to_string(ts.nanoseconds));
    }
    Value out;
    out.v.emplace<Timestamp>(ts);
    return out;
}

Kind Value::kind() const noexcept {
    return static_cast<Kind>(v.index());
}

bool Value::is_nil() const noexcept { return std::holds_alternative<Nil>(v); }
bool Value::is_bool() const noexcept { return std::holds_alternative<bool>(v); }
bool Value::is_integer() const noexcept {
    return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<std::uint64_t>(v);
}
bool Value::is_floating() const noexcept {
    return std::holds_alternative<float>(v) || std::holds_alternative<double>(v);
}
bool Value::is_string() const noexcept { return std::holds_alternative<std::string>(v); }
bool Value::is_binary() const noexcept { return std::holds_alternative<Bytes>(v); }
bool Value::is_array() const noexcept { return std::holds_alternative<Array>(v); }
bool Value::is_map() const noexcept { return std::holds_alternative<Map>(v); }
bool Value::is_extended() const noexcept { return std::holds_alternative<Extended>(v); }
bool Value::is_timestamp() const noexcept { return std::holds_alternative<Timestamp>(v); }

static MsgpkError unsupported(const Value& value, const char* wanted) {
    return MsgpkError(ErrorKind::UnsupportedType,
                      std::string("expected ") + wanted + ", found " + to_string(value.kind()));
}

const Value::Array& Value::as_array() const {
    if (!is_array()) throw unsupported(*this, "array");
    return std::get<Array>(v);
}

Value::Array& Value::as_array() {
    if (!is_array()) throw unsupported(*this, "array");
    return std::get<Array>(v);
}

const Value::Map& Value::as_map() const {
    if (!is_map()) throw unsupported(*this, "map");
    return std::get<Map>(v);
}

Value::Map& Value::as_map() {
    if (!is_map()) throw unsupported(*this, "map");
    return std::get<Map>(v);
}

std::size_t Value::count() const {
    switch (kind()) {
        case Kind::Array: return std::get<Array>(v).size();
        case Kind::Map: return std::get<Map>(v).size();
        case Kind::String: return std::get<std::string>(v).size();
        case Kind::Binary: return std::get<Bytes>(v).size();
        case Kind::Extended: return std::get<Extended>(v).data.size();
        default: throw unsupported(*this, "a sized value");
    }
}

const Value* Value::at(std::size_t index) const {
    const Array& a = as_array();
    return index < a.size() ? &a[index] : nullptr;
}

const Value* Value::find(const Value& key) const {
    const Map& m = as_map();
    auto it = m.find(key);
    return it == m.end() ? nullptr : &it->second;
}

const Value* Value::find(const std::string& key) const {
    return find(make_string(key));
}

bool Value::bool_value() const {
    if (!is_bool()) throw unsupported(*this, "bool");
    return std::get<bool>(v);
}

template <typename T>
static T exact_integer(const Value& value) {
    if (const auto* i = std::get_if<std::int64_t>(&value.v)) {
        if constexpr (std::is_signed_v<T>) {
            if (*i >= std::numeric_limits<T>::min() && *i <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*i);
            }
        } else {
            if (*i >= 0 && static_cast<std::uint64_t>(*i) <= std::numeric_limits<T>::max()) {
                return static_cast<T>(*i);
            }
        }
        throw MsgpkError(ErrorKind::InexactConversion,
                         std::to_string(*i) + " does not fit the requested integer type");
    }
    if (const auto* u = std::get_if<std::uint64_t>(&value.v)) {
        if (*u <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return static_cast<T>(*u);
        }
        throw MsgpkError(ErrorKind::InexactConversion,
                         std::to_string(*u) + " does not fit the requested integer type");
    }
    throw unsupported(value, "integer");
}

std::int8_t Value::int8_value() const { return exact_integer<std::int8_t>(*this); }
std::int16_t Value::int16_value() const { return exact_integer<std::int16_t>(*this); }
std::int32_t Value::int32_value() const { return exact_integer<std::int32_t>(*this); }
std::int64_t Value::int64_value() const { return exact_integer<std::int64_t>(*this); }
std::uint8_t Value::uint8_value() const { return exact_integer<std::uint8_t>(*this); }
std::uint16_t Value::uint16_value() const { return exact_integer<std::uint16_t>(*this); }
std::uint32_t Value::uint32_value() const { return exact_integer<std::uint32_t>(*this); }
std::uint64_t Value::uint64_value() const { return exact_integer<std::uint64_t>(*this); }

float Value::float_value() const {
    if (const auto* f = std::get_if<float>(&v)) return *f;
    if (const auto* d = std::get_if<double>(&v)) {
        const float f = static_cast<float>(*d);
        if (static_cast<double>(f) == *d || std::isnan(*d)) return f;
        throw MsgpkError(ErrorKind::InexactConversion, "float64 value is not representable as float32");
    }
    throw unsupported(*this, "floating point");
}

double Value::double_value() const {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* f = std::get_if<float>(&v)) return static_cast<double>(*f);
    throw unsupported(*this, "floating point");
}

std::string Value::string_value() const {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* b = std::get_if<Bytes>(&v)) {
        if (is_valid_utf8(b->data(), b->size())) return std::string(b->begin(), b->end());
        throw MsgpkError(ErrorKind::InvalidData, "binary value is not valid UTF-8");
    }
    throw unsupported(*this, "string");
}

Bytes Value::binary_value() const {
    if (const auto* b = std::get_if<Bytes>(&v)) return *b;
    if (const auto* e = std::get_if<Extended>(&v)) return e->data;
    throw unsupported(*this, "binary");
}

std::int8_t Value::extended_type() const {
    return extended_value().type;
}

const Extended& Value::extended_value() const {
    if (!is_extended()) throw unsupported(*this, "extended");
    return std::get<Extended>(v);
}

const Timestamp& Value::timestamp_value() const {
    if (!is_timestamp()) throw unsupported(*this, "timestamp");
    return std::get<Timestamp>(v);
}

// ------------------------------
// Equality / ordering
// ------------------------------

bool operator==(const Nil&, const Nil&) noexcept { return true; }

bool operator==(const Timestamp& a, const Timestamp& b) noexcept {
    return a.seconds == b.seconds && a.nanoseconds == b.nanoseconds;
}

bool operator==(const Extended& a, const Extended& b) noexcept {
    return a.type == b.type && a.data == b.data;
}

static int kind_rank(Kind k) {
    switch (k) {
        case Kind::Nil: return 0;
        case Kind::Bool: return 1;
        case Kind::Int:
        case Kind::UInt: return 2;
        case Kind::Float: return 3;
        case Kind::Double: return 4;
        case Kind::String: return 5;
        case Kind::Binary: return 6;
        case Kind::Array: return 7;
        case Kind::Map: return 8;
        case Kind::Extended: return 9;
        case Kind::Timestamp: return 10;
    }
    return 11;
}

template <typename T>
static int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

static int compare_integers(const Value& a, const Value& b) {
    const auto* ai = std::get_if<std::int64_t>(&a.v);
    const auto* bi = std::get_if<std::int64_t>(&b.v);
    if (ai && bi) return three_way(*ai, *bi);
    if (!ai && !bi) return three_way(std::get<std::uint64_t>(a.v), std::get<std::uint64_t>(b.v));
    if (ai) {
        if (*ai < 0) return -1;
        return three_way(static_cast<std::uint64_t>(*ai), std::get<std::uint64_t>(b.v));
    }
    if (*bi < 0) return 1;
    return three_way(std::get<std::uint64_t>(a.v), static_cast<std::uint64_t>(*bi));
}

// IEEE total order on the bit patterns.
static std::int64_t float_order_key(std::uint64_t bits, std::uint64_t sign_mask) {
    if (bits & sign_mask) return -static_cast<std::int64_t>(bits & (sign_mask - 1)) - 1;
    return static_cast<std::int64_t>(bits);
}

static int compare_values(const Value& a, const Value& b);

template <typename Seq>
static int compare_sequences(const Seq& a, const Seq& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
        int c = 0;
        if constexpr (std::is_same_v<typename Seq::value_type, Value>) {
            c = compare_values(*ia, *ib);
        } else {
            c = compare_values(ia->first, ib->first);
            if (c == 0) c = compare_values(ia->second, ib->second);
        }
        if (c != 0) return c;
    }
    if (ia == a.end() && ib == b.end()) return 0;
    return ia == a.end() ? -1 : 1;
}

static int compare_values(const Value& a, const Value& b) {
    const int ra = kind_rank(a.kind());
    const int rb = kind_rank(b.kind());
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (a.kind()) {
        case Kind::Nil: return 0;
        case Kind::Bool: return three_way(std::get<bool>(a.v), std::get<bool>(b.v));
        case Kind::Int:
        case Kind::UInt: return compare_integers(a, b);
        case Kind::Float:
            return three_way(float_order_key(float_bits(std::get<float>(a.v)), 0x80000000ull),
                             float_order_key(float_bits(std::get<float>(b.v)), 0x80000000ull));
        case Kind::Double:
            return three_way(float_order_key(double_bits(std::get<double>(a.v)), 0x8000000000000000ull),
                             float_order_key(double_bits(std::get<double>(b.v)), 0x8000000000000000ull));
        case Kind::String: return three_way(std::get<std::string>(a.v), std::get<std::string>(b.v));
        case Kind::Binary: return three_way(std::get<Bytes>(a.v), std::get<Bytes>(b.v));
        case Kind::Array: return compare_sequences(std::get<Value::Array>(a.v), std::get<Value::Array>(b.v));
        case Kind::Map: return compare_sequences(std::get<Value::Map>(a.v), std::get<Value::Map>(b.v));
        case Kind::Extended: {
            const auto& ea = std::get<Extended>(a.v);
            const auto& eb = std::get<Extended>(b.v);
            if (ea.type != eb.type) return ea.type < eb.type ? -1 : 1;
            return three_way(ea.data, eb.data);
        }
        case Kind::Timestamp: {
            const auto& ta = std::get<Timestamp>(a.v);
            const auto& tb = std::get<Timestamp>(b.v);
            if (ta.seconds != tb.seconds) return ta.seconds < tb.seconds ? -1 : 1;
            return three_way(ta.nanoseconds, tb.nanoseconds);
        }
    }
    return 0;
}

bool operator==(const Value& a, const Value& b) {
    if (a.is_integer() && b.is_integer()) return compare_integers(a, b) == 0;
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case Kind::Array: {
            const auto& xa = std::get<Value::Array>(a.v);
            const auto& xb = std::get<Value::Array>(b.v);
            return xa.size() == xb.size() && std::equal(xa.begin(), xa.end(), xb.begin());
        }
        case Kind::Map: {
            const auto& ma = std::get<Value::Map>(a.v);
            const auto& mb = std::get<Value::Map>(b.v);
            if (ma.size() != mb.size()) return false;
            for (const auto& kv : ma) {
                auto it = mb.find(kv.first);
                if (it == mb.end() || !(it->second == kv.second)) return false;
            }
            return true;
        }
        default: return compare_values(a, b) == 0;
    }
}

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

bool operator<(const Value& a, const Value& b) { return compare_values(a, b) < 0; }

// ------------------------------
// ByteCursor
// ------------------------------

ByteCursor::ByteCursor() : buffer_(std::make_shared<const Bytes>()) {}

ByteCursor::ByteCursor(Bytes data)
    : buffer_(std::make_shared<const Bytes>(std::move(data))), start_(0), end_(buffer_->size()) {}

ByteCursor::ByteCursor(std::shared_ptr<const Bytes> buffer)
    : buffer_(buffer ? std::move(buffer) : std::make_shared<const Bytes>()), start_(0), end_(buffer_->size()) {}

ByteCursor ByteCursor::slice(std::shared_ptr<const Bytes> buffer, std::size_t start, std::size_t end) {
    ByteCursor out(std::move(buffer));
    if (start > end || end > out.end_) {
        throw std::out_of_range("ByteCursor::slice: [" + std::to_string(start) + ", " + std::to_string(end) +
                                ") exceeds buffer of " + std::to_string(out.end_) + " bytes");
    }
    out.start_ = start;
    out.end_ = end;
    return out;
}

const std::uint8_t* ByteCursor::data() const noexcept {
    return buffer_->data() + start_;
}

ByteCursor ByteCursor::subrange(std::size_t begin, std::size_t end) const {
    if (begin > end || end > size()) {
        throw std::out_of_range("ByteCursor::subrange: [" + std::to_string(begin) + ", " + std::to_string(end) +
                                ") exceeds cursor of " + std::to_string(size()) + " bytes");
    }
    ByteCursor out(*this);
    out.start_ = start_ + begin;
    out.end_ = start_ + end;
    return out;
}

ByteCursor ByteCursor::drop_front(std::size_t n) const {
    return subrange(n, size());
}

Bytes ByteCursor::to_bytes() const {
    return Bytes(data(), data() + size());
}

std::string ByteCursor::to_string() const {
    return std::string(reinterpret_cast<const char*>(data()), size());
}

// ------------------------------
// Timestamp codec
// ------------------------------

Timestamp Timestamp::from_time_point(std::chrono::system_clock::time_point tp) {
    const auto since = tp.time_since_epoch();
    const auto secs = std::chrono::floor<std::chrono::seconds>(since);
    Timestamp ts;
    ts.seconds = secs.count();
    ts.nanoseconds = static_cast<std::uint32_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since - secs).count());
    return ts;
}

std::chrono::system_clock::time_point Timestamp::to_time_point() const {
    using clock_duration = std::chrono::system_clock::duration;
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(clock_duration::max()).count() - 1;
    if (seconds > limit || seconds < -limit) {
        throw MsgpkError(ErrorKind::InvalidArgument,
                         "timestamp " + std::to_string(seconds) + "s is outside the system clock range");
    }
    return std::chrono::system_clock::time_point{} +
           std::chrono::duration_cast<clock_duration>(std::chrono::seconds(seconds)) +
           std::chrono::duration_cast<clock_duration>(std::chrono::nanoseconds(nanoseconds));
}

Bytes timestamp_to_payload(const Timestamp& ts) {
    if (ts.nanoseconds > 999999999u) {
        throw MsgpkError(ErrorKind::InvalidArgument,
                         "timestamp nanoseconds out of range: " + std::to_string(ts.nanoseconds));
    }
    Bytes out;
    if (ts.seconds >= 0 && (static_cast<std::uint64_t>(ts.seconds) >> 34) == 0) {
        const auto secs = static_cast<std::uint64_t>(ts.seconds);
        if (ts.nanoseconds == 0 && (secs >> 32) == 0) {
            // timestamp 32
            append_u32_be(out, static_cast<std::uint32_t>(secs));
        } else {
            // timestamp 64: nsec in the upper 30 bits, sec in the lower 34
            append_u64_be(out, (static_cast<std::uint64_t>(ts.nanoseconds) << 34) | secs);
        }
    } else {
        // timestamp 96
        append_u32_be(out, ts.nanoseconds);
        append_u64_be(out, static_cast<std::uint64_t>(ts.seconds));
    }
    return out;
}

Timestamp timestamp_from_payload(const std::uint8_t* data, std::size_t size) {
    Timestamp ts;
    switch (size) {
        case 4:
            ts.seconds = static_cast<std::int64_t>(read_be_from(data, 4));
            break;
        case 8: {
            const std::uint64_t word = read_be_from(data, 8);
            ts.nanoseconds = static_cast<std::uint32_t>(word >> 34);
            ts.seconds = static_cast<std::int64_t>(word & 0x3FFFFFFFFull);
            break;
        }
        case 12:
            ts.nanoseconds = static_cast<std::uint32_t>(read_be_from(data, 4));
            ts.seconds = static_cast<std::int64_t>(read_be_from(data + 4, 8));
            break;
        default:
            throw MsgpkError(ErrorKind::InvalidData,
                             "timestamp payload must be 4, 8 or 12 bytes, got " + std::to_string(size));
    }
    if (ts.nanoseconds > 999999999u) {
        throw MsgpkError(ErrorKind::InvalidData,
                         "timestamp nanoseconds out of range: " + std::to_string(ts.nanoseconds));
    }
    return ts;
}

Timestamp timestamp_from_payload(const Bytes& payload) {
    return timestamp_from_payload(payload.data(), payload.size());
}

// ------------------------------
// Pack
// ------------------------------

static std::uint32_t checked_length(std::size_t n, const char* what) {
    if (n > 0xFFFFFFFFull) {
        throw MsgpkError(ErrorKind::InvalidArgument, std::string(what) + " length exceeds 2^32-1");
    }
    return static_cast<std::uint32_t>(n);
}

static void pack_uint(Bytes& out, std::uint64_t v) {
    if (v <= 0x7F) {
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v <= 0xFF) {
        out.push_back(0xCC);
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v <= 0xFFFF) {
        out.push_back(0xCD);
        append_u16_be(out, static_cast<std::uint16_t>(v));
    } else if (v <= 0xFFFFFFFFull) {
        out.push_back(0xCE);
        append_u32_be(out, static_cast<std::uint32_t>(v));
    } else {
        out.push_back(0xCF);
        append_u64_be(out, v);
    }
}

static void pack_int(Bytes& out, std::int64_t v) {
    if (v >= 0) {
        pack_uint(out, static_cast<std::uint64_t>(v));
    } else if (v >= -0x20) {
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v >= -0x80) {
        out.push_back(0xD0);
        out.push_back(static_cast<std::uint8_t>(v));
    } else if (v >= -0x8000) {
        out.push_back(0xD1);
        append_u16_be(out, static_cast<std::uint16_t>(v));
    } else if (v >= -0x80000000ll) {
        out.push_back(0xD2);
        append_u32_be(out, static_cast<std::uint32_t>(v));
    } else {
        out.push_back(0xD3);
        append_u64_be(out, static_cast<std::uint64_t>(v));
    }
}

static void pack_str_header(Bytes& out, std::uint32_t n) {
    if (n <= 0x1F) {
        out.push_back(static_cast<std::uint8_t>(0xA0 | n));
    } else if (n <= 0xFF) {
        out.push_back(0xD9);
        out.push_back(static_cast<std::uint8_t>(n));
    } else if (n <= 0xFFFF) {
        out.push_back(0xDA);
        append_u16_be(out, static_cast<std::uint16_t>(n));
    } else {
        out.push_back(0xDB);
        append_u32_be(out, n);
    }
}

static void pack_bin_header(Bytes& out, std::uint32_t n) {
    if (n <= 0xFF) {
        out.push_back(0xC4);
        out.push_back(static_cast<std::uint8_t>(n));
    } else if (n <= 0xFFFF) {
        out.push_back(0xC5);
        append_u16_be(out, static_cast<std::uint16_t>(n));
    } else {
        out.push_back(0xC6);
        append_u32_be(out, n);
    }
}

static void pack_container_header(Bytes& out, std::uint32_t n, std::uint8_t fix, std::uint8_t tag16) {
    if (n <= 0x0F) {
        out.push_back(static_cast<std::uint8_t>(fix | n));
    } else if (n <= 0xFFFF) {
        out.push_back(tag16);
        append_u16_be(out, static_cast<std::uint16_t>(n));
    } else {
        out.push_back(static_cast<std::uint8_t>(tag16 + 1));
        append_u32_be(out, n);
    }
}

static void pack_ext(Bytes& out, std::int8_t type, const Bytes& data) {
    const std::uint32_t n = checked_length(data.size(), "extension");
    switch (n) {
        case 1: out.push_back(0xD4); break;
        case 2: out.push_back(0xD5); break;
        case 4: out.push_back(0xD6); break;
        case 8: out.push_back(0xD7); break;
        case 16: out.push_back(0xD8); break;
        default:
            if (n <= 0xFF) {
                out.push_back(0xC7);
                out.push_back(static_cast<std::uint8_t>(n));
            } else if (n <= 0xFFFF) {
                out.push_back(0xC8);
                append_u16_be(out, static_cast<std::uint16_t>(n));
            } else {
                out.push_back(0xC9);
                append_u32_be(out, n);
            }
    }
    out.push_back(static_cast<std::uint8_t>(type));
    out.insert(out.end(), data.begin(), data.end());
}

static void pack_value(Bytes& out, const Value& value, const PackOptions& opts, std::size_t depth);

static void enter_container(std::size_t depth, const PackOptions& opts) {
    if (depth >= opts.max_depth) {
        throw MsgpkError(ErrorKind::NestingTooDeep,
                         "nesting exceeds max_depth " + std::to_string(opts.max_depth));
    }
}

static void pack_value(Bytes& out, const Value& value, const PackOptions& opts, std::size_t depth) {
    switch (value.kind()) {
        case Kind::Nil:
            out.push_back(0xC0);
            break;
        case Kind::Bool:
            out.push_back(std::get<bool>(value.v) ? 0xC3 : 0xC2);
            break;
        case Kind::Int:
            pack_int(out, std::get<std::int64_t>(value.v));
            break;
        case Kind::UInt:
            pack_uint(out, std::get<std::uint64_t>(value.v));
            break;
        case Kind::Float:
            out.push_back(0xCA);
            append_u32_be(out, float_bits(std::get<float>(value.v)));
            break;
        case Kind::Double:
            out.push_back(0xCB);
            append_u64_be(out, double_bits(std::get<double>(value.v)));
            break;
        case Kind::String: {
            const auto& s = std::get<std::string>(value.v);
            pack_str_header(out, checked_length(s.size(), "string"));
            out.insert(out.end(), s.begin(), s.end());
            break;
        }
        case Kind::Binary: {
            const auto& b = std::get<Bytes>(value.v);
            const std::uint32_t n = checked_length(b.size(), "binary");
            if (opts.format == PackFormat::Latest) {
                pack_bin_header(out, n);
            } else {
                pack_str_header(out, n);
            }
            out.insert(out.end(), b.begin(), b.end());
            break;
        }
        case Kind::Array: {
            enter_container(depth, opts);
            const auto& a = std::get<Value::Array>(value.v);
            pack_container_header(out, checked_length(a.size(), "array"), 0x90, 0xDC);
            for (const auto& elem : a) {
                pack_value(out, elem, opts, depth + 1);
            }
            break;
        }
        case Kind::Map: {
            enter_container(depth, opts);
            const auto& m = std::get<Value::Map>(value.v);
            pack_container_header(out, checked_length(m.size(), "map"), 0x80, 0xDE);
            for (const auto& kv : m) {
                pack_value(out, kv.first, opts, depth + 1);
                pack_value(out, kv.second, opts, depth + 1);
            }
            break;
        }
        case Kind::Extended: {
            const auto& e = std::get<Extended>(value.v);
            if (e.type == kTimestampType) {
                throw MsgpkError(ErrorKind::InvalidArgument,
                                 "extension type -1 is reserved for timestamps; use Value::make_timestamp");
            }
            pack_ext(out, e.type, e.data);
            break;
        }
        case Kind::Timestamp:
            pack_ext(out, kTimestampType, timestamp_to_payload(std::get<Timestamp>(value.v)));
            break;
    }
}

void pack_into(Bytes& out, const Value& value, const PackOptions& opts) {
    pack_value(out, value, opts, 0);
}

Bytes pack(const Value& value, const PackOptions& opts) {
    Bytes out;
    pack_value(out, value, opts, 0);
    return out;
}

Bytes pack(const Value& value, PackFormat format) {
    PackOptions opts;
    opts.format = format;
    return pack(value, opts);
}

// ------------------------------
// Unpack
// ------------------------------

namespace internal {

class Parser {
public:
    Parser(const ByteCursor& data, const UnpackOptions& opts) : data_(data), opts_(opts) {}

    Value parse(std::size_t depth) {
        const std::uint8_t tag = get();

        if (tag <= 0x7F) return Value::make_uint(tag);
        if (tag <= 0x8F) return parse_map(tag - 0x80u, depth);
        if (tag <= 0x9F) return parse_array(tag - 0x90u, depth);
        if (tag <= 0xBF) return parse_str(tag - 0xA0u);
        if (tag >= 0xE0) return Value::make_int(static_cast<std::int8_t>(tag));

        switch (tag) {
            case 0xC0: return Value::make_nil();
            case 0xC2: return Value::make_bool(false);
            case 0xC3: return Value::make_bool(true);

            case 0xC4: return parse_bin(take_be(1));
            case 0xC5: return parse_bin(take_be(2));
            case 0xC6: return parse_bin(take_be(4));

            case 0xC7: return parse_ext(take_be(1));
            case 0xC8: return parse_ext(take_be(2));
            case 0xC9: return parse_ext(take_be(4));

            case 0xCA: return Value::make_float(float_from_bits(static_cast<std::uint32_t>(take_be(4))));
            case 0xCB: return Value::make_double(double_from_bits(take_be(8)));

            case 0xCC: return Value::make_uint(take_be(1));
            case 0xCD: return Value::make_uint(take_be(2));
            case 0xCE: return Value::make_uint(take_be(4));
            case 0xCF: return Value::make_uint(take_be(8));

            case 0xD0: return Value::make_int(static_cast<std::int8_t>(take_be(1)));
            case 0xD1: return Value::make_int(static_cast<std::int16_t>(take_be(2)));
            case 0xD2: return Value::make_int(static_cast<std::int32_t>(take_be(4)));
            case 0xD3: return Value::make_int(static_cast<std::int64_t>(take_be(8)));

            case 0xD4: return parse_ext(1);
            case 0xD5: return parse_ext(2);
            case 0xD6: return parse_ext(4);
            case 0xD7: return parse_ext(8);
            case 0xD8: return parse_ext(16);

            case 0xD9: return parse_str(take_be(1));
            case 0xDA: return parse_str(take_be(2));
            case 0xDB: return parse_str(take_be(4));

            case 0xDC: return parse_array(take_be(2), depth);
            case 0xDD: return parse_array(take_be(4), depth);

            case 0xDE: return parse_map(take_be(2), depth);
            case 0xDF: return parse_map(take_be(4), depth);

            default:
                throw MsgpkError(ErrorKind::InvalidData, "reserved tag 0xc1 at offset " + std::to_string(pos_ - 1));
        }
    }

    std::size_t position() const noexcept { return pos_; }

private:
    const ByteCursor& data_;
    const UnpackOptions& opts_;
    std::size_t pos_{0};

    std::size_t remaining() const noexcept { return data_.size() - pos_; }

    std::uint8_t get() {
        if (pos_ >= data_.size()) {
            throw MsgpkError(ErrorKind::InsufficientData, "unexpected end of input");
        }
        return data_[pos_++];
    }

    const std::uint8_t* take(std::uint64_t n) {
        if (n > remaining()) {
            throw MsgpkError(ErrorKind::InsufficientData,
                             "need " + std::to_string(n) + " bytes at offset " + std::to_string(pos_) +
                             ", have " + std::to_string(remaining()));
        }
        const std::uint8_t* p = data_.data() + pos_;
        pos_ += static_cast<std::size_t>(n);
        return p;
    }

    std::uint64_t take_be(std::size_t n) {
        return read_be_from(take(n), n);
    }

    void enter(std::size_t depth) const {
        if (depth >= opts_.max_depth) {
            throw MsgpkError(ErrorKind::NestingTooDeep,
                             "nesting exceeds max_depth " + std::to_string(opts_.max_depth));
        }
    }

    Value parse_str(std::uint64_t n) {
        const std::uint8_t* p = take(n);
        if (opts_.compatibility) {
            return Value::make_binary(Bytes(p, p + n));
        }
        if (!is_valid_utf8(p, static_cast<std::size_t>(n))) {
            throw MsgpkError(ErrorKind::InvalidData, "string is not valid UTF-8");
        }
        return Value::make_string(std::string(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n)));
    }

    Value parse_bin(std::uint64_t n) {
        const std::uint8_t* p = take(n);
        return Value::make_binary(Bytes(p, p + n));
    }

    Value parse_ext(std::uint64_t n) {
        const auto type = static_cast<std::int8_t>(get());
        const std::uint8_t* p = take(n);
        if (type == kTimestampType) {
            Value out;
            out.v.emplace<Timestamp>(timestamp_from_payload(p, static_cast<std::size_t>(n)));
            return out;
        }
        return Value::make_extended(type, Bytes(p, p + n));
    }

    Value parse_array(std::uint64_t count, std::size_t depth) {
        enter(depth);
        Value::Array a;
        // every element occupies at least one byte
        a.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(count, remaining())));
        for (std::uint64_t i = 0; i < count; ++i) {
            a.push_back(parse(depth + 1));
        }
        return Value::make_array(std::move(a));
    }

    Value parse_map(std::uint64_t count, std::size_t depth) {
        enter(depth);
        Value::Map m;
        for (std::uint64_t i = 0; i < count; ++i) {
            Value key = parse(depth + 1);
            Value val = parse(depth + 1);
            m.insert_or_assign(std::move(key), std::move(val));
        }
        return Value::make_map(std::move(m));
    }
};

} // namespace internal

Unpacked<Value> unpack(const ByteCursor& data, const UnpackOptions& opts) {
    internal::Parser parser(data, opts);
    Value value = parser.parse(0);
    return Unpacked<Value>{std::move(value), data.drop_front(parser.position())};
}

Unpacked<Value> unpack(Bytes data, const UnpackOptions& opts) {
    return unpack(ByteCursor(std::move(data)), opts);
}

Value unpack_first(const ByteCursor& data, const UnpackOptions& opts) {
    internal::Parser parser(data, opts);
    return parser.parse(0);
}

Value unpack_first(const Bytes& data, const UnpackOptions& opts) {
    return unpack_first(borrowed_cursor(data), opts);
}

std::vector<Value> unpack_all(const ByteCursor& data, const UnpackOptions& opts) {
    std::vector<Value> out;
    ByteCursor rest = data;
    while (!rest.empty()) {
        auto step = unpack(rest, opts);
        out.push_back(std::move(step.value));
        rest = step.remainder;
    }
    return out;
}

std::vector<Value> unpack_all(const Bytes& data, const UnpackOptions& opts) {
    return unpack_all(borrowed_cursor(data), opts);
}

Unpacked<std::uint64_t> unpack_integer(const ByteCursor& data, std::size_t count) {
    if (count == 0) {
        throw MsgpkError(ErrorKind::InvalidArgument, "integer byte count must be positive");
    }
    if (count > 8) {
        throw MsgpkError(ErrorKind::InvalidArgument, "integer byte count exceeds 8");
    }
    if (data.size() < count) {
        throw MsgpkError(ErrorKind::InsufficientData,
                         "need " + std::to_string(count) + " bytes, have " + std::to_string(data.size()));
    }
    return Unpacked<std::uint64_t>{read_be_from(data.data(), count), data.drop_front(count)};
}

Unpacked<std::string> unpack_string(const ByteCursor& data, std::size_t count) {
    if (count == 0) {
        return Unpacked<std::string>{std::string(), data};
    }
    if (data.size() < count) {
        throw MsgpkError(ErrorKind::InsufficientData,
                         "need " + std::to_string(count) + " bytes, have " + std::to_string(data.size()));
    }
    if (!is_valid_utf8(data.data(), count)) {
        throw MsgpkError(ErrorKind::InvalidData, "string is not valid UTF-8");
    }
    return Unpacked<std::string>{data.subrange(0, count).to_string(), data.drop_front(count)};
}

Unpacked<Bytes> unpack_binary(const ByteCursor& data, std::size_t count) {
    if (data.size() < count) {
        throw MsgpkError(ErrorKind::InsufficientData,
                         "need " + std::to_string(count) + " bytes, have " + std::to_string(data.size()));
    }
    return Unpacked<Bytes>{data.subrange(0, count).to_bytes(), data.drop_front(count)};
}

} // namespace msgpk
