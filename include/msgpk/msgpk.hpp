#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace msgpk {

using Bytes = std::vector<std::uint8_t>;

// Extension type reserved for timestamps.
inline constexpr std::int8_t kTimestampType = -1;

// Nesting limit applied by pack/unpack unless the caller overrides it.
inline constexpr std::size_t kDefaultMaxDepth = 512;

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    InsufficientData,
    InvalidData,
    InvalidArgument,
    InexactConversion,
    UnsupportedType,
    KeyNotFound,
    ValueNotFound,
    TypeMismatch,
    NestingTooDeep,
    Io,
    ZlibError,
};

std::string to_string(ErrorKind k);

// One segment of a coding path: a field name, or an element index.
struct CodingKey {
    std::string name{};
    std::optional<std::size_t> index{};

    static CodingKey named(std::string name);
    static CodingKey indexed(std::size_t i); // name is "Index <i>"
    static CodingKey super_key();            // name is "super"
};

using CodingPath = std::vector<CodingKey>;

// Renders a path like "items[2].name"; empty paths render as "<root>".
std::string format_coding_path(const CodingPath& path);

class MsgpkError : public std::runtime_error {
public:
    MsgpkError(ErrorKind k, const std::string& msg);
    MsgpkError(ErrorKind k, const std::string& msg, CodingPath path);
    ErrorKind kind() const noexcept;
    const CodingPath& coding_path() const noexcept;

private:
    ErrorKind kind_;
    CodingPath path_;
};

// ------------------------------
// Public data model
// ------------------------------

struct Nil {};

struct Timestamp {
    std::int64_t seconds{0};
    std::uint32_t nanoseconds{0}; // 0..999'999'999

    static Timestamp from_time_point(std::chrono::system_clock::time_point tp);
    std::chrono::system_clock::time_point to_time_point() const;
};

struct Extended {
    std::int8_t type{0};
    Bytes data{};
};

enum class Kind {
    Nil,
    Bool,
    Int,
    UInt,
    Float,
    Double,
    String,
    Binary,
    Array,
    Map,
    Extended,
    Timestamp,
};

std::string to_string(Kind k);

struct Value {
    using Array = std::vector<Value>;
    using Map = std::map<Value, Value>;

    // Alternative order matches Kind.
    std::variant<
        Nil,
        bool,
        std::int64_t,
        std::uint64_t,
        float,
        double,
        std::string,
        Bytes,
        Array,
        Map,
        Extended,
        Timestamp
    > v;

    // Convenience constructors
    static Value make_nil();
    static Value make_bool(bool b);
    static Value make_int(std::int64_t i);
    static Value make_uint(std::uint64_t u);
    static Value make_float(float f);
    static Value make_double(double d);
    static Value make_string(std::string s);
    static Value make_binary(Bytes b);
    static Value make_array(Array a);
    static Value make_map(Map m);
    static Value make_extended(std::int8_t type, Bytes data);
    static Value make_timestamp(std::int64_t seconds, std::uint32_t nanoseconds = 0);
    static Value make_timestamp(const Timestamp& ts);

    Kind kind() const noexcept;

    bool is_nil() const noexcept;
    bool is_bool() const noexcept;
    bool is_integer() const noexcept; // int or uint
    bool is_floating() const noexcept; // float32 or float64
    bool is_string() const noexcept;
    bool is_binary() const noexcept;
    bool is_array() const noexcept;
    bool is_map() const noexcept;
    bool is_extended() const noexcept;
    bool is_timestamp() const noexcept;

    const Array& as_array() const;
    Array& as_array();
    const Map& as_map() const;
    Map& as_map();

    /// Element count of arrays and maps, byte length of strings, binaries and extension payloads.
    std::size_t count() const;

    /// Array element at `index`, or nullptr past the end.
    const Value* at(std::size_t index) const;

    /// Map lookup; nullptr when the key is absent.
    const Value* find(const Value& key) const;
    const Value* find(const std::string& key) const;

    // Conversion accessors. Integer and floating accessors succeed only when the
    // stored number is representable exactly in the requested type.
    bool bool_value() const;
    std::int8_t int8_value() const;
    std::int16_t int16_value() const;
    std::int32_t int32_value() const;
    std::int64_t int64_value() const;
    std::uint8_t uint8_value() const;
    std::uint16_t uint16_value() const;
    std::uint32_t uint32_value() const;
    std::uint64_t uint64_value() const;
    float float_value() const;
    double double_value() const;
    std::string string_value() const; // string, or binary holding valid UTF-8
    Bytes binary_value() const;       // binary, or an extension payload
    std::int8_t extended_type() const;
    const Extended& extended_value() const;
    const Timestamp& timestamp_value() const;
};

bool operator==(const Nil&, const Nil&) noexcept;
bool operator==(const Timestamp& a, const Timestamp& b) noexcept;
bool operator==(const Extended& a, const Extended& b) noexcept;

// int(n) and uint(n) compare equal for n >= 0. Floats compare by bit pattern,
// so -0.0 != 0.0 and NaN equals an identical NaN.
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

// Strict total order used to key Value::Map.
bool operator<(const Value& a, const Value& b);

// ------------------------------
// Byte cursor
// ------------------------------

// Read-only window into a shared byte buffer. Slicing never copies.
class ByteCursor {
public:
    ByteCursor();
    explicit ByteCursor(Bytes data);
    explicit ByteCursor(std::shared_ptr<const Bytes> buffer);

    static ByteCursor slice(std::shared_ptr<const Bytes> buffer, std::size_t start, std::size_t end);

    std::size_t size() const noexcept { return end_ - start_; }
    bool empty() const noexcept { return start_ == end_; }
    std::uint8_t operator[](std::size_t i) const noexcept { return (*buffer_)[start_ + i]; }
    const std::uint8_t* data() const noexcept;

    // Offsets are relative to this cursor; out-of-bounds ranges throw std::out_of_range.
    ByteCursor subrange(std::size_t begin, std::size_t end) const;
    ByteCursor drop_front(std::size_t n) const;

    Bytes to_bytes() const;
    std::string to_string() const;

    const std::shared_ptr<const Bytes>& buffer() const noexcept { return buffer_; }
    std::size_t offset() const noexcept { return start_; }

private:
    std::shared_ptr<const Bytes> buffer_;
    std::size_t start_{0};
    std::size_t end_{0};
};

template <typename T>
struct Unpacked {
    T value;
    ByteCursor remainder;
};

// ------------------------------
// Options
// ------------------------------

enum class PackFormat {
    Latest, // binary uses bin8/16/32
    Legacy, // binary uses the str tag space (fixstr/str8/16/32)
};

struct PackOptions {
    PackFormat format{PackFormat::Latest};
    std::size_t max_depth{kDefaultMaxDepth};
};

struct UnpackOptions {
    bool compatibility{false}; // decode str tags as binary
    std::size_t max_depth{kDefaultMaxDepth};
};

struct ReadOptions {
    UnpackOptions unpack{};
    bool zlib{false}; // file holds a zlib stream
};

struct WriteOptions {
    PackOptions pack{};
    bool zlib{false};
    int zlib_level{6}; // 0..9
};

// ------------------------------
// API
// ------------------------------

/// Pack a value, choosing the most compact encoding for every element.
Bytes pack(const Value& value, const PackOptions& opts = PackOptions{});
Bytes pack(const Value& value, PackFormat format);

/// Append the encoding of `value` to `out`.
void pack_into(Bytes& out, const Value& value, const PackOptions& opts = PackOptions{});

/// Decode one value and return it with the unconsumed remainder.
Unpacked<Value> unpack(const ByteCursor& data, const UnpackOptions& opts = UnpackOptions{});
Unpacked<Value> unpack(Bytes data, const UnpackOptions& opts = UnpackOptions{});

/// Decode the first value, ignoring trailing bytes.
Value unpack_first(const ByteCursor& data, const UnpackOptions& opts = UnpackOptions{});
Value unpack_first(const Bytes& data, const UnpackOptions& opts = UnpackOptions{});

/// Decode values until the input is exhausted.
std::vector<Value> unpack_all(const ByteCursor& data, const UnpackOptions& opts = UnpackOptions{});
std::vector<Value> unpack_all(const Bytes& data, const UnpackOptions& opts = UnpackOptions{});

// Building blocks for framed data. `count` must be positive for unpack_integer.
Unpacked<std::uint64_t> unpack_integer(const ByteCursor& data, std::size_t count);
Unpacked<std::string> unpack_string(const ByteCursor& data, std::size_t count);
Unpacked<Bytes> unpack_binary(const ByteCursor& data, std::size_t count);

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

/// Timestamp extension payload (4, 8 or 12 bytes), smallest layout that fits.
Bytes timestamp_to_payload(const Timestamp& ts);
Timestamp timestamp_from_payload(const std::uint8_t* data, std::size_t size);
Timestamp timestamp_from_payload(const Bytes& payload);

/// Read a file of concatenated values.
std::vector<Value> read_file(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

/// Read a file's packed bytes (inflated when opts.zlib is set) without decoding.
Bytes read_file_bytes(
    const std::filesystem::path& file,
    const ReadOptions& opts = ReadOptions{}
);

/// Write values back to back, optionally deflated.
void write_file(
    const std::filesystem::path& file,
    const std::vector<Value>& values,
    const WriteOptions& opts = WriteOptions{}
);

// ------------------------------
// Utilities
// ------------------------------

std::uint32_t crc32(const Bytes& data);

} // namespace msgpk
