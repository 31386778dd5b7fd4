#pragma once

#include "msgpk/msgpk.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace msgpk {

// ------------------------------
// Options
// ------------------------------

enum class NumberDecodingStrategy {
    Strict,    // exact fit only; integer <-> floating is a type mismatch
    Automatic, // convert across integer and floating representations
};

struct EncoderOptions {
    PackFormat format{PackFormat::Latest};
};

struct DecoderOptions {
    NumberDecodingStrategy number_strategy{NumberDecodingStrategy::Strict};
    bool compatibility{false};
    std::size_t max_depth{kDefaultMaxDepth};
};

// ------------------------------
// Field helper
// ------------------------------

// Structured types may expose an ADL `fields(t)` returning a tuple of these;
// the bridge then encodes/decodes them as a keyed container.
template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

class Encoder;
class Decoder;
class KeyedEncodingContainer;
class UnkeyedEncodingContainer;
class SingleValueEncodingContainer;
class ReferencingEncoder;
class KeyedDecodingContainer;
class UnkeyedDecodingContainer;
class SingleValueDecodingContainer;

namespace detail {

// ------------------------------
// Boxes
// ------------------------------

class Box {
public:
    virtual ~Box() = default;
    virtual Value materialize() const = 0;
};

using BoxPtr = std::shared_ptr<Box>;

class ValueBox final : public Box {
public:
    explicit ValueBox(Value v) : value_(std::move(v)) {}
    Value materialize() const override { return value_; }

private:
    Value value_;
};

class ArrayBox final : public Box {
public:
    std::size_t size() const noexcept { return items_.size(); }
    void append(BoxPtr b);
    void insert(std::size_t index, BoxPtr b); // clamps to size()
    Value materialize() const override;

private:
    std::vector<BoxPtr> items_;
};

// Keyed box. Keeps first-insertion order; rewriting a key replaces in place.
class MapBox final : public Box {
public:
    std::size_t size() const noexcept { return entries_.size(); }
    void set(const std::string& key, BoxPtr b);
    Value materialize() const override;

private:
    std::vector<std::pair<std::string, BoxPtr>> entries_;
    std::map<std::string, std::size_t> index_;
};

// Swaps a coding path for the lifetime of the scope.
class PathScope {
public:
    PathScope(CodingPath& target, CodingPath next)
        : target_(target), saved_(std::exchange(target, std::move(next))) {}
    ~PathScope() { target_ = std::move(saved_); }
    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

private:
    CodingPath& target_;
    CodingPath saved_;
};

inline CodingPath appended(const CodingPath& path, CodingKey key) {
    CodingPath out = path;
    out.push_back(std::move(key));
    return out;
}

const Value& nil_value();

// ------------------------------
// Type classification
// ------------------------------

template <typename T>
struct dependent_false : std::false_type {};

template <typename T>
inline constexpr bool is_scalar_v =
    std::is_arithmetic_v<T> ||
    std::is_same_v<T, std::string> ||
    std::is_same_v<T, Bytes> ||
    std::is_same_v<T, Timestamp> ||
    std::is_same_v<T, Value>;

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_string_map : std::false_type {};
template <typename T, typename C, typename A>
struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};

template <typename T, typename = void>
struct has_encode_member : std::false_type {};
template <typename T>
struct has_encode_member<T, std::void_t<decltype(std::declval<const T&>().encode(std::declval<Encoder&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_decode_member : std::false_type {};
template <typename T>
struct has_decode_member<T, std::void_t<decltype(std::declval<T&>().decode(std::declval<Decoder&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_fields : std::false_type {};
template <typename T>
struct has_fields<T, std::void_t<decltype(fields(std::declval<T&>()))>> : std::true_type {};

template <typename T, typename = void>
struct has_const_fields : std::false_type {};
template <typename T>
struct has_const_fields<T, std::void_t<decltype(fields(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
const char* type_label() {
    if constexpr (std::is_same_v<T, bool>) return "bool";
    else if constexpr (std::is_integral_v<T>) return "integer";
    else if constexpr (std::is_floating_point_v<T>) return "floating point";
    else if constexpr (std::is_same_v<T, std::string>) return "string";
    else if constexpr (std::is_same_v<T, Bytes>) return "binary";
    else if constexpr (std::is_same_v<T, Timestamp>) return "timestamp";
    else if constexpr (is_vector<T>::value) return "array";
    else return "structured";
}

// ------------------------------
// Scalar conversions
// ------------------------------

template <typename T>
Value scalar_to_value(const T& v) {
    if constexpr (std::is_same_v<T, bool>) return Value::make_bool(v);
    else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) return Value::make_int(static_cast<std::int64_t>(v));
    else if constexpr (std::is_integral_v<T>) return Value::make_uint(static_cast<std::uint64_t>(v));
    else if constexpr (std::is_same_v<T, float>) return Value::make_float(v);
    else if constexpr (std::is_floating_point_v<T>) return Value::make_double(static_cast<double>(v));
    else if constexpr (std::is_same_v<T, std::string>) return Value::make_string(v);
    else if constexpr (std::is_same_v<T, Bytes>) return Value::make_binary(v);
    else if constexpr (std::is_same_v<T, Timestamp>) return Value::make_timestamp(v);
    else return v;
}

[[noreturn]] void throw_type_mismatch(const char* expected, const Value& found, const char* detail = nullptr);

template <typename T>
T integer_from_value(const Value& v, NumberDecodingStrategy strategy) {
    const auto* i = std::get_if<std::int64_t>(&v.v);
    const auto* u = std::get_if<std::uint64_t>(&v.v);

    if (strategy == NumberDecodingStrategy::Automatic) {
        if (i) return static_cast<T>(*i);
        if (u) return static_cast<T>(*u);
        if (v.is_floating()) {
            const auto* f = std::get_if<float>(&v.v);
            const double d = f ? static_cast<double>(*f) : std::get<double>(v.v);
            // [lower, upper) in the target type; both bounds are powers of two.
            const double lower = std::is_signed_v<T> ? -std::ldexp(1.0, std::numeric_limits<T>::digits) : 0.0;
            const double upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
            const double t = std::trunc(d);
            if (std::isfinite(d) && t >= lower && t < upper) return static_cast<T>(t);
            throw MsgpkError(ErrorKind::InexactConversion, "floating value is out of range for the integer type");
        }
        throw_type_mismatch("number", v);
    }

    if (i) {
        if constexpr (std::is_signed_v<T>) {
            if (*i >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
                *i <= static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                return static_cast<T>(*i);
            }
        } else {
            if (*i >= 0 && static_cast<std::uint64_t>(*i) <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return static_cast<T>(*i);
            }
        }
        throw MsgpkError(ErrorKind::InexactConversion, std::to_string(*i) + " does not fit the integer type");
    }
    if (u) {
        if (*u <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) return static_cast<T>(*u);
        throw MsgpkError(ErrorKind::InexactConversion, std::to_string(*u) + " does not fit the integer type");
    }
    throw_type_mismatch("integer", v, v.is_floating() ? "strict number decoding" : nullptr);
}

template <typename T>
T floating_from_value(const Value& v, NumberDecodingStrategy strategy) {
    if (v.is_floating()) {
        if (strategy == NumberDecodingStrategy::Strict && std::is_same_v<T, float>) {
            return static_cast<T>(v.float_value());
        }
        if (const auto* f = std::get_if<float>(&v.v)) return static_cast<T>(*f);
        return static_cast<T>(std::get<double>(v.v));
    }
    if (strategy == NumberDecodingStrategy::Automatic) {
        if (const auto* i = std::get_if<std::int64_t>(&v.v)) return static_cast<T>(*i);
        if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return static_cast<T>(*u);
        throw_type_mismatch("number", v);
    }
    throw_type_mismatch("floating point", v, v.is_integer() ? "strict number decoding" : nullptr);
}

template <typename T>
T scalar_from_value(const Value& v, NumberDecodingStrategy strategy) {
    if constexpr (std::is_same_v<T, Value>) {
        return v;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!v.is_bool()) throw_type_mismatch("bool", v);
        return v.bool_value();
    } else if constexpr (std::is_integral_v<T>) {
        return integer_from_value<T>(v, strategy);
    } else if constexpr (std::is_floating_point_v<T>) {
        return floating_from_value<T>(v, strategy);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto* b = std::get_if<Bytes>(&v.v)) {
            if (!is_valid_utf8(b->data(), b->size())) throw_type_mismatch("string", v, "binary is not valid UTF-8");
        } else if (!v.is_string()) {
            throw_type_mismatch("string", v);
        }
        return v.string_value();
    } else if constexpr (std::is_same_v<T, Bytes>) {
        if (!v.is_binary() && !v.is_extended()) throw_type_mismatch("binary", v);
        return v.binary_value();
    } else {
        if (!v.is_timestamp()) throw_type_mismatch("timestamp", v);
        return v.timestamp_value();
    }
}

template <typename T>
void encode_any(const T& value, Encoder& encoder);

template <typename T>
void decode_any(T& out, Decoder& decoder);

} // namespace detail

// ------------------------------
// Encoding
// ------------------------------

/// Builds a Value tree from structured values through a stack of containers.
class Encoder {
public:
    explicit Encoder(EncoderOptions options = EncoderOptions{}, CodingPath path = CodingPath{});
    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;
    virtual ~Encoder();

    const CodingPath& coding_path() const noexcept { return path_; }
    const EncoderOptions& options() const noexcept { return options_; }

    // Each scope picks one container kind. Asking again for the same kind
    // returns the same container; asking for a different kind throws.
    KeyedEncodingContainer keyed_container();
    UnkeyedEncodingContainer unkeyed_container();
    SingleValueEncodingContainer single_value_container();

    /// Encode `value` as the root of this encoder and return the finished tree.
    template <typename T>
    Value encode_root(const T& value);

protected:
    // Finished value of this encoder's scope; an empty map when nothing was encoded.
    detail::BoxPtr result_box() const;

private:
    friend class KeyedEncodingContainer;
    friend class UnkeyedEncodingContainer;
    friend class SingleValueEncodingContainer;

    EncoderOptions options_;
    CodingPath path_;
    std::vector<detail::BoxPtr> storage_;
    std::size_t frame_base_{0};

    bool can_encode_new_value() const noexcept { return storage_.size() == frame_base_; }
    [[noreturn]] void misuse(const std::string& msg) const;

    template <typename T>
    detail::BoxPtr box(const T& value);
};

class KeyedEncodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return path_; }

    void encode_nil(const std::string& key);

    template <typename T>
    void encode(const std::string& key, const T& value);

    // Omits the key entirely when `value` is empty.
    template <typename T>
    void encode_if_present(const std::string& key, const std::optional<T>& value);

    KeyedEncodingContainer nested_container(const std::string& key);
    UnkeyedEncodingContainer nested_unkeyed_container(const std::string& key);

    // Encoder for a base representation, stored under "super" (or `key`) on finalize.
    std::unique_ptr<ReferencingEncoder> super_encoder();
    std::unique_ptr<ReferencingEncoder> super_encoder(const std::string& key);

private:
    friend class Encoder;
    friend class UnkeyedEncodingContainer;

    KeyedEncodingContainer(Encoder& encoder, std::shared_ptr<detail::MapBox> box, CodingPath path);

    Encoder* encoder_;
    std::shared_ptr<detail::MapBox> box_;
    CodingPath path_;
};

class UnkeyedEncodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return path_; }
    std::size_t count() const noexcept { return box_->size(); }

    void encode_nil();

    template <typename T>
    void encode(const T& value);

    KeyedEncodingContainer nested_container();
    UnkeyedEncodingContainer nested_unkeyed_container();

    // Reserves the next index; the value is inserted there on finalize.
    std::unique_ptr<ReferencingEncoder> super_encoder();

private:
    friend class Encoder;
    friend class KeyedEncodingContainer;

    UnkeyedEncodingContainer(Encoder& encoder, std::shared_ptr<detail::ArrayBox> box, CodingPath path);

    Encoder* encoder_;
    std::shared_ptr<detail::ArrayBox> box_;
    CodingPath path_;
};

class SingleValueEncodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return encoder_->coding_path(); }

    void encode_nil();

    template <typename T>
    void encode(const T& value);

private:
    friend class Encoder;

    explicit SingleValueEncodingContainer(Encoder& encoder) : encoder_(&encoder) {}

    Encoder* encoder_;
};

// Encoder whose result is written into a slot reserved in a parent container.
// The write happens on finalize(), which the destructor calls if the owner has not.
class ReferencingEncoder final : public Encoder {
public:
    ReferencingEncoder(const EncoderOptions& options, CodingPath path,
                       std::shared_ptr<detail::MapBox> target, std::string key);
    ReferencingEncoder(const EncoderOptions& options, CodingPath path,
                       std::shared_ptr<detail::ArrayBox> target, std::size_t index);
    ~ReferencingEncoder() override;

    void finalize();
    bool finalized() const noexcept { return finalized_; }

private:
    std::shared_ptr<detail::MapBox> map_target_;
    std::string key_;
    std::shared_ptr<detail::ArrayBox> array_target_;
    std::size_t index_{0};
    bool finalized_{false};
};

// ------------------------------
// Decoding
// ------------------------------

/// Reads structured values out of a Value tree. The tree must outlive the decoder.
class Decoder {
public:
    explicit Decoder(const Value& root, DecoderOptions options = DecoderOptions{}, CodingPath path = CodingPath{});

    const CodingPath& coding_path() const noexcept { return path_; }
    const DecoderOptions& options() const noexcept { return options_; }

    KeyedDecodingContainer keyed_container();
    UnkeyedDecodingContainer unkeyed_container();
    SingleValueDecodingContainer single_value_container();

    /// Decode `value` as a T at the current coding path.
    template <typename T>
    T unbox(const Value& value);

private:
    friend class KeyedDecodingContainer;
    friend class UnkeyedDecodingContainer;
    friend class SingleValueDecodingContainer;

    DecoderOptions options_;
    CodingPath path_;
    std::vector<const Value*> storage_;

    const Value& top() const { return *storage_.back(); }

    KeyedDecodingContainer keyed_container_for(const Value& value, const CodingPath& path);
    UnkeyedDecodingContainer unkeyed_container_for(const Value& value, const CodingPath& path);
};

class KeyedDecodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return path_; }

    std::vector<std::string> all_keys() const;
    bool contains(const std::string& key) const;

    /// True when the key holds nil. Throws KeyNotFound for absent keys.
    bool decode_nil(const std::string& key) const;

    template <typename T>
    T decode(const std::string& key) const;

    // Absent keys and nil values both yield nullopt.
    template <typename T>
    std::optional<T> decode_if_present(const std::string& key) const;

    KeyedDecodingContainer nested_container(const std::string& key) const;
    UnkeyedDecodingContainer nested_unkeyed_container(const std::string& key) const;

    // Decoder over the "super" (or `key`) entry; nil when the entry is absent.
    Decoder super_decoder() const;
    Decoder super_decoder(const std::string& key) const;

private:
    friend class Decoder;

    KeyedDecodingContainer(Decoder& decoder, std::map<std::string, const Value*> entries, CodingPath path);

    const Value& entry(const std::string& key) const;

    Decoder* decoder_;
    std::map<std::string, const Value*> entries_;
    CodingPath path_;
};

class UnkeyedDecodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return path_; }
    std::size_t count() const noexcept { return array_->size(); }
    bool is_at_end() const noexcept { return index_ >= array_->size(); }
    std::size_t current_index() const noexcept { return index_; }

    /// Consumes the current element only when it is nil.
    bool decode_nil();

    template <typename T>
    T decode();

    template <typename T>
    std::optional<T> decode_if_present();

    KeyedDecodingContainer nested_container();
    UnkeyedDecodingContainer nested_unkeyed_container();
    Decoder super_decoder();

private:
    friend class Decoder;

    UnkeyedDecodingContainer(Decoder& decoder, const Value::Array& array, CodingPath path);

    const Value& current(const char* what) const;

    Decoder* decoder_;
    const Value::Array* array_;
    CodingPath path_;
    std::size_t index_{0};
};

class SingleValueDecodingContainer {
public:
    const CodingPath& coding_path() const noexcept { return decoder_->coding_path(); }

    bool decode_nil() const { return decoder_->top().is_nil(); }

    template <typename T>
    T decode() const {
        return decoder_->unbox<T>(decoder_->top());
    }

private:
    friend class Decoder;

    explicit SingleValueDecodingContainer(Decoder& decoder) : decoder_(&decoder) {}

    Decoder* decoder_;
};

// ------------------------------
// Entry points
// ------------------------------

template <typename T>
Value to_value(const T& value, const EncoderOptions& options = EncoderOptions{}) {
    Encoder encoder(options);
    return encoder.encode_root(value);
}

template <typename T>
Bytes encode(const T& value, const EncoderOptions& options = EncoderOptions{}) {
    PackOptions po;
    po.format = options.format;
    return pack(to_value(value, options), po);
}

template <typename T>
T from_value(const Value& root, const DecoderOptions& options = DecoderOptions{}) {
    Decoder decoder(root, options);
    return decoder.unbox<T>(root);
}

template <typename T>
T decode(const Bytes& data, const DecoderOptions& options = DecoderOptions{}) {
    UnpackOptions uo;
    uo.compatibility = options.compatibility;
    uo.max_depth = options.max_depth;
    const Value root = unpack_first(data, uo);
    return from_value<T>(root, options);
}

// ------------------------------
// Template implementation
// ------------------------------

template <typename T>
Value Encoder::encode_root(const T& value) {
    if constexpr (detail::is_scalar_v<T>) {
        return detail::scalar_to_value(value);
    } else {
        detail::encode_any(value, *this);
        if (storage_.empty()) {
            misuse(std::string("top-level ") + detail::type_label<T>() + " value did not encode any values");
        }
        return storage_.back()->materialize();
    }
}

template <typename T>
detail::BoxPtr Encoder::box(const T& value) {
    if constexpr (detail::is_scalar_v<T>) {
        return std::make_shared<detail::ValueBox>(detail::scalar_to_value(value));
    } else {
        struct FrameScope {
            Encoder& e;
            std::size_t saved;
            ~FrameScope() { e.frame_base_ = saved; }
        } scope{*this, frame_base_};

        const std::size_t depth = storage_.size();
        frame_base_ = depth;
        detail::encode_any(value, *this);

        if (storage_.size() > depth) {
            detail::BoxPtr out = storage_.back();
            storage_.resize(depth);
            return out;
        }
        return std::make_shared<detail::MapBox>();
    }
}

template <typename T>
void KeyedEncodingContainer::encode(const std::string& key, const T& value) {
    detail::PathScope scope(encoder_->path_, detail::appended(path_, CodingKey::named(key)));
    box_->set(key, encoder_->box(value));
}

template <typename T>
void KeyedEncodingContainer::encode_if_present(const std::string& key, const std::optional<T>& value) {
    if (value) encode(key, *value);
}

template <typename T>
void UnkeyedEncodingContainer::encode(const T& value) {
    detail::PathScope scope(encoder_->path_, detail::appended(path_, CodingKey::indexed(box_->size())));
    box_->append(encoder_->box(value));
}

template <typename T>
void SingleValueEncodingContainer::encode(const T& value) {
    if (!encoder_->can_encode_new_value()) {
        encoder_->misuse("single value container already holds a value");
    }
    detail::BoxPtr b = encoder_->box(value);
    encoder_->storage_.push_back(std::move(b));
}

template <typename T>
T Decoder::unbox(const Value& value) {
    if constexpr (detail::is_scalar_v<T>) {
        if constexpr (!std::is_same_v<T, Value>) {
            if (value.is_nil()) {
                throw MsgpkError(ErrorKind::ValueNotFound,
                                 std::string("expected ") + detail::type_label<T>() + " value but found nil instead",
                                 path_);
            }
        }
        try {
            return detail::scalar_from_value<T>(value, options_.number_strategy);
        } catch (const MsgpkError& e) {
            if (!e.coding_path().empty()) throw;
            throw MsgpkError(e.kind(), e.what(), path_);
        }
    } else {
        struct StorageScope {
            std::vector<const Value*>& s;
            ~StorageScope() { s.pop_back(); }
        };
        storage_.push_back(&value);
        StorageScope scope{storage_};

        T out{};
        detail::decode_any(out, *this);
        return out;
    }
}

template <typename T>
T KeyedDecodingContainer::decode(const std::string& key) const {
    const Value& v = entry(key);
    detail::PathScope scope(decoder_->path_, detail::appended(path_, CodingKey::named(key)));
    return decoder_->unbox<T>(v);
}

template <typename T>
std::optional<T> KeyedDecodingContainer::decode_if_present(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second->is_nil()) return std::nullopt;
    return decode<T>(key);
}

template <typename T>
T UnkeyedDecodingContainer::decode() {
    const Value& v = current(detail::type_label<T>());
    detail::PathScope scope(decoder_->path_, detail::appended(path_, CodingKey::indexed(index_)));
    T out = decoder_->unbox<T>(v);
    ++index_;
    return out;
}

template <typename T>
std::optional<T> UnkeyedDecodingContainer::decode_if_present() {
    if (is_at_end()) return std::nullopt;
    if (decode_nil()) return std::nullopt;
    return decode<T>();
}

namespace detail {

template <typename C, typename F>
void encode_field(C& container, const F& f) {
    using U = std::decay_t<decltype(f.second)>;
    if constexpr (is_optional<U>::value) {
        container.encode_if_present(f.first, f.second);
    } else {
        container.encode(f.first, f.second);
    }
}

template <typename C, typename F>
void decode_field(const C& container, const F& f) {
    using U = std::decay_t<decltype(f.second)>;
    if constexpr (is_optional<U>::value) {
        f.second = container.template decode_if_present<typename U::value_type>(f.first);
    } else {
        f.second = container.template decode<U>(f.first);
    }
}

template <typename T>
void encode_any(const T& value, Encoder& encoder) {
    if constexpr (is_optional<T>::value) {
        auto c = encoder.single_value_container();
        if (value) c.encode(*value);
        else c.encode_nil();
    } else if constexpr (is_vector<T>::value) {
        auto c = encoder.unkeyed_container();
        for (const auto& elem : value) {
            c.encode(elem);
        }
    } else if constexpr (is_string_map<T>::value) {
        auto c = encoder.keyed_container();
        for (const auto& kv : value) {
            c.encode(kv.first, kv.second);
        }
    } else if constexpr (has_encode_member<T>::value) {
        value.encode(encoder);
    } else if constexpr (has_const_fields<T>::value) {
        auto c = encoder.keyed_container();
        std::apply([&](const auto&... f) { (encode_field(c, f), ...); }, fields(value));
    } else {
        static_assert(dependent_false<T>::value,
                      "type needs an encode(msgpk::Encoder&) const member or an ADL fields() function");
    }
}

template <typename T>
void decode_any(T& out, Decoder& decoder) {
    if constexpr (is_optional<T>::value) {
        auto c = decoder.single_value_container();
        if (c.decode_nil()) out.reset();
        else out = c.template decode<typename T::value_type>();
    } else if constexpr (is_vector<T>::value) {
        auto c = decoder.unkeyed_container();
        out.clear();
        out.reserve(c.count());
        while (!c.is_at_end()) {
            out.push_back(c.template decode<typename T::value_type>());
        }
    } else if constexpr (is_string_map<T>::value) {
        auto c = decoder.keyed_container();
        out.clear();
        for (const auto& key : c.all_keys()) {
            out.emplace(key, c.template decode<typename T::mapped_type>(key));
        }
    } else if constexpr (has_decode_member<T>::value) {
        out.decode(decoder);
    } else if constexpr (has_fields<T>::value) {
        auto c = decoder.keyed_container();
        std::apply([&](const auto&... f) { (decode_field(c, f), ...); }, fields(out));
    } else {
        static_assert(dependent_false<T>::value,
                      "type needs a decode(msgpk::Decoder&) member or an ADL fields() function");
    }
}

} // namespace detail

} // namespace msgpk
