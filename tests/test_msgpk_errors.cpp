
#include "msgpk/msgpk.hpp"
#include "msgpk/msgpk_easy.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>



#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

using msgpk::Bytes;
using msgpk::ErrorKind;
using msgpk::Value;
using msgpk::easy::from_hex;

template <typename F>
static bool throws_kind(F&& f, ErrorKind kind) {
    try {
        f();
    } catch (const msgpk::MsgpkError& e) {
        return e.kind() == kind;
    }
    return false;
}

static bool unpack_fails(const Bytes& data, ErrorKind kind) {
    return throws_kind([&] { (void)msgpk::unpack_first(data); }, kind);
}

static Value nested_arrays(std::size_t depth) {
    Value v = Value::make_nil();
    for (std::size_t i = 0; i < depth; ++i) {
        Value::Array a;
        a.push_back(std::move(v));
        v = Value::make_array(std::move(a));
    }
    return v;
}

int main() {
    // Reserved tag
    {
        CHECK(unpack_fails(Bytes{0xc1}, ErrorKind::InvalidData));
        CHECK(unpack_fails(from_hex("92 01 c1"), ErrorKind::InvalidData));
        CHECK(unpack_fails(from_hex("81 c1 00"), ErrorKind::InvalidData));
    }

    // Every strict prefix of a valid encoding is insufficient data
    {
        Value::Map m;
        msgpk::easy::set(m, "compact", Value::make_bool(true));
        msgpk::easy::set(m, "schema", Value::make_uint(0));
        const std::vector<Value> samples = {
            Value::make_map(m),
            Value::make_uint(70000),
            Value::make_int(-70000),
            Value::make_double(2.5),
            msgpk::easy::str("truncate me"),
            Value::make_binary(Bytes(300, 0x5a)),
            Value::make_extended(3, Bytes{1, 2, 3}),
            Value::make_timestamp(-1, 5),
            msgpk::easy::array_of({Value::make_nil(), msgpk::easy::str("x")}),
        };
        for (const auto& v : samples) {
            const Bytes full = msgpk::pack(v);
            for (std::size_t n = 0; n < full.size(); ++n) {
                const Bytes prefix(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(n));
                CHECK(unpack_fails(prefix, ErrorKind::InsufficientData));
            }
        }
        CHECK(unpack_fails(Bytes{}, ErrorKind::InsufficientData));
    }

    // Declared lengths far beyond the input fail without allocating them
    {
        CHECK(unpack_fails(from_hex("dd ffffffff"), ErrorKind::InsufficientData));
        CHECK(unpack_fails(from_hex("df ffffffff"), ErrorKind::InsufficientData));
        CHECK(unpack_fails(from_hex("c6 ffffffff 00"), ErrorKind::InsufficientData));
        CHECK(unpack_fails(from_hex("db ffffffff 41"), ErrorKind::InsufficientData));
        CHECK(unpack_fails(from_hex("c9 ffffffff 07"), ErrorKind::InsufficientData));
    }

    // Malformed UTF-8
    {
        CHECK(unpack_fails(from_hex("a2 c3 28"), ErrorKind::InvalidData));      // bad continuation
        CHECK(unpack_fails(from_hex("a1 80"), ErrorKind::InvalidData));         // lone continuation
        CHECK(unpack_fails(from_hex("a2 c0 af"), ErrorKind::InvalidData));      // overlong '/'
        CHECK(unpack_fails(from_hex("a3 ed a0 80"), ErrorKind::InvalidData));   // surrogate
        CHECK(unpack_fails(from_hex("a4 f4 90 80 80"), ErrorKind::InvalidData)); // past U+10FFFF
        CHECK(msgpk::unpack_first(from_hex("a4 f0 9f 98 80")).string_value() == "\xf0\x9f\x98\x80");

        const Value bad = Value::make_binary(Bytes{0xff});
        CHECK(throws_kind([&] { (void)bad.string_value(); }, ErrorKind::InvalidData));
    }

    // Timestamp payloads
    {
        CHECK(unpack_fails(from_hex("d5 ff 0000"), ErrorKind::InvalidData));
        CHECK(unpack_fails(from_hex("c7 03 ff 000000"), ErrorKind::InvalidData));
        // 96-bit layout with nanoseconds = 1'000'000'000
        CHECK(unpack_fails(from_hex("c7 0c ff 3b9aca00 0000000000000000"), ErrorKind::InvalidData));
        // 64-bit layout with the 30-bit nanosecond field saturated
        CHECK(unpack_fails(from_hex("d7 ff ffffffff ffffffff"), ErrorKind::InvalidData));

        CHECK(throws_kind([] { (void)Value::make_timestamp(0, 1000000000u); }, ErrorKind::InvalidArgument));
        CHECK(throws_kind([] { (void)msgpk::timestamp_to_payload(msgpk::Timestamp{0, 1000000000u}); },
                          ErrorKind::InvalidArgument));
        CHECK(throws_kind([] { (void)msgpk::timestamp_from_payload(Bytes(5)); }, ErrorKind::InvalidData));
    }

    // Construction-time argument checks
    {
        CHECK(throws_kind([] { (void)Value::make_extended(msgpk::kTimestampType, Bytes{1}); },
                          ErrorKind::InvalidArgument));

        // A timestamp-typed extension set through the variant directly is not packed.
        Value raw;
        raw.v = msgpk::Extended{msgpk::kTimestampType, Bytes{1, 2, 3}};
        CHECK(throws_kind([&] { (void)msgpk::pack(raw); }, ErrorKind::InvalidArgument));
        CHECK(throws_kind([&] { (void)msgpk::pack(msgpk::easy::array_of({raw})); }, ErrorKind::InvalidArgument));
        raw.v = msgpk::Extended{5, Bytes{1, 2, 3}};
        CHECK(msgpk::easy::to_hex(msgpk::pack(raw)) == "c70305010203");

        const msgpk::ByteCursor c(Bytes{1, 2, 3});
        CHECK(throws_kind([&] { (void)msgpk::unpack_integer(c, 0); }, ErrorKind::InvalidArgument));
        CHECK(throws_kind([&] { (void)msgpk::unpack_integer(c, 9); }, ErrorKind::InvalidArgument));
        CHECK(throws_kind([&] { (void)msgpk::unpack_integer(c, 4); }, ErrorKind::InsufficientData));
        CHECK(throws_kind([&] { (void)msgpk::unpack_binary(c, 4); }, ErrorKind::InsufficientData));
        CHECK(throws_kind([&] { (void)msgpk::unpack_string(msgpk::ByteCursor(Bytes{0xff}), 1); },
                          ErrorKind::InvalidData));
    }

    // Nesting limits on both sides
    {
        // 10'000 nested array headers never reach the end of the input.
        Bytes deep(10000, 0x91);
        deep.push_back(0xc0);
        CHECK(unpack_fails(deep, ErrorKind::NestingTooDeep));

        const Value tall = nested_arrays(1000);
        CHECK(throws_kind([&] { (void)msgpk::pack(tall); }, ErrorKind::NestingTooDeep));

        msgpk::PackOptions po;
        po.max_depth = 2000;
        const Bytes packed = msgpk::pack(tall, po);
        CHECK(packed.size() == 1001);
        CHECK(unpack_fails(packed, ErrorKind::NestingTooDeep));

        msgpk::UnpackOptions uo;
        uo.max_depth = 2000;
        CHECK(msgpk::unpack_first(packed, uo) == tall);

        const Value ok = nested_arrays(400);
        CHECK(msgpk::unpack_first(msgpk::pack(ok)) == ok);
    }

    // Inputs that once crashed other decoders
    {
        const Bytes data = {
            130, 2, 130, 3, 9, 2, 8, 1, 129, 1, 182, 67, 101, 99, 105, 32, 101, 115, 116, 32, 117,
            110, 32, 99, 111, 117, 114, 116, 32, 116, 101, 115, 116,
        };
        auto result = msgpk::unpack(data);
        CHECK(result.remainder.empty());
        CHECK(result.value.count() == 2);
        const Value* inner = result.value.find(Value::make_uint(1));
        CHECK(inner && inner->find(Value::make_uint(1))->string_value() == "Ceci est un court test");

        // Same bytes behind a one-byte offset in a shared buffer.
        Bytes shifted = data;
        shifted.insert(shifted.begin(), 0x00);
        auto buffer = std::make_shared<const Bytes>(std::move(shifted));
        auto sliced = msgpk::unpack(msgpk::ByteCursor::slice(buffer, 1, buffer->size()));
        CHECK(sliced.value == result.value);
        CHECK(sliced.remainder.empty());
        CHECK(sliced.remainder.offset() == buffer->size());
    }

    // Errors describe themselves
    {
        CHECK(msgpk::to_string(ErrorKind::InvalidData) == "invalid data");
        CHECK(msgpk::to_string(ErrorKind::NestingTooDeep) == "nesting too deep");
        try {
            (void)msgpk::unpack_first(from_hex("c1"));
            CHECK(false);
        } catch (const msgpk::MsgpkError& e) {
            CHECK(std::string(e.what()).find("0xc1") != std::string::npos);
            CHECK(e.coding_path().empty());
        }
    }

    std::cout << "All tests passed.\n";
    return 0;
}
