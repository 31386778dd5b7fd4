
#include "msgpk/msgpk.hpp"
#include "msgpk/msgpk_easy.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
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
using msgpk::Value;

static std::vector<Value> make_records() {
    std::vector<Value> out;
    for (std::uint64_t i = 0; i < 200; ++i) {
        out.push_back(msgpk::easy::map_of({
            {"id", Value::make_uint(i)},
            {"name", msgpk::easy::str("record-" + std::to_string(i))},
            {"ratio", Value::make_double(static_cast<double>(i) / 7.0)},
            {"tags", msgpk::easy::array_of({msgpk::easy::str("a"), msgpk::easy::str("b")})},
        }));
    }
    out.push_back(Value::make_timestamp(1700000000, 1));
    out.push_back(Value::make_binary(Bytes(1000, 0x00)));
    return out;
}

static void flip_byte(const std::filesystem::path& p, std::streamoff pos) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    CHECK(static_cast<bool>(f));
    f.seekg(pos, std::ios::beg);
    char c;
    f.read(&c, 1);
    CHECK(static_cast<bool>(f));
    c ^= 0x5a;
    f.seekp(pos, std::ios::beg);
    f.write(&c, 1);
    CHECK(static_cast<bool>(f));
}

int main() {
    const std::filesystem::path raw_path = std::filesystem::temp_directory_path() / "msgpk_cpp_test.msgpack";
    const std::filesystem::path z_path = std::filesystem::temp_directory_path() / "msgpk_cpp_test.msgpack.z";
    std::filesystem::remove(raw_path);
    std::filesystem::remove(z_path);

    const std::vector<Value> records = make_records();

    // Raw stream of concatenated values
    {
        msgpk::write_file(raw_path, records);
        CHECK(std::filesystem::file_size(raw_path) > 0);

        const std::vector<Value> back = msgpk::read_file(raw_path);
        CHECK(back.size() == records.size());
        for (std::size_t i = 0; i < back.size(); ++i) {
            CHECK(back[i] == records[i]);
        }

        Bytes expected;
        for (const auto& v : records) {
            msgpk::pack_into(expected, v);
        }
        CHECK(msgpk::read_file_bytes(raw_path) == expected);
    }

    // zlib-wrapped stream
    {
        msgpk::WriteOptions wo;
        wo.zlib = true;
        wo.zlib_level = 9;
        msgpk::write_file(z_path, records, wo);
        CHECK(std::filesystem::file_size(z_path) < std::filesystem::file_size(raw_path));

        msgpk::ReadOptions ro;
        ro.zlib = true;
        const std::vector<Value> back = msgpk::read_file(z_path, ro);
        CHECK(back.size() == records.size());
        CHECK(back.front() == records.front());
        CHECK(back.back() == records.back());
        CHECK(msgpk::read_file_bytes(z_path, ro) == msgpk::read_file_bytes(raw_path));

        // Corrupt the deflate stream.
        flip_byte(z_path, 20);
        bool threw = false;
        try {
            (void)msgpk::read_file(z_path, ro);
        } catch (const msgpk::MsgpkError& e) {
            threw = (e.kind() == msgpk::ErrorKind::ZlibError) || (e.kind() == msgpk::ErrorKind::InsufficientData) ||
                    (e.kind() == msgpk::ErrorKind::InvalidData);
        }
        CHECK(threw);
    }

    // Legacy format plus compatibility reading
    {
        msgpk::WriteOptions wo;
        wo.pack.format = msgpk::PackFormat::Legacy;
        msgpk::write_file(raw_path, {msgpk::easy::str("text"), Value::make_binary(Bytes{0xff, 0x00})}, wo);

        msgpk::ReadOptions ro;
        ro.unpack.compatibility = true;
        const std::vector<Value> back = msgpk::read_file(raw_path, ro);
        CHECK(back.size() == 2);
        CHECK(back[0].is_binary());
        CHECK(back[1].binary_value() == (Bytes{0xff, 0x00}));

        // Without compatibility the non-UTF-8 payload is rejected.
        bool threw = false;
        try {
            (void)msgpk::read_file(raw_path);
        } catch (const msgpk::MsgpkError& e) {
            threw = e.kind() == msgpk::ErrorKind::InvalidData;
        }
        CHECK(threw);
    }

    // Empty files hold no values
    {
        msgpk::write_file(raw_path, {});
        CHECK(msgpk::read_file(raw_path).empty());
    }

    // Missing files
    {
        bool threw = false;
        try {
            (void)msgpk::read_file(std::filesystem::temp_directory_path() / "msgpk_cpp_test_missing.msgpack");
        } catch (const msgpk::MsgpkError& e) {
            threw = e.kind() == msgpk::ErrorKind::Io;
        }
        CHECK(threw);
    }

    // CRC-32 check value
    {
        const std::string s = "123456789";
        CHECK(msgpk::crc32(Bytes(s.begin(), s.end())) == 0xCBF43926u);
        CHECK(msgpk::crc32(Bytes{}) == 0u);
    }

    std::filesystem::remove(raw_path);
    std::filesystem::remove(z_path);
    std::cout << "All tests passed.\n";
    return 0;
}
