#include "msgpk/codable.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <tuple>
#include <vector>

namespace bench {

struct Record {
    std::uint64_t id = 0;
    std::string label;
    double score = 0.0;
    std::vector<std::int32_t> history;
    bool active = false;
};

inline auto fields(const Record& r) {
    return std::make_tuple(msgpk::field("id", r.id), msgpk::field("label", r.label), msgpk::field("score", r.score),
                           msgpk::field("history", r.history), msgpk::field("active", r.active));
}

inline auto fields(Record& r) {
    return std::make_tuple(msgpk::field("id", r.id), msgpk::field("label", r.label), msgpk::field("score", r.score),
                           msgpk::field("history", r.history), msgpk::field("active", r.active));
}

} // namespace bench

static double ms_since(const std::chrono::high_resolution_clock::time_point& t0) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now() - t0).count();
}

static double mib(std::size_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

static msgpk::Value make_payload(std::size_t rows) {
    std::mt19937_64 rng(123);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    msgpk::Value::Array items;
    items.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        msgpk::Value::Map m;
        m.emplace(msgpk::Value::make_string("id"), msgpk::Value::make_uint(i));
        m.emplace(msgpk::Value::make_string("name"), msgpk::Value::make_string("item-" + std::to_string(i)));
        m.emplace(msgpk::Value::make_string("x"), msgpk::Value::make_double(dist(rng)));
        m.emplace(msgpk::Value::make_string("y"), msgpk::Value::make_float(static_cast<float>(dist(rng))));
        m.emplace(msgpk::Value::make_string("delta"), msgpk::Value::make_int(-static_cast<std::int64_t>(i % 70000)));
        m.emplace(msgpk::Value::make_string("raw"), msgpk::Value::make_binary(msgpk::Bytes(32, static_cast<std::uint8_t>(i))));
        items.push_back(msgpk::Value::make_map(std::move(m)));
    }
    return msgpk::Value::make_array(std::move(items));
}

static std::vector<bench::Record> make_records(std::size_t n) {
    std::mt19937 rng(456);
    std::uniform_real_distribution<double> dist(0.0, 100.0);

    std::vector<bench::Record> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i].id = i;
        out[i].label = "record-" + std::to_string(i);
        out[i].score = dist(rng);
        out[i].history = {static_cast<std::int32_t>(i), -1, 300, 70000};
        out[i].active = (i % 3) == 0;
    }
    return out;
}

static void bench_codec(const msgpk::Value& root) {
    std::cout << "=== pack/unpack ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    msgpk::Bytes packed = msgpk::pack(root);
    double p_ms = ms_since(t0);
    double mb = mib(packed.size());
    std::cout << "pack  : " << p_ms << " ms, size=" << mb << " MiB, throughput=" << (mb / (p_ms / 1000.0)) << " MiB/s\n";

    t0 = std::chrono::high_resolution_clock::now();
    msgpk::Value back = msgpk::unpack_first(packed);
    double u_ms = ms_since(t0);
    std::cout << "unpack: " << u_ms << " ms, throughput=" << (mb / (u_ms / 1000.0)) << " MiB/s\n";

    if (back != root) {
        throw std::runtime_error("pack/unpack round trip mismatch");
    }
}

static void bench_bridge(const std::vector<bench::Record>& records) {
    std::cout << "=== structured bridge ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    msgpk::Bytes packed = msgpk::encode(records);
    double e_ms = ms_since(t0);
    std::cout << "encode: " << e_ms << " ms, records=" << records.size() << ", size=" << mib(packed.size()) << " MiB\n";

    t0 = std::chrono::high_resolution_clock::now();
    auto back = msgpk::decode<std::vector<bench::Record>>(packed);
    double d_ms = ms_since(t0);
    std::cout << "decode: " << d_ms << " ms, records=" << back.size() << "\n";
}

static void bench_file(const std::filesystem::path& file, const msgpk::Value& root, bool zlib) {
    msgpk::WriteOptions wo;
    wo.zlib = zlib;
    wo.zlib_level = 6;

    std::cout << "=== " << (zlib ? "file zlib" : "file raw") << " ===\n";

    auto t0 = std::chrono::high_resolution_clock::now();
    msgpk::write_file(file, {root}, wo);
    double w_ms = ms_since(t0);

    double mb = mib(static_cast<std::size_t>(std::filesystem::file_size(file)));
    std::cout << "write: " << w_ms << " ms, file=" << mb << " MiB, throughput=" << (mb / (w_ms / 1000.0)) << " MiB/s\n";

    msgpk::ReadOptions ro;
    ro.zlib = zlib;
    t0 = std::chrono::high_resolution_clock::now();
    std::vector<msgpk::Value> read = msgpk::read_file(file, ro);
    double r_ms = ms_since(t0);
    std::cout << "read : " << r_ms << " ms, values=" << read.size() << ", throughput=" << (mb / (r_ms / 1000.0))
              << " MiB/s\n";
}

int main(int argc, char** argv) {
    std::filesystem::path file = (argc >= 2) ? argv[1] : (std::filesystem::temp_directory_path() / "msgpk_cpp_bench.msgpack");
    try {
        const msgpk::Value root = make_payload(200000);
        bench_codec(root);
        bench_bridge(make_records(100000));
        bench_file(file, root, false);
        bench_file(file, root, true);
    } catch (const std::exception& e) {
        std::cerr << "bench error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
