
#include "msgpk/msgpk.hpp"

#include <array>
#include <fstream>
#include <iterator>

#include <zlib.h>

namespace msgpk {

static constexpr std::uint64_t kMaxInflatedSize = 4ull * 1024 * 1024 * 1024;

std::uint32_t crc32(const Bytes& data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

static Bytes zlib_compress(const Bytes& in, int level) {
    uLongf bound = ::compressBound(static_cast<uLong>(in.size()));
    Bytes out(bound);

    uLongf out_len = bound;
    int rc = ::compress2(reinterpret_cast<Bytef*>(out.data()), &out_len,
                         reinterpret_cast<const Bytef*>(in.data()),
                         static_cast<uLong>(in.size()),
                         level);
    if (rc != Z_OK) {
        throw MsgpkError(ErrorKind::ZlibError, "zlib compress2 failed (rc=" + std::to_string(rc) + ")");
    }
    out.resize(static_cast<std::size_t>(out_len));
    return out;
}

// The inflated size is not stored, so inflate in chunks until the stream ends.
static Bytes zlib_decompress(const Bytes& in) {
    z_stream zs{};
    if (::inflateInit(&zs) != Z_OK) {
        throw MsgpkError(ErrorKind::ZlibError, "zlib inflateInit failed");
    }

    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    Bytes out;
    std::array<std::uint8_t, 64 * 1024> chunk{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = ::inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            ::inflateEnd(&zs);
            throw MsgpkError(ErrorKind::ZlibError, "zlib inflate failed (rc=" + std::to_string(rc) + ")");
        }
        const std::size_t produced = chunk.size() - zs.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (out.size() > kMaxInflatedSize) {
            ::inflateEnd(&zs);
            throw MsgpkError(ErrorKind::InvalidData, "inflated stream exceeds configured limit");
        }
        if (rc == Z_OK && produced == 0 && zs.avail_in == 0) {
            ::inflateEnd(&zs);
            throw MsgpkError(ErrorKind::InsufficientData, "zlib stream is truncated");
        }
    }
    ::inflateEnd(&zs);
    return out;
}

Bytes read_file_bytes(const std::filesystem::path& file, const ReadOptions& opts) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw MsgpkError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    Bytes raw((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) {
        throw MsgpkError(ErrorKind::Io, "failed reading file: " + file.string());
    }
    if (opts.zlib) {
        return zlib_decompress(raw);
    }
    return raw;
}

std::vector<Value> read_file(const std::filesystem::path& file, const ReadOptions& opts) {
    const Bytes data = read_file_bytes(file, opts);
    return unpack_all(data, opts.unpack);
}

void write_file(const std::filesystem::path& file, const std::vector<Value>& values, const WriteOptions& opts) {
    Bytes payload;
    payload.reserve(1024);
    for (const auto& v : values) {
        pack_into(payload, v, opts.pack);
    }

    if (opts.zlib) {
        payload = zlib_compress(payload, opts.zlib_level);
    }

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw MsgpkError(ErrorKind::Io, "failed to open for write: " + file.string());
    if (!payload.empty()) {
        os.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    if (!os) throw MsgpkError(ErrorKind::Io, "failed writing file: " + file.string());
}

} // namespace msgpk
