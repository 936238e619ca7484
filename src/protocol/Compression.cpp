#include "apisim/protocol/Compression.h"

#include <cctype>
#include <cstring>
#include <zlib.h>

namespace apisim {
namespace protocol {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

int WindowBitsFor(Compression::Encoding enc) {
    return enc == Compression::Encoding::kGzip ? 16 + MAX_WBITS : MAX_WBITS;
}

bool InflateAll(const std::string& in, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    if (inflateInit2(&zs, windowBits) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, produced);
        // Truncated input: no progress and no end of stream.
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0) {
            inflateEnd(&zs);
            return false;
        }
    }
    inflateEnd(&zs);
    return true;
}

bool DeflateAll(const std::string& in, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, produced);
    }
    deflateEnd(&zs);
    return true;
}

} // namespace

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = ToLowerCopy(v);
    if (lv.find("gzip") != std::string::npos) return Encoding::kGzip;
    if (lv.find("deflate") != std::string::npos) return Encoding::kDeflate;
    if (lv.empty() || lv.find("identity") != std::string::npos) return Encoding::kIdentity;
    return Encoding::kUnknown;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
        case Encoding::kDeflate:
            return InflateAll(in, WindowBitsFor(enc), out);
        case Encoding::kUnknown:
            return false;
    }
    return false;
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
        case Encoding::kDeflate:
            return DeflateAll(in, WindowBitsFor(enc), out);
        case Encoding::kUnknown:
            return false;
    }
    return false;
}

bool Compression::LooksGzipped(const std::string& data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

} // namespace protocol
} // namespace apisim
