#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace apisim {
namespace protocol {

// zlib codecs over whole buffers. Used to read compressed upstream bodies in
// record mode and for .rec.gz recording files.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Case-insensitive; empty and "identity" map to kIdentity.
    static Encoding ParseContentEncoding(const std::string& v);

    // False on corrupt input or an encoding zlib cannot handle.
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);

    // True when data starts with the gzip magic bytes.
    static bool LooksGzipped(const std::string& data);
};

} // namespace protocol
} // namespace apisim
