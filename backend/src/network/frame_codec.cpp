#include "network/frame_codec.h"

#include <limits>
#include <stdexcept>

namespace frame_codec {

Header encode_header(std::uint32_t length) {
    return Header{
        static_cast<std::uint8_t>((length >> 24) & 0xFF),
        static_cast<std::uint8_t>((length >> 16) & 0xFF),
        static_cast<std::uint8_t>((length >> 8) & 0xFF),
        static_cast<std::uint8_t>(length & 0xFF),
    };
}

std::uint32_t decode_header(const Header& header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

std::string encode(const std::string& payload) {
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("frame payload exceeds 32-bit length prefix");
    }
    const Header header = encode_header(static_cast<std::uint32_t>(payload.size()));

    std::string out;
    out.reserve(kHeaderSize + payload.size());
    out.append(reinterpret_cast<const char*>(header.data()), header.size());
    out.append(payload);
    return out;
}

}  // namespace frame_codec
