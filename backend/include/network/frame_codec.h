#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Length-prefixed framing for JSON payloads on a TCP stream.
 *
 * Wire layout: 4-byte big-endian body length, then the body bytes.
 */
namespace frame_codec {

constexpr std::size_t kHeaderSize = 4;

using Header = std::array<std::uint8_t, kHeaderSize>;

Header encode_header(std::uint32_t length);

std::uint32_t decode_header(const Header& header);

/// Header + body. Throws std::length_error above 4 GiB.
std::string encode(const std::string& payload);

}  // namespace frame_codec
