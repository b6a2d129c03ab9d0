/**
 * @file wire.hpp
 * @brief Framing for network-mode plot transfers
 *
 * One plot per connection:
 *
 *   [1 byte nameLen][nameLen bytes name][8 bytes size, little-endian]
 *   [size bytes body]
 *   [1 byte result]   server -> client, 0x01 success, 0x00 failure
 *
 * No versioning and no checksum; the receiver compares the byte count with
 * the declared size.
 */

#pragma once

#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace shiplot::protocol {

constexpr std::uint8_t kResultFailure = 0x00;
constexpr std::uint8_t kResultSuccess = 0x01;
constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kSizeFieldLength = 8;

struct WireHeader {
    std::string name;
    std::uint64_t size = 0;
};

std::array<std::uint8_t, kSizeFieldLength> encode_size(std::uint64_t size);
std::uint64_t decode_size(const std::uint8_t* bytes);

/**
 * @brief Serialize name length, name and size
 *
 * Fails for an empty name or one longer than 255 bytes.
 */
Result<std::vector<std::uint8_t>> encode_header(const WireHeader& header);

/**
 * @brief Parse a complete header buffer (no trailing bytes allowed)
 */
Result<WireHeader> decode_header(const std::vector<std::uint8_t>& bytes);

/**
 * @brief Check a received name before anything is claimed for it
 *
 * The name must carry a plot suffix and must be a bare file name: no path
 * separators, no control bytes, no "." or "..".
 */
Result<void> validate_file_name(const std::string& name, const std::vector<std::string>& suffixes);

/**
 * @brief Read the receiver's one-byte verdict after the body has been sent
 *
 * RETURNS: true for kResultSuccess; a Protocol error if the peer closed first
 */
Result<bool> read_result(io::ByteReader& reader);

} // namespace shiplot::protocol
