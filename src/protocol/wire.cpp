#include "shiplot/protocol/wire.hpp"

#include "shiplot/core/plot_file.hpp"

#include <algorithm>

namespace shiplot::protocol {
namespace {

Result<void> read_exact(io::ByteReader& reader, char* buffer, std::size_t size) {
    std::size_t filled = 0;
    while (filled < size) {
        auto result = reader.read(buffer + filled, size - filled);
        if (result.is_error()) {
            return Err<void>(result.error());
        }
        if (result.value() == 0) {
            return Err<void>(ErrorCode::Protocol, "unexpected end of stream");
        }
        filled += result.value();
    }
    return Ok();
}

} // namespace

std::array<std::uint8_t, kSizeFieldLength> encode_size(std::uint64_t size) {
    std::array<std::uint8_t, kSizeFieldLength> bytes{};
    for (std::size_t i = 0; i < kSizeFieldLength; ++i) {
        bytes[i] = static_cast<std::uint8_t>((size >> (8 * i)) & 0xFF);
    }
    return bytes;
}

std::uint64_t decode_size(const std::uint8_t* bytes) {
    std::uint64_t size = 0;
    for (std::size_t i = 0; i < kSizeFieldLength; ++i) {
        size |= static_cast<std::uint64_t>(bytes[i]) << (8 * i);
    }
    return size;
}

Result<std::vector<std::uint8_t>> encode_header(const WireHeader& header) {
    if (header.name.empty()) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument, "file name is empty");
    }
    if (header.name.size() > kMaxNameLength) {
        return Err<std::vector<std::uint8_t>>(
            ErrorCode::InvalidArgument,
            "file name longer than " + std::to_string(kMaxNameLength) + " bytes: " + header.name);
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(1 + header.name.size() + kSizeFieldLength);
    bytes.push_back(static_cast<std::uint8_t>(header.name.size()));
    bytes.insert(bytes.end(), header.name.begin(), header.name.end());

    const auto size_bytes = encode_size(header.size);
    bytes.insert(bytes.end(), size_bytes.begin(), size_bytes.end());
    return Ok(std::move(bytes));
}

Result<WireHeader> decode_header(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        return Err<WireHeader>(ErrorCode::Protocol, "header is empty");
    }

    const std::size_t name_length = bytes[0];
    const std::size_t expected = 1 + name_length + kSizeFieldLength;
    if (bytes.size() != expected) {
        return Err<WireHeader>(ErrorCode::Protocol,
                               "header length " + std::to_string(bytes.size()) +
                               " does not match expected " + std::to_string(expected));
    }

    WireHeader header;
    header.name.assign(bytes.begin() + 1, bytes.begin() + 1 + static_cast<std::ptrdiff_t>(name_length));
    header.size = decode_size(bytes.data() + 1 + name_length);
    return Ok(std::move(header));
}

Result<void> validate_file_name(const std::string& name, const std::vector<std::string>& suffixes) {
    if (name.empty() || name == "." || name == "..") {
        return Err<void>(ErrorCode::Protocol, "request provided invalid file name '" + name + "'");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return Err<void>(ErrorCode::Protocol, "request file name contains a path separator: " + name);
    }
    // A NUL would cut the name short at the filesystem call
    const bool has_control = std::any_of(name.begin(), name.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7f;
    });
    if (has_control) {
        return Err<void>(ErrorCode::Protocol, "request file name contains control characters");
    }
    if (!is_plot_file_name(name, suffixes)) {
        return Err<void>(ErrorCode::Protocol, "request provided incorrect file name " + name);
    }
    return Ok();
}

Result<bool> read_result(io::ByteReader& reader) {
    char byte = 0;
    if (auto res = read_exact(reader, &byte, 1); res.is_error()) {
        return Err<bool>(res.error());
    }
    return Ok(static_cast<std::uint8_t>(byte) == kResultSuccess);
}

} // namespace shiplot::protocol
