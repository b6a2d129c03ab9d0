#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <cstdint>
#include <string>

namespace shiplot::transfer {

/**
 * @brief Forwards one file to a remote receiver
 *
 * Implementations send the whole body and return only once the receiver
 * has acknowledged (or rejected) the file.
 */
class Uploader {
public:
    virtual ~Uploader() = default;

    /**
     * RETURNS: bytes sent when the receiver reported success
     */
    virtual Result<std::uint64_t> upload(const std::string& name,
                                         std::uint64_t size,
                                         io::ByteReader& body,
                                         const CancellationToken& token) = 0;

    /// Printable receiver address, used in reports and logs
    virtual std::string endpoint() const = 0;
};

} // namespace shiplot::transfer
