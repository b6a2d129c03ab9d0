#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/transfer/uploader.hpp"

#include <cstdint>
#include <string>

namespace shiplot::network {

/**
 * @brief Sends plots to a TransferServer, one connection per file
 *
 * Each upload resolves the receiver, writes the header and body, then waits
 * for the one-byte result. The connection is closed on every path.
 *
 * THREAD SAFETY: upload() may run concurrently; calls share no state.
 */
class TransferClient : public transfer::Uploader {
public:
    TransferClient(std::string host, std::uint16_t port);

    Result<std::uint64_t> upload(const std::string& name,
                                 std::uint64_t size,
                                 io::ByteReader& body,
                                 const CancellationToken& token) override;

    std::string endpoint() const override;

private:
    std::string host_;
    std::uint16_t port_;
};

} // namespace shiplot::network
