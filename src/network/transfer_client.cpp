#include "shiplot/network/transfer_client.hpp"

#include "shiplot/io/cancellable_stream.hpp"
#include "shiplot/io/socket_stream.hpp"
#include "shiplot/protocol/wire.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

namespace shiplot::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TransferClient::TransferClient(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

std::string TransferClient::endpoint() const {
    return host_ + ":" + std::to_string(port_);
}

Result<std::uint64_t> TransferClient::upload(const std::string& name,
                                             std::uint64_t size,
                                             io::ByteReader& body,
                                             const CancellationToken& token) {
    // Reject bad names before opening a connection
    auto header = protocol::encode_header(protocol::WireHeader{name, size});
    if (header.is_error()) {
        return Err<std::uint64_t>(header.error());
    }

    asio::io_context io_context;
    tcp::resolver resolver(io_context);

    boost::system::error_code ec;
    const auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::Network, "cannot resolve " + endpoint() + ": " + ec.message());
    }

    tcp::socket socket(io_context);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorCode::Network, "cannot connect to " + endpoint() + ": " + ec.message());
    }

    auto result = [&]() -> Result<std::uint64_t> {
        io::SocketStream stream(socket, token);

        const auto& bytes = header.value();
        if (auto written = stream.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            written.is_error()) {
            return Err<std::uint64_t>(written.error());
        }

        spdlog::info("Sending {} ({} bytes) to {}", name, size, endpoint());
        auto copied = io::copy_stream(body, stream, token, size);
        if (copied.is_error()) {
            return Err<std::uint64_t>(copied.error());
        }
        if (copied.value() != size) {
            // The receiver is still waiting for body bytes; closing makes it fail
            return Err<std::uint64_t>(ErrorCode::SizeMismatch,
                                      "source of " + name + " ended after " +
                                          std::to_string(copied.value()) + " of " +
                                          std::to_string(size) + " bytes");
        }

        auto acknowledged = protocol::read_result(stream);
        if (acknowledged.is_error()) {
            return Err<std::uint64_t>(acknowledged.error());
        }
        if (!acknowledged.value()) {
            return Err<std::uint64_t>(ErrorCode::Protocol, "server returned failure for " + name);
        }
        return Ok(copied.value());
    }();

    boost::system::error_code close_ec;
    socket.shutdown(tcp::socket::shutdown_both, close_ec);
    socket.close(close_ec);
    return result;
}

} // namespace shiplot::network
