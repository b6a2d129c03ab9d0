#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/io/socket_stream.hpp"
#include "shiplot/transfer/orchestrator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace shiplot::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct ServerOptions {
    std::string ip = "0.0.0.0";
    std::uint16_t port = 0;  ///< 0 = let the OS pick, see TransferServer::port()
    std::vector<std::string> plot_suffixes;
};

/**
 * @brief One inbound plot upload
 *
 * Lifecycle:
 * 1. Created when a connection is accepted
 * 2. start() reads the header asynchronously
 * 3. A valid header hands the socket body to the orchestrator as a save job;
 *    the job keeps this object alive through the body reader
 * 4. The job outcome is posted back to the socket's executor, the result
 *    byte is written and the socket is closed
 *
 * A bad name is answered with the failure byte before anything is claimed.
 */
class TransferConnection : public std::enable_shared_from_this<TransferConnection> {
public:
    TransferConnection(tcp::socket socket,
                       transfer::TransferOrchestrator& orchestrator,
                       const std::vector<std::string>& plot_suffixes,
                       const CancellationToken& token);

    void start();

private:
    void do_read_name_length();
    void do_read_name(std::size_t length);
    void do_read_size();
    void hand_off();
    void do_write_result(bool success);

    tcp::socket socket_;
    transfer::TransferOrchestrator& orchestrator_;
    std::vector<std::string> plot_suffixes_;
    io::SocketStream stream_;
    std::string peer_;

    std::uint8_t name_length_ = 0;
    std::array<char, 255> name_buffer_{};
    std::array<std::uint8_t, 8> size_buffer_{};
    std::string name_;
    std::uint64_t size_ = 0;
    std::uint8_t result_byte_ = 0;
};

/**
 * @brief Asynchronous TCP receiver for network-mode transfers
 *
 * Thread safety:
 * - Accepting and header parsing run on the io_context thread(s)
 * - Bodies are read by the orchestrator's workers, one per connection
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * TransferServer server(io_context, orchestrator, {"0.0.0.0", 9000, {".plot"}}, token);
 * server.start();
 * io_context.run();
 * ```
 */
class TransferServer {
public:
    TransferServer(asio::io_context& io_context,
                   transfer::TransferOrchestrator& orchestrator,
                   ServerOptions options,
                   CancellationToken token);

    /**
     * @brief Bind, listen and begin accepting
     *
     * RETURNS: error if the address is invalid or cannot be bound
     */
    Result<void> start();

    /**
     * @brief Stop accepting; connections already handed off finish normally
     */
    void stop();

    /**
     * @brief The bound port (resolved after start() when configured as 0)
     */
    std::uint16_t port() const { return port_; }

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    transfer::TransferOrchestrator& orchestrator_;
    ServerOptions options_;
    CancellationToken token_;
    std::uint16_t port_ = 0;
};

} // namespace shiplot::network
