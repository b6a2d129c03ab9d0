#include "shiplot/network/transfer_server.hpp"

#include "shiplot/protocol/wire.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

namespace shiplot::network {

// ──────────────────────────────────────────────────────────
// TransferConnection Implementation
// ──────────────────────────────────────────────────────────

TransferConnection::TransferConnection(tcp::socket socket,
                                       transfer::TransferOrchestrator& orchestrator,
                                       const std::vector<std::string>& plot_suffixes,
                                       const CancellationToken& token)
    : socket_(std::move(socket))
    , orchestrator_(orchestrator)
    , plot_suffixes_(plot_suffixes)
    , stream_(socket_, token) {
    boost::system::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown peer") : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void TransferConnection::start() {
    do_read_name_length();
}

void TransferConnection::do_read_name_length() {
    auto self = shared_from_this();

    asio::async_read(
        socket_,
        asio::buffer(&name_length_, 1),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                spdlog::error("Failed to read file name from {}: {}", peer_, ec.message());
                do_write_result(false);
                return;
            }
            if (name_length_ == 0) {
                spdlog::error("Request from {} provided an empty file name", peer_);
                do_write_result(false);
                return;
            }
            do_read_name(name_length_);
        });
}

void TransferConnection::do_read_name(std::size_t length) {
    auto self = shared_from_this();

    asio::async_read(
        socket_,
        asio::buffer(name_buffer_.data(), length),
        [this, self, length](boost::system::error_code ec, std::size_t) {
            if (ec) {
                spdlog::error("Failed to read file name from {}: {}", peer_, ec.message());
                do_write_result(false);
                return;
            }

            name_.assign(name_buffer_.data(), length);
            if (auto valid = protocol::validate_file_name(name_, plot_suffixes_); valid.is_error()) {
                spdlog::error("Rejecting request from {}: {}", peer_, valid.error().message);
                do_write_result(false);
                return;
            }
            do_read_size();
        });
}

void TransferConnection::do_read_size() {
    auto self = shared_from_this();

    asio::async_read(
        socket_,
        asio::buffer(size_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                spdlog::error("Failed to read file size of {} from {}: {}", name_, peer_, ec.message());
                do_write_result(false);
                return;
            }
            size_ = protocol::decode_size(size_buffer_.data());
            hand_off();
        });
}

void TransferConnection::hand_off() {
    auto self = shared_from_this();
    spdlog::info("Receiving {} ({} bytes) from {}", name_, size_, peer_);

    // The body reader shares ownership of the connection
    std::shared_ptr<io::ByteReader> body(self, static_cast<io::ByteReader*>(&stream_));

    const bool queued = orchestrator_.enqueue_save(
        name_, size_, std::move(body),
        [self](const Result<transfer::TransferReport>& outcome) {
            const bool success = outcome.is_ok();
            asio::post(self->socket_.get_executor(), [self, success] {
                self->do_write_result(success);
            });
        });

    if (!queued) {
        spdlog::error("Failed to add {} from {} to the transfer queue", name_, peer_);
        do_write_result(false);
    }
}

void TransferConnection::do_write_result(bool success) {
    auto self = shared_from_this();
    result_byte_ = success ? protocol::kResultSuccess : protocol::kResultFailure;

    asio::async_write(
        socket_,
        asio::buffer(&result_byte_, 1),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec && ec != asio::error::operation_aborted) {
                spdlog::debug("Failed to send result to {}: {}", peer_, ec.message());
            }

            // The descriptor may be reused once closed
            stream_.detach();

            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            socket_.close(shutdown_ec);
        });
}

// ──────────────────────────────────────────────────────────
// TransferServer Implementation
// ──────────────────────────────────────────────────────────

TransferServer::TransferServer(asio::io_context& io_context,
                               transfer::TransferOrchestrator& orchestrator,
                               ServerOptions options,
                               CancellationToken token)
    : io_context_(io_context)
    , acceptor_(io_context)
    , orchestrator_(orchestrator)
    , options_(std::move(options))
    , token_(std::move(token)) {}

Result<void> TransferServer::start() {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(options_.ip, ec);
    if (ec) {
        return Err<void>(ErrorCode::Config, "invalid listen address '" + options_.ip + "': " + ec.message());
    }

    const tcp::endpoint endpoint(address, options_.port);
    const std::string printable = options_.ip + ":" + std::to_string(options_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        return Err<void>(ErrorCode::Network, "cannot listen on " + printable + ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint(ec).port();
    spdlog::info("Starting TCP server on {}:{}", options_.ip, port_);

    do_accept();
    return Ok();
}

void TransferServer::stop() {
    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

void TransferServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                spdlog::debug("TCP server stopped accepting");
                return;
            }

            if (!ec) {
                std::make_shared<TransferConnection>(
                    std::move(socket), orchestrator_, options_.plot_suffixes, token_)->start();
            } else {
                spdlog::error("Incoming connection failed: {}", ec.message());
            }

            do_accept();
        });
}

} // namespace shiplot::network
