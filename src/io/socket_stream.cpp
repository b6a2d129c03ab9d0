#include "shiplot/io/socket_stream.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <sys/socket.h>

namespace shiplot::io {

SocketStream::SocketStream(tcp::socket& socket, const CancellationToken& token)
    : socket_(socket), token_(token), descriptor_(socket.native_handle()) {
    // Runs on the cancelling thread while a worker may be inside read_some, so
    // it goes through the descriptor and leaves the Asio socket object alone
    registration_ = token_.on_cancel([descriptor = descriptor_] {
        if (::shutdown(descriptor, SHUT_RDWR) != 0) {
            spdlog::debug("Socket shutdown on cancel: {}", std::strerror(errno));
        }
    });
}

void SocketStream::detach() {
    registration_.reset();
}

Result<std::size_t> SocketStream::read(char* buffer, std::size_t size) {
    if (token_.is_cancelled()) {
        return Err<std::size_t>(ErrorCode::Cancelled, "socket read cancelled");
    }

    boost::system::error_code ec;
    const std::size_t count = socket_.read_some(asio::buffer(buffer, size), ec);
    // A shutdown from the cancel callback surfaces as end of stream
    if (ec && token_.is_cancelled()) {
        return Err<std::size_t>(ErrorCode::Cancelled, "socket read cancelled");
    }
    if (ec == asio::error::eof) {
        return Ok<std::size_t>(0);
    }
    if (ec) {
        return Err<std::size_t>(ErrorCode::Network, "socket read failed: " + ec.message());
    }
    return Ok(count);
}

Result<void> SocketStream::write(const char* data, std::size_t size) {
    if (token_.is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "socket write cancelled");
    }

    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data, size), ec);
    if (ec) {
        if (token_.is_cancelled()) {
            return Err<void>(ErrorCode::Cancelled, "socket write cancelled");
        }
        return Err<void>(ErrorCode::Network, "socket write failed: " + ec.message());
    }
    return Ok();
}

} // namespace shiplot::io
