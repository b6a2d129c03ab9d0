#pragma once

#include "shiplot/core/cancellation.hpp"
#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <boost/asio/ip/tcp.hpp>

namespace shiplot::io {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking reader/writer over a connected Asio TCP socket
 *
 * The socket is borrowed and must outlive the stream. While the stream
 * exists a cancellation callback shuts the socket down, so a read blocked in
 * the kernel returns and the copy loop sees ErrorCode::Cancelled.
 *
 * The descriptor is captured at construction: the socket must be open by
 * then, and an owner that closes the socket while the stream is still alive
 * calls detach() first.
 */
class SocketStream : public ByteReader, public ByteWriter {
public:
    SocketStream(tcp::socket& socket, const CancellationToken& token);

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    Result<std::size_t> read(char* buffer, std::size_t size) override;
    Result<void> write(const char* data, std::size_t size) override;

    // The connection owner closes the socket
    Result<void> close() override { return Ok(); }

    /**
     * @brief Drop the cancellation callback; blocks while it is running
     */
    void detach();

private:
    tcp::socket& socket_;
    CancellationToken token_;
    tcp::socket::native_handle_type descriptor_;
    CancellationRegistration registration_;
};

} // namespace shiplot::io
