#pragma once

#include "shiplot/core/result.hpp"

#include <cstddef>

namespace shiplot::io {

/**
 * @brief Blocking byte source
 *
 * read() returns the number of bytes placed in the buffer; 0 means end of
 * stream.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    virtual Result<std::size_t> read(char* buffer, std::size_t size) = 0;

    virtual Result<void> close() { return Ok(); }
};

/**
 * @brief Blocking byte sink; write() either stores every byte or fails
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    virtual Result<void> write(const char* data, std::size_t size) = 0;

    /**
     * @brief Flush and release the underlying handle
     *
     * Must succeed before a written file may be renamed into place.
     */
    virtual Result<void> close() { return Ok(); }
};

} // namespace shiplot::io
