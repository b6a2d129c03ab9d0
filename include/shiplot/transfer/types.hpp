#pragma once

#include "shiplot/core/result.hpp"
#include "shiplot/io/byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace shiplot::transfer {

enum class TransferKind {
    Move,   ///< local staging file -> local destination volume
    Save,   ///< inbound network body -> local destination volume
    Upload  ///< local staging file -> remote receiver
};

inline const char* transfer_kind_name(TransferKind kind) {
    switch (kind) {
        case TransferKind::Move: return "move";
        case TransferKind::Save: return "save";
        case TransferKind::Upload: return "upload";
    }
    return "unknown";
}

/**
 * @brief Outcome of a committed transfer
 */
struct TransferReport {
    std::string file_name;
    std::filesystem::path destination;  ///< final path (remote jobs: peer endpoint)
    std::uint64_t bytes_written = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Opens the byte sink for a temporary destination path
 */
using SinkFactory =
    std::function<Result<std::unique_ptr<io::ByteWriter>>(const std::filesystem::path&)>;

/**
 * @brief One file on its way to a destination volume
 *
 * The source stream is borrowed from whoever created the job (the local
 * file reader or the inbound connection) and outlives the transfer.
 */
struct TransferJob {
    TransferKind kind = TransferKind::Move;
    std::string source_id;                      ///< path or peer address, for logs
    std::string file_name;                      ///< bare name written on the destination
    std::uint64_t expected_size = 0;
    io::ByteReader* source = nullptr;
    std::optional<std::uint64_t> source_limit;  ///< read at most this many bytes
};

using CompletionHandler = std::function<void(const Result<TransferReport>&)>;

} // namespace shiplot::transfer
