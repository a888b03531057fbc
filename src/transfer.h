#pragma once

/**
 * @file transfer.h
 * @brief One unidirectional file transfer and its state machine
 */

#include "transfer_types.h"
#include "byte_range_set.h"
#include "fs.h"

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <shared_mutex>

namespace whisp {

class Transfer;

/**
 * Callback function types for per-transfer events.
 * Both run on the thread servicing Transport events after the transfer
 * lock has been released. They must not block.
 */
using TransferProgressCallback = std::function<void(const Transfer& transfer)>;
using TransferCompletionCallback = std::function<void(const Transfer& transfer, const TransferResult& result)>;

/**
 * Consistent copy of a transfer's fields, taken under one lock acquisition
 */
struct TransferSnapshot {
    std::string id;
    PeerId peer_id = 0;
    bool has_file_handle = false;
    FileHandle file_handle = 0;
    std::string file_name;
    std::string file_path;
    uint64_t file_size = 0;
    std::string file_checksum;
    FileKind kind = FileKind::DATA;
    TransferDirection direction = TransferDirection::OUTGOING;
    TransferState state = TransferState::PENDING;
    uint64_t bytes_transferred = 0;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    TransferResult last_error;

    double progress() const {
        if (file_size == 0) return 0.0;
        return static_cast<double>(bytes_transferred) / static_cast<double>(file_size);
    }
};

/**
 * A single transfer between the local peer and one remote peer.
 *
 * Identity, direction, kind and size are fixed at construction. Everything
 * else is guarded by the transfer's own reader/writer lock and is only
 * mutated by TransferManager.
 */
class Transfer {
public:
    Transfer(const std::string& id, PeerId peer_id, TransferDirection direction,
             const std::string& file_name, uint64_t file_size, FileKind kind = FileKind::DATA);
    ~Transfer();

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    const std::string& id() const { return id_; }
    PeerId peer_id() const { return peer_id_; }
    TransferDirection direction() const { return direction_; }
    FileKind kind() const { return kind_; }
    const std::string& file_name() const { return file_name_; }
    uint64_t file_size() const { return file_size_; }
    std::chrono::system_clock::time_point start_time() const { return start_time_; }

    TransferState state() const;
    uint64_t bytes_transferred() const;
    std::string file_path() const;
    std::string file_checksum() const;
    std::string expected_checksum() const;
    bool has_file_handle() const;
    FileHandle file_handle() const;
    std::optional<std::chrono::system_clock::time_point> end_time() const;
    TransferResult last_error() const;

    /**
     * Fraction of the file transferred, 0.0 to 1.0
     * @return 0.0 for an empty file
     */
    double progress() const;

    /**
     * @return true once the transfer reached COMPLETED, FAILED or CANCELLED
     */
    bool is_complete() const;

    TransferSnapshot snapshot() const;

private:
    friend class TransferManager;

    // Helpers below expect mutex_ to be held exclusively by the caller.

    // Move to a terminal state: close the file and stamp the end time.
    // Returns false if the transfer was already terminal.
    bool finish_locked(TransferState terminal, const TransferResult& result);
    bool close_file_locked(std::string* error_out);
    TransferSnapshot snapshot_locked() const;

    const std::string id_;
    const PeerId peer_id_;
    const TransferDirection direction_;
    const std::string file_name_;
    const uint64_t file_size_;
    const FileKind kind_;
    const std::chrono::system_clock::time_point start_time_;

    mutable std::shared_mutex mutex_;
    TransferState state_;
    bool has_file_handle_;
    FileHandle file_handle_;
    std::string file_path_;
    std::string file_checksum_;
    std::string expected_checksum_;
    ByteRangeSet ranges_;
    std::optional<std::chrono::system_clock::time_point> end_time_;
    TransferResult last_error_;

    // Open only while the transfer is being serviced
    File file_;

    TransferProgressCallback progress_callback_;
    TransferCompletionCallback completion_callback_;
};

} // namespace whisp
