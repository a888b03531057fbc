#pragma once

/**
 * @file transfer_types.h
 * @brief Enumerations and result types shared by the transfer core
 */

#include <string>
#include <cstdint>
#include <functional>

namespace whisp {

/** Remote participant (friend number assigned by the messaging layer) */
using PeerId = uint32_t;

/** Transport-assigned handle correlating callbacks to one announced file */
using FileHandle = uint32_t;

/**
 * Transfer lifecycle states
 *
 * PENDING -> ACTIVE -> {COMPLETED | FAILED | CANCELLED}
 * ACTIVE <-> PAUSED
 * Any non-terminal state may move to CANCELLED or FAILED.
 */
enum class TransferState {
    PENDING,        // Created, waiting for StartSend / AcceptIncoming
    ACTIVE,         // Chunks are being serviced
    PAUSED,         // Temporarily halted by a control signal
    COMPLETED,      // All bytes transferred
    FAILED,         // Unrecoverable error
    CANCELLED       // Cancelled by the local user
};

enum class TransferDirection {
    OUTGOING,       // We are sending the file
    INCOMING        // We are receiving the file
};

/** File kind carried in announces */
enum class FileKind : uint32_t {
    DATA = 0,
    AVATAR = 1
};

/** Control signals exchanged through the Transport */
enum class FileControl {
    RESUME = 0,
    PAUSE = 1,
    CANCEL = 2
};

/** How a digest mismatch on a completed incoming transfer is handled */
enum class ChecksumPolicy {
    RECORD_ONLY,        // Complete and report the mismatch in the result
    FAIL_ON_MISMATCH    // Mark the transfer failed
};

enum class TransferErrorCode {
    NONE = 0,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INVALID_STATE,
    WRONG_DIRECTION,
    FILE_NOT_FOUND,
    IS_DIRECTORY,
    FILE_TOO_LARGE,
    UNSAFE_FILENAME,
    IO_ERROR,
    TRANSPORT_ERROR,
    NO_TRANSPORT,
    CHECKSUM_MISMATCH
};

/**
 * Outcome of a transfer operation
 */
struct TransferResult {
    bool success = false;
    TransferErrorCode error = TransferErrorCode::NONE;
    std::string error_message;

    TransferResult() = default;
    explicit TransferResult(bool s) : success(s) {}

    static TransferResult Success() { return TransferResult(true); }
    static TransferResult Error(TransferErrorCode code, const std::string& msg) {
        TransferResult r;
        r.error = code;
        r.error_message = msg;
        return r;
    }

    explicit operator bool() const { return success; }
};

inline bool is_terminal_state(TransferState state) {
    return state == TransferState::COMPLETED ||
           state == TransferState::FAILED ||
           state == TransferState::CANCELLED;
}

const char* transfer_state_to_string(TransferState state);
const char* transfer_direction_to_string(TransferDirection direction);
const char* file_control_to_string(FileControl control);
const char* transfer_error_to_string(TransferErrorCode code);

/**
 * Key of the (peer, file handle) index
 */
struct TransportKey {
    PeerId peer_id = 0;
    FileHandle file_handle = 0;

    TransportKey() = default;
    TransportKey(PeerId peer, FileHandle handle) : peer_id(peer), file_handle(handle) {}

    bool operator==(const TransportKey& other) const {
        return peer_id == other.peer_id && file_handle == other.file_handle;
    }
    bool operator!=(const TransportKey& other) const { return !(*this == other); }
};

struct TransportKeyHash {
    size_t operator()(const TransportKey& key) const {
        uint64_t packed = (static_cast<uint64_t>(key.peer_id) << 32) | key.file_handle;
        return std::hash<uint64_t>()(packed);
    }
};

} // namespace whisp
