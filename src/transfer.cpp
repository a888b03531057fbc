#include "transfer.h"
#include "logger.h"

#include <mutex>

namespace whisp {

//=============================================================================
// String conversions
//=============================================================================

const char* transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::PENDING:   return "pending";
        case TransferState::ACTIVE:    return "active";
        case TransferState::PAUSED:    return "paused";
        case TransferState::COMPLETED: return "completed";
        case TransferState::FAILED:    return "failed";
        case TransferState::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

const char* transfer_direction_to_string(TransferDirection direction) {
    return direction == TransferDirection::OUTGOING ? "outgoing" : "incoming";
}

const char* file_control_to_string(FileControl control) {
    switch (control) {
        case FileControl::RESUME: return "resume";
        case FileControl::PAUSE:  return "pause";
        case FileControl::CANCEL: return "cancel";
        default: return "unknown";
    }
}

const char* transfer_error_to_string(TransferErrorCode code) {
    switch (code) {
        case TransferErrorCode::NONE:              return "none";
        case TransferErrorCode::NOT_FOUND:         return "not found";
        case TransferErrorCode::INVALID_ARGUMENT:  return "invalid argument";
        case TransferErrorCode::INVALID_STATE:     return "invalid state";
        case TransferErrorCode::WRONG_DIRECTION:   return "wrong direction";
        case TransferErrorCode::FILE_NOT_FOUND:    return "file not found";
        case TransferErrorCode::IS_DIRECTORY:      return "is a directory";
        case TransferErrorCode::FILE_TOO_LARGE:    return "file too large";
        case TransferErrorCode::UNSAFE_FILENAME:   return "unsafe filename";
        case TransferErrorCode::IO_ERROR:          return "i/o error";
        case TransferErrorCode::TRANSPORT_ERROR:   return "transport error";
        case TransferErrorCode::NO_TRANSPORT:      return "no transport";
        case TransferErrorCode::CHECKSUM_MISMATCH: return "checksum mismatch";
        default: return "unknown";
    }
}

//=============================================================================
// Transfer Implementation
//=============================================================================

Transfer::Transfer(const std::string& id, PeerId peer_id, TransferDirection direction,
                   const std::string& file_name, uint64_t file_size, FileKind kind)
    : id_(id), peer_id_(peer_id), direction_(direction), file_name_(file_name),
      file_size_(file_size), kind_(kind), start_time_(std::chrono::system_clock::now()),
      state_(TransferState::PENDING), has_file_handle_(false), file_handle_(0) {
}

Transfer::~Transfer() {
    std::string error;
    if (!close_file_locked(&error)) {
        LOG_WARN("transfer", "Closing file of transfer " << id_ << " failed: " << error);
    }
}

TransferState Transfer::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

uint64_t Transfer::bytes_transferred() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ranges_.covered();
}

std::string Transfer::file_path() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return file_path_;
}

std::string Transfer::file_checksum() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return file_checksum_;
}

std::string Transfer::expected_checksum() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return expected_checksum_;
}

bool Transfer::has_file_handle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return has_file_handle_;
}

FileHandle Transfer::file_handle() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return file_handle_;
}

std::optional<std::chrono::system_clock::time_point> Transfer::end_time() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return end_time_;
}

TransferResult Transfer::last_error() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_error_;
}

double Transfer::progress() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (file_size_ == 0) {
        return 0.0;
    }
    return static_cast<double>(ranges_.covered()) / static_cast<double>(file_size_);
}

bool Transfer::is_complete() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return is_terminal_state(state_);
}

TransferSnapshot Transfer::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshot_locked();
}

TransferSnapshot Transfer::snapshot_locked() const {
    TransferSnapshot snap;
    snap.id = id_;
    snap.peer_id = peer_id_;
    snap.has_file_handle = has_file_handle_;
    snap.file_handle = file_handle_;
    snap.file_name = file_name_;
    snap.file_path = file_path_;
    snap.file_size = file_size_;
    snap.file_checksum = file_checksum_;
    snap.kind = kind_;
    snap.direction = direction_;
    snap.state = state_;
    snap.bytes_transferred = ranges_.covered();
    snap.start_time = start_time_;
    snap.end_time = end_time_;
    snap.last_error = last_error_;
    return snap;
}

bool Transfer::finish_locked(TransferState terminal, const TransferResult& result) {
    if (is_terminal_state(state_)) {
        return false;
    }

    std::string close_error;
    if (!close_file_locked(&close_error)) {
        LOG_WARN("transfer", "Closing file of transfer " << id_ << " failed: " << close_error);
    }

    state_ = terminal;
    end_time_ = std::chrono::system_clock::now();
    if (!result.success) {
        last_error_ = result;
    }
    return true;
}

bool Transfer::close_file_locked(std::string* error_out) {
    if (!file_.is_open()) {
        return true;
    }
    return file_.close(error_out);
}

} // namespace whisp
