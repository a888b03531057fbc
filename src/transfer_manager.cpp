#include "transfer_manager.h"
#include "checksum.h"
#include "fs.h"
#include "whisp_log_macros.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <random>
#include <sstream>
#include <chrono>

namespace whisp {

namespace {

// Characters refused in incoming file names, NUL included
const char kUnsafeFilenameChars[] = "<>:\"|?*";

TransferResult not_found(const std::string& transfer_id) {
    return TransferResult::Error(TransferErrorCode::NOT_FOUND, "transfer " + transfer_id + " not found");
}

bool is_hex_digest(const std::string& value) {
    if (value.size() != 64) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

//=============================================================================
// TransferManager Implementation
//=============================================================================

TransferManager::TransferManager(const TransferConfig& config)
    : config_(config) {
    initialize();
}

TransferManager::TransferManager(std::shared_ptr<Transport> transport, const TransferConfig& config)
    : config_(config) {
    initialize();
    set_transport(std::move(transport));
}

TransferManager::~TransferManager() {
    LOG_TRANSFER_DEBUG("TransferManager stopping...");

    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        transport = std::move(transport_);
    }
    if (transport) {
        // Stop the transport from calling into a destroyed manager
        transport->on_announce(nullptr);
        transport->on_chunk(nullptr);
        transport->on_pull_request(nullptr);
    }

    events_->stop();
    registry_.clear();

    LOG_TRANSFER_DEBUG("TransferManager stopped");
}

void TransferManager::initialize() {
    if (config_.event_workers > kMaxEventWorkers) {
        LOG_TRANSFER_WARN("event_workers " << config_.event_workers << " exceeds limit, using " << kMaxEventWorkers);
        config_.event_workers = kMaxEventWorkers;
    }
    events_ = std::make_unique<TransportEventQueue>(
        config_.event_workers, config_.event_queue_capacity,
        [this](const TransportEvent& event) { dispatch_event(event); });

    LOG_TRANSFER_INFO("TransferManager initialized (max file size " << config_.max_file_size
                      << " bytes, " << config_.event_workers << " event lanes)");
}

void TransferManager::set_transport(std::shared_ptr<Transport> transport) {
    std::shared_ptr<Transport> previous;
    {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        previous = transport_;
        transport_ = transport;
    }
    if (previous && previous != transport) {
        previous->on_announce(nullptr);
        previous->on_chunk(nullptr);
        previous->on_pull_request(nullptr);
    }
    if (transport) {
        register_transport_callbacks(transport);
    }
}

std::shared_ptr<Transport> TransferManager::get_transport() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return transport_;
}

void TransferManager::set_config(const TransferConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    uint32_t workers = config_.event_workers;
    uint32_t capacity = config_.event_queue_capacity;
    config_ = config;
    // The event queue is built once
    config_.event_workers = workers;
    config_.event_queue_capacity = capacity;
}

TransferConfig TransferManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void TransferManager::set_max_file_size(uint64_t size) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.max_file_size = size;
}

uint64_t TransferManager::get_max_file_size() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_.max_file_size;
}

void TransferManager::set_observer(std::shared_ptr<TransferObserver> observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

std::shared_ptr<Transfer> TransferManager::send_file(PeerId peer_id, const std::string& file_path,
                                                     TransferResult* result_out) {
    auto fail = [&](TransferErrorCode code, const std::string& message) -> std::shared_ptr<Transfer> {
        LOG_TRANSFER_ERROR("Cannot send " << file_path << ": " << message);
        if (result_out) {
            *result_out = TransferResult::Error(code, message);
        }
        return nullptr;
    };

    if (file_path.empty() || !file_exists(file_path)) {
        return fail(TransferErrorCode::FILE_NOT_FOUND, "failed to access file: " + file_path);
    }
    if (is_directory(file_path)) {
        return fail(TransferErrorCode::IS_DIRECTORY, "cannot send directory: " + file_path);
    }
    if (!is_file(file_path)) {
        return fail(TransferErrorCode::INVALID_ARGUMENT, "not a regular file: " + file_path);
    }

    int64_t size = get_file_size(file_path);
    if (size < 0) {
        return fail(TransferErrorCode::IO_ERROR, "failed to read size of " + file_path);
    }

    TransferConfig config = get_config();
    uint64_t file_size = static_cast<uint64_t>(size);
    if (file_size > config.max_file_size) {
        std::ostringstream msg;
        msg << "file size " << file_size << " exceeds maximum allowed size " << config.max_file_size;
        return fail(TransferErrorCode::FILE_TOO_LARGE, msg.str());
    }

    std::string error;
    std::string checksum = compute_file_checksum(file_path, config.io_buffer_size, &error);
    if (checksum.empty()) {
        return fail(TransferErrorCode::IO_ERROR, "failed to compute file checksum: " + error);
    }

    File file = File::open_read(file_path, &error);
    if (!file.is_open()) {
        return fail(TransferErrorCode::IO_ERROR, "failed to open file for reading: " + error);
    }

    std::shared_ptr<Transfer> transfer;
    for (;;) {
        transfer = std::make_shared<Transfer>(allocate_transfer_id(), peer_id, TransferDirection::OUTGOING,
                                              get_filename_from_path(file_path), file_size);
        // Fully populated before the registry publishes it
        {
            std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
            transfer->file_path_ = file_path;
            transfer->file_checksum_ = checksum;
            transfer->file_ = std::move(file);
        }
        if (registry_.add(transfer)) {
            break;
        }
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        file = std::move(transfer->file_);
    }

    LOG_TRANSFER_INFO("Created outgoing transfer " << transfer->id() << " (" << transfer->file_name()
                      << ", " << file_size << " bytes -> peer " << peer_id << ")");

    if (result_out) {
        *result_out = TransferResult::Success();
    }
    return transfer;
}

TransferResult TransferManager::start_send(const std::shared_ptr<Transfer>& transfer) {
    if (!transfer) {
        return TransferResult::Error(TransferErrorCode::INVALID_ARGUMENT, "transfer is null");
    }
    if (registry_.find(transfer->id()) != transfer) {
        return not_found(transfer->id());
    }
    if (transfer->direction() != TransferDirection::OUTGOING) {
        return TransferResult::Error(TransferErrorCode::WRONG_DIRECTION,
                                     "transfer " + transfer->id() + " is not an outgoing transfer");
    }

    std::shared_ptr<Transport> transport = get_transport();
    if (!transport) {
        return TransferResult::Error(TransferErrorCode::NO_TRANSPORT, "no transport attached");
    }

    TransportKey key;
    {
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        if (transfer->state_ != TransferState::PENDING) {
            return TransferResult::Error(TransferErrorCode::INVALID_STATE,
                                         "transfer " + transfer->id() + " is not in pending state");
        }

        FileHandle handle = 0;
        TransferResult announced = transport->initiate(transfer->peer_id(), transfer->kind(), transfer->file_size(),
                                                       make_file_id(transfer->id()), transfer->file_name(), handle);
        if (!announced.success) {
            TransferResult error = TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR,
                                                         "failed to initiate file transfer: " + announced.error_message);
            transfer->finish_locked(TransferState::FAILED, error);
            LOG_TRANSFER_ERROR("Announce of transfer " << transfer->id() << " failed: " << announced.error_message);
            return error;
        }

        transfer->has_file_handle_ = true;
        transfer->file_handle_ = handle;
        transfer->state_ = TransferState::ACTIVE;
        key = TransportKey(transfer->peer_id(), handle);
    }

    if (!registry_.bind(key, transfer)) {
        TransferResult error = TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR,
                                                     "file handle " + std::to_string(key.file_handle) +
                                                     " is already in use for peer " + std::to_string(key.peer_id));
        {
            std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
            transfer->finish_locked(TransferState::FAILED, error);
        }
        LOG_TRANSFER_ERROR("Transfer " << transfer->id() << ": " << error.error_message);

        // The remote already saw the announce
        TransferResult cancelled = transport->control(key.peer_id, key.file_handle, FileControl::CANCEL);
        if (!cancelled.success) {
            LOG_TRANSFER_WARN("Failed to cancel announce of transfer " << transfer->id()
                              << " on peer " << key.peer_id << ": " << cancelled.error_message);
        }
        return error;
    }

    // A concurrent cancel may have finished the transfer before the binding existed
    if (transfer->is_complete()) {
        registry_.unbind(key, transfer.get());
    }

    LOG_TRANSFER_INFO("Announced transfer " << transfer->id() << " to peer " << key.peer_id
                      << " (file handle " << key.file_handle << ")");
    return TransferResult::Success();
}

TransferResult TransferManager::accept_incoming(const std::string& transfer_id, const std::string& save_dir) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }
    if (transfer->direction() != TransferDirection::INCOMING) {
        return TransferResult::Error(TransferErrorCode::WRONG_DIRECTION,
                                     "transfer " + transfer_id + " is not an incoming transfer");
    }

    TransferConfig config = get_config();
    const std::string directory = save_dir.empty() ? config.download_directory : save_dir;

    bool completed = false;
    TransferResult completion;
    TransportKey key;
    {
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        if (transfer->state_ != TransferState::PENDING) {
            return TransferResult::Error(TransferErrorCode::INVALID_STATE,
                                         "transfer " + transfer_id + " is not in pending state");
        }

        TransferResult valid = validate_incoming_filename(transfer->file_name());
        if (!valid.success) {
            LOG_TRANSFER_WARN("Refusing to accept transfer " << transfer_id << ": " << valid.error_message);
            return valid;
        }

        if (directory.empty() || !create_directories(directory, 0700)) {
            return TransferResult::Error(TransferErrorCode::IO_ERROR,
                                         "failed to create save directory: " + directory);
        }

        const std::string save_path = combine_paths(directory, transfer->file_name());
        std::string error;
        File file = File::create_private(save_path, &error);
        if (!file.is_open()) {
            return TransferResult::Error(TransferErrorCode::IO_ERROR,
                                         "failed to create file for writing: " + error);
        }

        transfer->file_path_ = save_path;
        transfer->file_ = std::move(file);
        transfer->state_ = TransferState::ACTIVE;
        key = TransportKey(transfer->peer_id(), transfer->file_handle_);

        LOG_TRANSFER_INFO("Accepted transfer " << transfer_id << " into " << save_path);

        // Nothing will arrive for an empty file
        if (transfer->file_size() == 0) {
            completion = complete_incoming_locked(*transfer, config);
            completed = true;
        }
    }

    if (completed) {
        release_binding(transfer, key);
        notify_complete(transfer, completion);
    }
    return TransferResult::Success();
}

TransferResult TransferManager::pause_transfer(const std::string& transfer_id) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }

    std::shared_ptr<Transport> transport = get_transport();

    std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
    if (transfer->state_ != TransferState::ACTIVE) {
        return TransferResult::Error(TransferErrorCode::INVALID_STATE, "transfer " + transfer_id + " is not active");
    }
    if (!transport) {
        return TransferResult::Error(TransferErrorCode::NO_TRANSPORT, "no transport attached");
    }

    TransferResult sent = transport->control(transfer->peer_id(), transfer->file_handle_, FileControl::PAUSE);
    if (!sent.success) {
        return TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR,
                                     "failed to pause transfer: " + sent.error_message);
    }

    transfer->state_ = TransferState::PAUSED;
    LOG_TRANSFER_INFO("Paused transfer " << transfer_id);
    return TransferResult::Success();
}

TransferResult TransferManager::resume_transfer(const std::string& transfer_id) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }

    std::shared_ptr<Transport> transport = get_transport();

    std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
    if (transfer->state_ != TransferState::PAUSED) {
        return TransferResult::Error(TransferErrorCode::INVALID_STATE, "transfer " + transfer_id + " is not paused");
    }
    if (!transport) {
        return TransferResult::Error(TransferErrorCode::NO_TRANSPORT, "no transport attached");
    }

    TransferResult sent = transport->control(transfer->peer_id(), transfer->file_handle_, FileControl::RESUME);
    if (!sent.success) {
        return TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR,
                                     "failed to resume transfer: " + sent.error_message);
    }

    transfer->state_ = TransferState::ACTIVE;
    LOG_TRANSFER_INFO("Resumed transfer " << transfer_id);
    return TransferResult::Success();
}

TransferResult TransferManager::cancel_transfer(const std::string& transfer_id) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }

    std::shared_ptr<Transport> transport = get_transport();

    bool bound = false;
    TransportKey key;
    {
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        if (is_terminal_state(transfer->state_)) {
            return TransferResult::Error(TransferErrorCode::INVALID_STATE,
                                         "transfer " + transfer_id + " is already complete");
        }

        // An outgoing transfer that was never announced has nobody to tell
        if (transfer->has_file_handle_) {
            bound = true;
            key = TransportKey(transfer->peer_id(), transfer->file_handle_);
            if (transport) {
                TransferResult sent = transport->control(key.peer_id, key.file_handle, FileControl::CANCEL);
                if (!sent.success) {
                    LOG_TRANSFER_WARN("Remote cancel of transfer " << transfer_id << " failed: "
                                      << sent.error_message << "; cancelling locally");
                }
            }
        }

        std::string error;
        if (!transfer->close_file_locked(&error)) {
            LOG_TRANSFER_WARN("Closing file of transfer " << transfer_id << " failed: " << error);
        }

        if (transfer->direction() == TransferDirection::INCOMING && !transfer->file_path_.empty()) {
            if (file_exists(transfer->file_path_) && !delete_file(transfer->file_path_)) {
                LOG_TRANSFER_WARN("Failed to remove partial file " << transfer->file_path_);
            }
        }

        transfer->finish_locked(TransferState::CANCELLED, TransferResult::Success());
    }

    if (bound) {
        release_binding(transfer, key);
    }

    LOG_TRANSFER_INFO("Cancelled transfer " << transfer_id);
    return TransferResult::Success();
}

std::shared_ptr<Transfer> TransferManager::get_transfer(const std::string& transfer_id) const {
    return registry_.find(transfer_id);
}

std::vector<std::shared_ptr<Transfer>> TransferManager::get_active_transfers() const {
    std::vector<std::shared_ptr<Transfer>> active;
    for (const auto& transfer : registry_.all()) {
        TransferState state = transfer->state();
        if (state == TransferState::ACTIVE || state == TransferState::PAUSED) {
            active.push_back(transfer);
        }
    }
    return active;
}

std::vector<std::shared_ptr<Transfer>> TransferManager::get_transfers_by_peer(PeerId peer_id) const {
    return registry_.by_peer(peer_id);
}

nlohmann::json TransferManager::get_statistics() const {
    nlohmann::json states = {
        {"pending", 0}, {"active", 0}, {"paused", 0},
        {"completed", 0}, {"failed", 0}, {"cancelled", 0}
    };

    uint64_t total = 0;
    uint64_t outgoing = 0;
    uint64_t incoming = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t files_sent = 0;
    uint64_t files_received = 0;

    for (const auto& transfer : registry_.all()) {
        TransferSnapshot snap = transfer->snapshot();
        ++total;
        states[transfer_state_to_string(snap.state)] = states[transfer_state_to_string(snap.state)].get<uint64_t>() + 1;

        if (snap.direction == TransferDirection::OUTGOING) {
            ++outgoing;
            bytes_sent += snap.bytes_transferred;
            if (snap.state == TransferState::COMPLETED) ++files_sent;
        } else {
            ++incoming;
            bytes_received += snap.bytes_transferred;
            if (snap.state == TransferState::COMPLETED) ++files_received;
        }
    }

    nlohmann::json stats;
    stats["total_transfers"] = total;
    stats["outgoing_transfers"] = outgoing;
    stats["incoming_transfers"] = incoming;
    stats["states"] = states;
    stats["total_bytes_sent"] = bytes_sent;
    stats["total_bytes_received"] = bytes_received;
    stats["total_files_sent"] = files_sent;
    stats["total_files_received"] = files_received;
    stats["queued_events"] = events_->pending();
    return stats;
}

TransferResult TransferManager::set_progress_callback(const std::string& transfer_id, TransferProgressCallback callback) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }
    std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
    transfer->progress_callback_ = std::move(callback);
    return TransferResult::Success();
}

TransferResult TransferManager::set_completion_callback(const std::string& transfer_id, TransferCompletionCallback callback) {
    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }
    std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
    transfer->completion_callback_ = std::move(callback);
    return TransferResult::Success();
}

TransferResult TransferManager::set_expected_checksum(const std::string& transfer_id, const std::string& checksum) {
    if (!is_hex_digest(checksum)) {
        return TransferResult::Error(TransferErrorCode::INVALID_ARGUMENT, "checksum must be 64 hex characters");
    }

    std::shared_ptr<Transfer> transfer = registry_.find(transfer_id);
    if (!transfer) {
        return not_found(transfer_id);
    }
    if (transfer->direction() != TransferDirection::INCOMING) {
        return TransferResult::Error(TransferErrorCode::WRONG_DIRECTION,
                                     "transfer " + transfer_id + " is not an incoming transfer");
    }

    std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
    if (is_terminal_state(transfer->state_)) {
        return TransferResult::Error(TransferErrorCode::INVALID_STATE,
                                     "transfer " + transfer_id + " is already complete");
    }

    std::string lowered = checksum;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    transfer->expected_checksum_ = lowered;
    return TransferResult::Success();
}

void TransferManager::flush_events() {
    events_->drain();
}

TransferResult TransferManager::validate_incoming_filename(const std::string& file_name) {
    if (file_name.empty()) {
        return TransferResult::Error(TransferErrorCode::UNSAFE_FILENAME, "invalid filename: empty");
    }

    std::string clean = get_filename_from_path(file_name);
    if (clean != file_name || clean == "." || clean == "..") {
        return TransferResult::Error(TransferErrorCode::UNSAFE_FILENAME,
                                     "invalid filename: contains path traversal sequences");
    }

    if (clean.find('\0') != std::string::npos ||
        clean.find_first_of(kUnsafeFilenameChars) != std::string::npos) {
        return TransferResult::Error(TransferErrorCode::UNSAFE_FILENAME,
                                     "invalid filename: contains dangerous characters");
    }

    return TransferResult::Success();
}

std::string TransferManager::generate_transfer_id() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        ss << dis(gen);
    }

    return ss.str();
}

FileId TransferManager::make_file_id(const std::string& transfer_id) {
    FileId file_id{};
    std::memcpy(file_id.data(), transfer_id.data(), std::min(transfer_id.size(), file_id.size()));
    return file_id;
}

std::string TransferManager::allocate_transfer_id() const {
    std::string id = generate_transfer_id();
    while (registry_.contains(id)) {
        id = generate_transfer_id();
    }
    return id;
}

} // namespace whisp
