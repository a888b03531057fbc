#include "transfer_manager.h"
#include "checksum.h"
#include "fs.h"
#include "whisp_log_macros.h"

#include <algorithm>
#include <sstream>

namespace whisp {

//=============================================================================
// Transport event servicing
//=============================================================================

void TransferManager::register_transport_callbacks(const std::shared_ptr<Transport>& transport) {
    transport->on_announce([this](PeerId peer_id, FileHandle file_handle, FileKind kind,
                                  uint64_t file_size, const std::string& file_name) {
        if (!events_->post(TransportEvent::announce(peer_id, file_handle, kind, file_size, file_name))) {
            LOG_EVENTS_DEBUG("Dropped announce from peer " << peer_id << ": event queue stopped");
        }
    });

    transport->on_chunk([this](PeerId peer_id, FileHandle file_handle, uint64_t position,
                               const std::vector<uint8_t>& data) {
        if (!events_->post(TransportEvent::chunk(peer_id, file_handle, position, data))) {
            LOG_EVENTS_DEBUG("Dropped chunk from peer " << peer_id << ": event queue stopped");
        }
    });

    transport->on_pull_request([this](PeerId peer_id, FileHandle file_handle, uint64_t position, size_t length) {
        if (!events_->post(TransportEvent::pull_request(peer_id, file_handle, position, length))) {
            LOG_EVENTS_DEBUG("Dropped pull request from peer " << peer_id << ": event queue stopped");
        }
    });
}

void TransferManager::dispatch_event(const TransportEvent& event) {
    switch (event.type) {
        case TransportEventType::ANNOUNCE:
            handle_announce(event.peer_id, event.file_handle, event.kind, event.file_size, event.file_name);
            break;
        case TransportEventType::CHUNK:
            handle_chunk(event.peer_id, event.file_handle, event.position, event.data);
            break;
        case TransportEventType::PULL_REQUEST:
            handle_pull_request(event.peer_id, event.file_handle, event.position, event.length);
            break;
    }
}

void TransferManager::handle_announce(PeerId peer_id, FileHandle file_handle, FileKind kind,
                                      uint64_t file_size, const std::string& file_name) {
    TransferConfig config = get_config();
    TransportKey key(peer_id, file_handle);

    LOG_TRANSFER_INFO("Peer " << peer_id << " announced file " << file_name << " (" << file_size
                      << " bytes, file handle " << file_handle << ")");

    if (file_size > config.max_file_size) {
        LOG_TRANSFER_WARN("Rejecting announced file from peer " << peer_id << ": size " << file_size
                          << " exceeds maximum allowed size " << config.max_file_size);
        std::shared_ptr<Transport> transport = get_transport();
        if (transport) {
            TransferResult sent = transport->control(peer_id, file_handle, FileControl::CANCEL);
            if (!sent.success) {
                LOG_TRANSFER_DEBUG("Rejection of file handle " << file_handle << " not delivered: "
                                   << sent.error_message);
            }
        }
        return;
    }

    std::shared_ptr<Transfer> existing = registry_.find(key);
    if (existing) {
        if (!existing->is_complete()) {
            LOG_TRANSFER_WARN("Ignoring duplicate announce for file handle " << file_handle
                              << " of peer " << peer_id << " (transfer " << existing->id() << ")");
            return;
        }
        registry_.unbind(key, existing.get());
    }

    std::shared_ptr<Transfer> transfer;
    for (;;) {
        transfer = std::make_shared<Transfer>(allocate_transfer_id(), peer_id, TransferDirection::INCOMING,
                                              file_name, file_size, kind);
        {
            std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
            transfer->has_file_handle_ = true;
            transfer->file_handle_ = file_handle;
        }

        if (registry_.add_and_bind(transfer, key)) {
            break;
        }
        if (!registry_.contains(transfer->id())) {
            LOG_TRANSFER_WARN("Ignoring announce for file handle " << file_handle << " of peer " << peer_id
                              << ": handle already in use");
            return;
        }
    }

    LOG_TRANSFER_INFO("Created incoming transfer " << transfer->id() << " (" << file_name << ", "
                      << file_size << " bytes <- peer " << peer_id << ")");

    notify_incoming(transfer);

    if (config.auto_accept_max_size > 0 && file_size > 0 && file_size <= config.auto_accept_max_size) {
        TransferResult accepted = accept_incoming(transfer->id(), config.download_directory);
        if (!accepted.success) {
            LOG_TRANSFER_WARN("Auto-accept of transfer " << transfer->id() << " failed: "
                              << accepted.error_message);
        }
    }
}

void TransferManager::handle_chunk(PeerId peer_id, FileHandle file_handle, uint64_t position,
                                   const std::vector<uint8_t>& data) {
    TransportKey key(peer_id, file_handle);
    std::shared_ptr<Transfer> transfer = registry_.find(key);
    if (!transfer) {
        LOG_TRANSFER_DEBUG("Ignoring chunk for unknown file handle " << file_handle << " of peer " << peer_id);
        return;
    }

    TransferConfig config = get_config();
    bool progressed = false;
    bool finished = false;
    TransferResult result;
    {
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        if (transfer->state_ != TransferState::ACTIVE || !transfer->file_.is_open()) {
            LOG_TRANSFER_DEBUG("Ignoring chunk for transfer " << transfer->id() << " in state "
                               << transfer_state_to_string(transfer->state_));
            return;
        }
        if (data.empty()) {
            return;
        }

        const uint64_t length = data.size();
        if (position > transfer->file_size() || length > transfer->file_size() - position) {
            std::ostringstream msg;
            msg << "chunk at " << position << " of " << length << " bytes exceeds file size "
                << transfer->file_size();
            result = TransferResult::Error(TransferErrorCode::IO_ERROR, msg.str());
            fail_locked(*transfer, result);
            finished = true;
        } else {
            std::string error;
            if (!transfer->file_.seek(position, &error) ||
                !transfer->file_.write(data.data(), data.size(), &error)) {
                result = TransferResult::Error(TransferErrorCode::IO_ERROR, "failed to write chunk: " + error);
                fail_locked(*transfer, result);
                finished = true;
            } else {
                progressed = transfer->ranges_.add(position, length) > 0;
                if (transfer->ranges_.covered() >= transfer->file_size()) {
                    result = complete_incoming_locked(*transfer, config);
                    finished = true;
                }
            }
        }
    }

    if (progressed) {
        notify_progress(transfer);
    }
    if (finished) {
        release_binding(transfer, key);
        notify_complete(transfer, result);
    }
}

void TransferManager::handle_pull_request(PeerId peer_id, FileHandle file_handle, uint64_t position, size_t length) {
    TransportKey key(peer_id, file_handle);
    std::shared_ptr<Transfer> transfer = registry_.find(key);
    if (!transfer) {
        LOG_TRANSFER_DEBUG("Ignoring pull request for unknown file handle " << file_handle
                           << " of peer " << peer_id);
        return;
    }

    std::shared_ptr<Transport> transport = get_transport();

    bool progressed = false;
    bool finished = false;
    TransferResult result;
    {
        std::unique_lock<std::shared_mutex> lock(transfer->mutex_);
        if (transfer->state_ != TransferState::ACTIVE) {
            LOG_TRANSFER_DEBUG("Ignoring pull request for transfer " << transfer->id() << " in state "
                               << transfer_state_to_string(transfer->state_));
            return;
        }

        if (length == 0) {
            // The remote has everything
            transfer->finish_locked(TransferState::COMPLETED, TransferResult::Success());
            result = TransferResult::Success();
            finished = true;
            LOG_TRANSFER_INFO("Transfer " << transfer->id() << " completed ("
                              << transfer->ranges_.covered() << " bytes sent)");
        } else if (position >= transfer->file_size()) {
            LOG_TRANSFER_DEBUG("Ignoring pull request past end of transfer " << transfer->id()
                               << " (position " << position << ")");
            return;
        } else {
            const uint64_t remaining = transfer->file_size() - position;
            const size_t to_read = static_cast<size_t>(std::min<uint64_t>(length, remaining));
            std::vector<uint8_t> buffer(to_read);

            std::string error;
            int64_t bytes_read = -1;
            if (transfer->file_.seek(position, &error)) {
                bytes_read = transfer->file_.read(buffer.data(), buffer.size(), &error);
            }

            if (bytes_read < 0) {
                result = TransferResult::Error(TransferErrorCode::IO_ERROR, "failed to read chunk: " + error);
                fail_locked(*transfer, result);
                finished = true;
            } else if (bytes_read == 0) {
                result = TransferResult::Error(TransferErrorCode::IO_ERROR,
                                               "unexpected end of file at position " + std::to_string(position));
                fail_locked(*transfer, result);
                finished = true;
            } else if (!transport) {
                result = TransferResult::Error(TransferErrorCode::NO_TRANSPORT, "no transport attached");
                fail_locked(*transfer, result);
                finished = true;
            } else {
                buffer.resize(static_cast<size_t>(bytes_read));
                TransferResult pushed = transport->push_chunk(peer_id, file_handle, position, buffer);
                if (!pushed.success) {
                    result = TransferResult::Error(TransferErrorCode::TRANSPORT_ERROR,
                                                   "failed to send chunk: " + pushed.error_message);
                    fail_locked(*transfer, result);
                    finished = true;
                } else {
                    progressed = transfer->ranges_.add(position, buffer.size()) > 0;
                }
            }
        }
    }

    if (progressed) {
        notify_progress(transfer);
    }
    if (finished) {
        release_binding(transfer, key);
        notify_complete(transfer, result);
    }
}

TransferResult TransferManager::complete_incoming_locked(Transfer& transfer, const TransferConfig& config) {
    std::string error;
    if (!transfer.close_file_locked(&error)) {
        TransferResult failure = TransferResult::Error(TransferErrorCode::IO_ERROR,
                                                       "failed to finalize file: " + error);
        fail_locked(transfer, failure);
        return failure;
    }

    std::string checksum = compute_file_checksum(transfer.file_path_, config.io_buffer_size, &error);
    if (checksum.empty()) {
        TransferResult failure = TransferResult::Error(TransferErrorCode::IO_ERROR,
                                                       "failed to compute file checksum: " + error);
        fail_locked(transfer, failure);
        return failure;
    }
    transfer.file_checksum_ = checksum;

    if (!transfer.expected_checksum_.empty() && !checksums_equal(checksum, transfer.expected_checksum_)) {
        TransferResult mismatch = TransferResult::Error(TransferErrorCode::CHECKSUM_MISMATCH,
                                                        "checksum mismatch: expected " + transfer.expected_checksum_ +
                                                        ", got " + checksum);
        if (config.checksum_policy == ChecksumPolicy::FAIL_ON_MISMATCH) {
            fail_locked(transfer, mismatch);
        } else {
            LOG_TRANSFER_WARN("Transfer " << transfer.id() << " completed with mismatching checksum");
            transfer.finish_locked(TransferState::COMPLETED, mismatch);
        }
        return mismatch;
    }

    transfer.finish_locked(TransferState::COMPLETED, TransferResult::Success());
    LOG_TRANSFER_INFO("Transfer " << transfer.id() << " completed (" << transfer.file_size()
                      << " bytes received into " << transfer.file_path_ << ")");
    return TransferResult::Success();
}

void TransferManager::fail_locked(Transfer& transfer, const TransferResult& error) {
    if (transfer.finish_locked(TransferState::FAILED, error)) {
        LOG_TRANSFER_ERROR("Transfer " << transfer.id() << " failed: " << error.error_message);
    }
}

void TransferManager::notify_progress(const std::shared_ptr<Transfer>& transfer) {
    TransferProgressCallback callback;
    {
        std::shared_lock<std::shared_mutex> lock(transfer->mutex_);
        callback = transfer->progress_callback_;
    }
    std::shared_ptr<TransferObserver> observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }

    if (callback) {
        callback(*transfer);
    }
    if (observer) {
        observer->on_progress(*transfer);
    }
}

void TransferManager::notify_complete(const std::shared_ptr<Transfer>& transfer, const TransferResult& result) {
    TransferCompletionCallback callback;
    {
        std::shared_lock<std::shared_mutex> lock(transfer->mutex_);
        callback = transfer->completion_callback_;
    }
    std::shared_ptr<TransferObserver> observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }

    if (callback) {
        callback(*transfer, result);
    }
    if (observer) {
        observer->on_complete(*transfer, result);
    }
}

void TransferManager::notify_incoming(const std::shared_ptr<Transfer>& transfer) {
    std::shared_ptr<TransferObserver> observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer->on_incoming(*transfer);
    }
}

void TransferManager::release_binding(const std::shared_ptr<Transfer>& transfer, const TransportKey& key) {
    if (registry_.unbind(key, transfer.get())) {
        LOG_TRANSFER_DEBUG("Released file handle " << key.file_handle << " of peer " << key.peer_id);
    }
}

} // namespace whisp
