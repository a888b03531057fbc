#pragma once

/**
 * @file transfer_manager.h
 * @brief Registry and orchestrator for peer file transfers
 */

#include "transfer.h"
#include "transfer_config.h"
#include "transfer_observer.h"
#include "transfer_registry.h"
#include "transport.h"
#include "transport_event_queue.h"

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace whisp {

/**
 * File transfer manager class
 *
 * Owns every transfer, exposes the lifecycle operations and services the
 * Transport's announce, chunk and pull-request events.
 *
 * Locking: the registry lock and a transfer's lock are never held together.
 * The registry is consulted and released before the transfer is locked.
 * Transport calls may be made while a transfer lock is held, so a Transport
 * must not invoke its callbacks synchronously from inside initiate,
 * push_chunk or control.
 */
class TransferManager {
public:
    /**
     * Constructor
     * @param config Transfer configuration settings. Event queue settings
     *        are fixed for the lifetime of the manager.
     */
    explicit TransferManager(const TransferConfig& config = TransferConfig());

    /**
     * Constructor attaching a transport right away
     * @param transport Peer-messaging layer used for announces, chunks and control
     * @param config Transfer configuration settings
     */
    TransferManager(std::shared_ptr<Transport> transport, const TransferConfig& config = TransferConfig());

    /**
     * Destructor. Detaches from the transport and stops event servicing;
     * open files are closed.
     */
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Configuration
    /**
     * Attach the transport and register for its events
     * @param transport Transport to drive; replaces and detaches any previous one
     */
    void set_transport(std::shared_ptr<Transport> transport);
    std::shared_ptr<Transport> get_transport() const;

    void set_config(const TransferConfig& config);
    TransferConfig get_config() const;

    void set_max_file_size(uint64_t size);
    uint64_t get_max_file_size() const;

    /**
     * Attach an observer that sees every transfer of this manager
     * @param observer Observer, or nullptr to detach
     */
    void set_observer(std::shared_ptr<TransferObserver> observer);

    // File transfer operations
    /**
     * Create an outgoing transfer for a local file
     *
     * Validates the path, computes the file digest and opens the file. The
     * transfer is registered as PENDING; the transport is not contacted.
     *
     * @param peer_id Target peer
     * @param file_path Local file path to send
     * @param result_out Optional detailed outcome
     * @return The new transfer, or nullptr on failure
     */
    std::shared_ptr<Transfer> send_file(PeerId peer_id, const std::string& file_path,
                                        TransferResult* result_out = nullptr);

    /**
     * Announce a pending outgoing transfer through the transport
     * @param transfer Transfer returned by send_file
     * @return Success once the transfer is ACTIVE
     */
    TransferResult start_send(const std::shared_ptr<Transfer>& transfer);

    /**
     * Accept a pending incoming transfer
     * @param transfer_id Transfer identifier
     * @param save_dir Destination directory; empty uses the configured download directory
     * @return Success once the destination file is open and the transfer ACTIVE
     */
    TransferResult accept_incoming(const std::string& transfer_id, const std::string& save_dir = "");

    // Transfer control
    TransferResult pause_transfer(const std::string& transfer_id);
    TransferResult resume_transfer(const std::string& transfer_id);

    /**
     * Cancel a transfer that is not yet complete.
     * The remote is signalled best-effort; local cancellation always proceeds.
     * A partial incoming file is deleted.
     */
    TransferResult cancel_transfer(const std::string& transfer_id);

    // Information and monitoring
    std::shared_ptr<Transfer> get_transfer(const std::string& transfer_id) const;

    /**
     * @return Transfers currently ACTIVE or PAUSED
     */
    std::vector<std::shared_ptr<Transfer>> get_active_transfers() const;

    std::vector<std::shared_ptr<Transfer>> get_transfers_by_peer(PeerId peer_id) const;

    /**
     * Get statistics about transfers
     * @return JSON object with per-state and per-direction counts and byte totals
     */
    nlohmann::json get_statistics() const;

    // Callback registration
    TransferResult set_progress_callback(const std::string& transfer_id, TransferProgressCallback callback);
    TransferResult set_completion_callback(const std::string& transfer_id, TransferCompletionCallback callback);

    /**
     * Record the digest the remote advertised for an incoming transfer.
     * It is compared with the digest of the received file on completion.
     * @param checksum 64 hex characters
     */
    TransferResult set_expected_checksum(const std::string& transfer_id, const std::string& checksum);

    /**
     * Block until all queued transport events have been serviced.
     * Must not be called from a transfer callback.
     */
    void flush_events();

    // Utility functions
    /**
     * Check an announced file name before any path is built from it
     * @return Success, or UNSAFE_FILENAME
     */
    static TransferResult validate_incoming_filename(const std::string& file_name);

    /**
     * @return 32 random lowercase hex characters
     */
    static std::string generate_transfer_id();

    static FileId make_file_id(const std::string& transfer_id);

private:
    void initialize();
    std::string allocate_transfer_id() const;

    // Transport event servicing (transfer_manager_events.cpp)
    void register_transport_callbacks(const std::shared_ptr<Transport>& transport);
    void dispatch_event(const TransportEvent& event);
    void handle_announce(PeerId peer_id, FileHandle file_handle, FileKind kind,
                         uint64_t file_size, const std::string& file_name);
    void handle_chunk(PeerId peer_id, FileHandle file_handle, uint64_t position,
                      const std::vector<uint8_t>& data);
    void handle_pull_request(PeerId peer_id, FileHandle file_handle, uint64_t position, size_t length);

    /**
     * Close, hash and finish a fully written incoming transfer.
     * Expects the transfer lock to be held exclusively.
     */
    TransferResult complete_incoming_locked(Transfer& transfer, const TransferConfig& config);

    /**
     * Fail a transfer from an event handler.
     * Expects the transfer lock to be held exclusively.
     */
    void fail_locked(Transfer& transfer, const TransferResult& error);

    void notify_progress(const std::shared_ptr<Transfer>& transfer);
    void notify_complete(const std::shared_ptr<Transfer>& transfer, const TransferResult& result);
    void notify_incoming(const std::shared_ptr<Transfer>& transfer);
    void release_binding(const std::shared_ptr<Transfer>& transfer, const TransportKey& key);

    mutable std::mutex config_mutex_;
    TransferConfig config_;

    mutable std::mutex transport_mutex_;
    std::shared_ptr<Transport> transport_;

    mutable std::mutex observer_mutex_;
    std::shared_ptr<TransferObserver> observer_;

    TransferRegistry registry_;
    std::unique_ptr<TransportEventQueue> events_;
};

} // namespace whisp
