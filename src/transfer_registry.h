#pragma once

/**
 * @file transfer_registry.h
 * @brief Index of all transfers by ID and by (peer, file handle)
 */

#include "transfer.h"

#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include <shared_mutex>

namespace whisp {

/**
 * Monitor holding the two transfer indices.
 *
 * Only immutable transfer fields are read while the registry lock is held,
 * so a caller never holds the registry lock and a transfer lock together.
 */
class TransferRegistry {
public:
    TransferRegistry() = default;

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * Register a transfer under its ID
     * @return false if the ID is already registered
     */
    bool add(const std::shared_ptr<Transfer>& transfer);

    /**
     * Register a transfer under its ID and bind it to a transport key in one step
     * @return false (and nothing registered) if the ID or the key is taken
     */
    bool add_and_bind(const std::shared_ptr<Transfer>& transfer, const TransportKey& key);

    /**
     * Bind a transport key to a registered transfer
     * @return false if the key is bound to another transfer
     */
    bool bind(const TransportKey& key, const std::shared_ptr<Transfer>& transfer);

    /**
     * Remove a key binding if it still points at the given transfer
     * @return true if a binding was removed
     */
    bool unbind(const TransportKey& key, const Transfer* expected);

    std::shared_ptr<Transfer> find(const std::string& transfer_id) const;
    std::shared_ptr<Transfer> find(const TransportKey& key) const;
    bool contains(const std::string& transfer_id) const;

    std::vector<std::shared_ptr<Transfer>> all() const;
    std::vector<std::shared_ptr<Transfer>> by_peer(PeerId peer_id) const;

    size_t size() const;
    size_t bound_count() const;

    // Drop every transfer and binding
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Transfer>> by_id_;
    std::unordered_map<TransportKey, std::shared_ptr<Transfer>, TransportKeyHash> by_key_;
};

} // namespace whisp
