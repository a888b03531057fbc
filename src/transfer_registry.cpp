#include "transfer_registry.h"

#include <mutex>

namespace whisp {

bool TransferRegistry::add(const std::shared_ptr<Transfer>& transfer) {
    if (!transfer) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return by_id_.emplace(transfer->id(), transfer).second;
}

bool TransferRegistry::add_and_bind(const std::shared_ptr<Transfer>& transfer, const TransportKey& key) {
    if (!transfer) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (by_id_.count(transfer->id()) != 0 || by_key_.count(key) != 0) {
        return false;
    }
    by_id_.emplace(transfer->id(), transfer);
    by_key_.emplace(key, transfer);
    return true;
}

bool TransferRegistry::bind(const TransportKey& key, const std::shared_ptr<Transfer>& transfer) {
    if (!transfer) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_key_.find(key);
    if (it != by_key_.end()) {
        return it->second == transfer;
    }
    by_key_.emplace(key, transfer);
    return true;
}

bool TransferRegistry::unbind(const TransportKey& key, const Transfer* expected) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_key_.find(key);
    if (it == by_key_.end() || it->second.get() != expected) {
        return false;
    }
    by_key_.erase(it);
    return true;
}

std::shared_ptr<Transfer> TransferRegistry::find(const std::string& transfer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(transfer_id);
    return it != by_id_.end() ? it->second : nullptr;
}

std::shared_ptr<Transfer> TransferRegistry::find(const TransportKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_key_.find(key);
    return it != by_key_.end() ? it->second : nullptr;
}

bool TransferRegistry::contains(const std::string& transfer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.count(transfer_id) != 0;
}

std::vector<std::shared_ptr<Transfer>> TransferRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Transfer>> result;
    result.reserve(by_id_.size());
    for (const auto& entry : by_id_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<std::shared_ptr<Transfer>> TransferRegistry::by_peer(PeerId peer_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Transfer>> result;
    for (const auto& entry : by_id_) {
        if (entry.second->peer_id() == peer_id) {
            result.push_back(entry.second);
        }
    }
    return result;
}

size_t TransferRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.size();
}

size_t TransferRegistry::bound_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_key_.size();
}

void TransferRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_key_.clear();
    by_id_.clear();
}

} // namespace whisp
