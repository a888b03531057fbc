#include "transport_event_queue.h"
#include "whisp_log_macros.h"

#include <exception>
#include <system_error>

namespace whisp {

TransportEvent TransportEvent::announce(PeerId peer, FileHandle handle, FileKind kind,
                                        uint64_t size, const std::string& name) {
    TransportEvent event;
    event.type = TransportEventType::ANNOUNCE;
    event.peer_id = peer;
    event.file_handle = handle;
    event.kind = kind;
    event.file_size = size;
    event.file_name = name;
    return event;
}

TransportEvent TransportEvent::chunk(PeerId peer, FileHandle handle, uint64_t position,
                                     std::vector<uint8_t> data) {
    TransportEvent event;
    event.type = TransportEventType::CHUNK;
    event.peer_id = peer;
    event.file_handle = handle;
    event.position = position;
    event.length = data.size();
    event.data = std::move(data);
    return event;
}

TransportEvent TransportEvent::pull_request(PeerId peer, FileHandle handle, uint64_t position, size_t length) {
    TransportEvent event;
    event.type = TransportEventType::PULL_REQUEST;
    event.peer_id = peer;
    event.file_handle = handle;
    event.position = position;
    event.length = length;
    return event;
}

TransportEventQueue::TransportEventQueue(size_t lanes, size_t capacity, TransportEventHandler handler)
    : capacity_(capacity == 0 ? 1 : capacity), handler_(std::move(handler)), running_(true) {
    lanes_.reserve(lanes);
    for (size_t i = 0; i < lanes; ++i) {
        lanes_.push_back(std::make_unique<Lane>());
    }
    // Start workers only once every lane exists
    try {
        for (auto& lane : lanes_) {
            Lane* raw = lane.get();
            lane->worker = std::thread([this, raw] { worker_loop(*raw); });
        }
    } catch (const std::system_error& e) {
        LOG_EVENTS_ERROR("Failed to start transport event workers: " << e.what());
        // Join the lanes that did start; the destructor will not run
        stop();
        throw;
    }

    LOG_EVENTS_DEBUG("Transport event queue started with " << lanes << " lanes, capacity " << capacity_);
}

TransportEventQueue::~TransportEventQueue() {
    stop();
}

bool TransportEventQueue::post(TransportEvent event) {
    if (!running_.load()) {
        return false;
    }

    if (lanes_.empty()) {
        dispatch(event);
        return true;
    }

    Lane& lane = *lanes_[lane_index(event.key())];
    std::unique_lock<std::mutex> lock(lane.mutex);
    lane.not_full.wait(lock, [this, &lane] {
        return lane.events.size() < capacity_ || !running_.load();
    });

    if (!running_.load()) {
        return false;
    }

    lane.events.push_back(std::move(event));
    lock.unlock();
    lane.not_empty.notify_one();
    return true;
}

void TransportEventQueue::drain() {
    for (auto& lane : lanes_) {
        std::unique_lock<std::mutex> lock(lane->mutex);
        lane->idle.wait(lock, [this, &lane] {
            return (lane->events.empty() && !lane->busy) || !running_.load();
        });
    }
}

void TransportEventQueue::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_EVENTS_DEBUG("Stopping transport event queue");

    for (auto& lane : lanes_) {
        {
            // Lock so that no waiter misses the running_ change
            std::lock_guard<std::mutex> lock(lane->mutex);
        }
        lane->not_empty.notify_all();
        lane->not_full.notify_all();
        lane->idle.notify_all();
    }

    for (auto& lane : lanes_) {
        if (lane->worker.joinable()) {
            lane->worker.join();
        }
        std::lock_guard<std::mutex> lock(lane->mutex);
        if (!lane->events.empty()) {
            LOG_EVENTS_WARN("Discarding " << lane->events.size() << " queued transport events");
            lane->events.clear();
        }
    }
}

size_t TransportEventQueue::pending() const {
    size_t total = 0;
    for (const auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane->mutex);
        total += lane->events.size();
    }
    return total;
}

void TransportEventQueue::worker_loop(Lane& lane) {
    while (running_.load()) {
        std::unique_lock<std::mutex> lock(lane.mutex);
        lane.not_empty.wait(lock, [this, &lane] { return !lane.events.empty() || !running_.load(); });

        if (!running_.load()) {
            break;
        }

        TransportEvent event = std::move(lane.events.front());
        lane.events.pop_front();
        lane.busy = true;
        lock.unlock();
        lane.not_full.notify_one();

        dispatch(event);

        lock.lock();
        lane.busy = false;
        if (lane.events.empty()) {
            lane.idle.notify_all();
        }
    }

    std::lock_guard<std::mutex> lock(lane.mutex);
    lane.busy = false;
    lane.idle.notify_all();
}

void TransportEventQueue::dispatch(const TransportEvent& event) {
    if (!handler_) {
        return;
    }
    try {
        handler_(event);
    } catch (const std::exception& e) {
        LOG_EVENTS_ERROR("Transport event handler failed for peer " << event.peer_id
                         << ", handle " << event.file_handle << ": " << e.what());
    }
}

size_t TransportEventQueue::lane_index(const TransportKey& key) const {
    // std::hash of an integer is the identity on common standard libraries; mix the bits
    uint64_t x = (static_cast<uint64_t>(key.peer_id) << 32) | key.file_handle;
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return static_cast<size_t>(x % lanes_.size());
}

} // namespace whisp
