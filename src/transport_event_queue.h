#pragma once

/**
 * @file transport_event_queue.h
 * @brief Bounded, lane-partitioned queue decoupling Transport callbacks
 *        from transfer servicing
 *
 * Events are assigned to a lane by (peer, file handle), so events of one
 * transfer are handled in arrival order while different transfers are
 * serviced in parallel. Each lane has a bounded capacity; posting to a full
 * lane blocks the caller.
 */

#include "transfer_types.h"

#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <functional>
#include <condition_variable>

namespace whisp {

enum class TransportEventType {
    ANNOUNCE,
    CHUNK,
    PULL_REQUEST
};

struct TransportEvent {
    TransportEventType type = TransportEventType::ANNOUNCE;
    PeerId peer_id = 0;
    FileHandle file_handle = 0;

    // ANNOUNCE
    FileKind kind = FileKind::DATA;
    uint64_t file_size = 0;
    std::string file_name;

    // CHUNK and PULL_REQUEST
    uint64_t position = 0;
    size_t length = 0;
    std::vector<uint8_t> data;

    TransportKey key() const { return TransportKey(peer_id, file_handle); }

    static TransportEvent announce(PeerId peer, FileHandle handle, FileKind kind,
                                   uint64_t size, const std::string& name);
    static TransportEvent chunk(PeerId peer, FileHandle handle, uint64_t position,
                                std::vector<uint8_t> data);
    static TransportEvent pull_request(PeerId peer, FileHandle handle, uint64_t position, size_t length);
};

using TransportEventHandler = std::function<void(const TransportEvent& event)>;

class TransportEventQueue {
public:
    /**
     * @param lanes Number of worker lanes; 0 handles events on the posting thread
     * @param capacity Maximum queued events per lane (at least 1)
     * @param handler Called for every event, never concurrently for one lane
     */
    TransportEventQueue(size_t lanes, size_t capacity, TransportEventHandler handler);
    ~TransportEventQueue();

    TransportEventQueue(const TransportEventQueue&) = delete;
    TransportEventQueue& operator=(const TransportEventQueue&) = delete;

    /**
     * Queue an event, blocking while its lane is full
     * @return false if the queue has been stopped
     */
    bool post(TransportEvent event);

    /**
     * Block until every lane is empty and idle.
     * Must not be called from inside the handler.
     */
    void drain();

    /**
     * Stop and join all workers. Queued events are discarded.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    size_t lane_count() const { return lanes_.size(); }
    size_t capacity() const { return capacity_; }
    size_t pending() const;

private:
    struct Lane {
        std::mutex mutex;
        std::condition_variable not_empty;
        std::condition_variable not_full;
        std::condition_variable idle;
        std::deque<TransportEvent> events;
        bool busy = false;
        std::thread worker;
    };

    void worker_loop(Lane& lane);
    void dispatch(const TransportEvent& event);
    size_t lane_index(const TransportKey& key) const;

    const size_t capacity_;
    TransportEventHandler handler_;
    std::vector<std::unique_ptr<Lane>> lanes_;
    std::atomic<bool> running_;
};

} // namespace whisp
