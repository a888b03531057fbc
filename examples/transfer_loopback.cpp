/**
 * @file transfer_loopback.cpp
 * @brief Send a file between two transfer managers over an in-memory link
 *
 * Demonstrates the whisp transfer core end to end:
 *   - Creating and announcing an outgoing transfer
 *   - Accepting the announce on the receiving side through an observer
 *   - Receiver-driven chunk pulls and completion
 *   - Digest verification of the received file
 *
 * Usage:
 *   whisp_transfer_loopback <file> [<save_dir>] [<config.json>]
 *
 * Examples:
 *   whisp_transfer_loopback ./photo.jpg
 *   whisp_transfer_loopback ./photo.jpg ./received transfer.json
 */

#include "transfer_manager.h"
#include "transfer_config.h"
#include "logger.h"

#include <iostream>
#include <string>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>

using namespace whisp;

namespace {

// Largest chunk the messaging layer carries in one packet
constexpr size_t kChunkSize = 1371;

constexpr PeerId kSenderId = 1;
constexpr PeerId kReceiverId = 2;

/**
 * Delivers queued messages between two endpoints on its own thread, the
 * way a messaging layer calls back from its event loop.
 */
class Link {
public:
    Link() : running_(true), worker_([this] { run(); }) {}

    ~Link() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        worker_.join();
    }

    void post(std::function<void()> message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            cv_.wait(lock, [this] { return !messages_.empty() || !running_; });
            while (!messages_.empty()) {
                auto message = std::move(messages_.front());
                messages_.pop_front();
                lock.unlock();
                message();
                lock.lock();
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> messages_;
    bool running_;
    std::thread worker_;
};

class LinkTransport : public Transport {
public:
    LinkTransport(Link& link, PeerId self_id) : link_(link), self_id_(self_id) {}

    void connect(LinkTransport* remote) { remote_ = remote; }

    TransferResult initiate(PeerId, FileKind kind, uint64_t file_size, const FileId&,
                            const std::string& file_name, FileHandle& file_handle_out) override {
        FileHandle handle = next_handle_++;
        file_handle_out = handle;
        LinkTransport* remote = remote_;
        PeerId from = self_id_;
        link_.post([remote, from, handle, kind, file_size, file_name] {
            std::lock_guard<std::mutex> lock(remote->mutex_);
            if (remote->announce_) remote->announce_(from, handle, kind, file_size, file_name);
        });
        return TransferResult::Success();
    }

    TransferResult push_chunk(PeerId, FileHandle file_handle, uint64_t position,
                              const std::vector<uint8_t>& data) override {
        LinkTransport* remote = remote_;
        PeerId from = self_id_;
        link_.post([remote, from, file_handle, position, data] {
            std::lock_guard<std::mutex> lock(remote->mutex_);
            if (remote->chunk_) remote->chunk_(from, file_handle, position, data);
        });
        return TransferResult::Success();
    }

    TransferResult control(PeerId, FileHandle file_handle, FileControl control) override {
        std::cout << "  control " << file_control_to_string(control) << " for file " << file_handle << "\n";
        return TransferResult::Success();
    }

    void on_announce(AnnounceCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        announce_ = std::move(callback);
    }
    void on_chunk(ChunkCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        chunk_ = std::move(callback);
    }
    void on_pull_request(PullRequestCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pull_ = std::move(callback);
    }

    // Ask the remote sender for part of a file it announced
    void request(FileHandle file_handle, uint64_t position, size_t length) {
        LinkTransport* remote = remote_;
        PeerId from = self_id_;
        link_.post([remote, from, file_handle, position, length] {
            std::lock_guard<std::mutex> lock(remote->mutex_);
            if (remote->pull_) remote->pull_(from, file_handle, position, length);
        });
    }

private:
    Link& link_;
    const PeerId self_id_;
    LinkTransport* remote_ = nullptr;
    std::atomic<FileHandle> next_handle_{0};

    // Held while a callback runs so that a detaching manager waits for it
    std::mutex mutex_;

    AnnounceCallback announce_;
    ChunkCallback chunk_;
    PullRequestCallback pull_;
};

class ReceiverObserver : public TransferObserver {
public:
    ReceiverObserver(TransferManager& manager, const std::string& save_dir)
        : manager_(manager), save_dir_(save_dir) {}

    void on_incoming(const Transfer& transfer) override {
        std::cout << "Incoming " << transfer.file_name() << " (" << transfer.file_size() << " bytes)\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepted_id_ = transfer.id();
            cv_.notify_all();
        }
        TransferResult accepted = manager_.accept_incoming(transfer.id(), save_dir_);
        if (!accepted) {
            std::cerr << "Accept failed: " << accepted.error_message << "\n";
            finish(false);
        }
    }

    void on_progress(const Transfer& transfer) override {
        int percent = static_cast<int>(transfer.progress() * 100.0);
        if (percent / 10 != last_decile_.exchange(percent / 10)) {
            std::cout << "  received " << percent << "%\n";
        }
    }

    void on_complete(const Transfer& transfer, const TransferResult& result) override {
        if (result) {
            std::cout << "Received " << transfer.file_path() << "\n  sha256 " << transfer.file_checksum() << "\n";
        } else {
            std::cerr << "Transfer ended: " << result.error_message << "\n";
        }
        finish(result.success);
    }

    // Blocks until the announce arrived; returns the transfer ID
    std::string wait_accepted() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !accepted_id_.empty(); });
        return accepted_id_;
    }

    bool wait_done() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
        return ok_;
    }

private:
    void finish(bool ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        ok_ = ok;
        cv_.notify_all();
    }

    TransferManager& manager_;
    std::string save_dir_;
    std::atomic<int> last_decile_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::string accepted_id_;
    bool done_ = false;
    bool ok_ = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <file> [<save_dir>] [<config.json>]\n"
              << "\n"
              << "  file          File to send\n"
              << "  save_dir      (optional) Directory for the received copy (default: ./downloads)\n"
              << "  config.json   (optional) Transfer configuration document\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string file_path = argv[1];

    TransferConfig config;
    if (argc == 4) {
        std::string error;
        if (!load_transfer_config(argv[3], config, &error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }
    const std::string save_dir = argc >= 3 ? argv[2] : config.download_directory;

    Logger::getInstance().set_log_level(LogLevel::WARN);

    Link link;
    auto sender_transport = std::make_shared<LinkTransport>(link, kSenderId);
    auto receiver_transport = std::make_shared<LinkTransport>(link, kReceiverId);
    sender_transport->connect(receiver_transport.get());
    receiver_transport->connect(sender_transport.get());

    TransferManager sender(sender_transport, config);
    TransferManager receiver(receiver_transport, config);

    auto observer = std::make_shared<ReceiverObserver>(receiver, save_dir);
    receiver.set_observer(observer);

    // ── Sender side ─────────────────────────────────────────────────────────
    TransferResult result;
    auto outgoing = sender.send_file(kReceiverId, file_path, &result);
    if (!outgoing) {
        std::cerr << "Error: " << result.error_message << "\n";
        return 1;
    }
    std::cout << "Sending " << outgoing->file_name() << " (" << outgoing->file_size() << " bytes)\n"
              << "  sha256 " << outgoing->file_checksum() << "\n";

    result = sender.start_send(outgoing);
    if (!result) {
        std::cerr << "Error: " << result.error_message << "\n";
        return 1;
    }

    // ── Receiver side: pull every chunk, then signal completion ─────────────
    const std::string incoming_id = observer->wait_accepted();
    auto incoming = receiver.get_transfer(incoming_id);
    if (!incoming) {
        return 1;
    }
    TransferResult expected = receiver.set_expected_checksum(incoming->id(), outgoing->file_checksum());
    if (!expected) {
        std::cerr << "Warning: " << expected.error_message << "\n";
    }

    for (uint64_t position = 0; position < incoming->file_size(); position += kChunkSize) {
        receiver_transport->request(incoming->file_handle(), position, kChunkSize);
    }

    bool ok = observer->wait_done();
    receiver_transport->request(incoming->file_handle(), 0, 0);

    while (!outgoing->is_complete()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << "Sender state: " << transfer_state_to_string(outgoing->state()) << "\n"
              << "Statistics: " << receiver.get_statistics().dump(2) << "\n";
    return ok ? 0 : 1;
}
