#pragma once

/**
 * @file transport.h
 * @brief Boundary to the peer-messaging layer's file-chunk protocol
 *
 * The transfer core drives a Transport (announce, push chunk, control) and
 * is driven by it through three callbacks. Implementations may invoke the
 * callbacks on their own worker threads.
 */

#include "transfer_types.h"

#include <array>
#include <vector>
#include <string>
#include <functional>
#include <cstdint>

namespace whisp {

/** 32-byte identifier advertised with an outgoing file */
using FileId = std::array<uint8_t, 32>;

/**
 * Remote peer announced a file it wants to send us
 */
using AnnounceCallback = std::function<void(PeerId peer_id, FileHandle file_handle, FileKind kind,
                                            uint64_t file_size, const std::string& file_name)>;

/**
 * A chunk of an incoming file arrived
 */
using ChunkCallback = std::function<void(PeerId peer_id, FileHandle file_handle, uint64_t position,
                                         const std::vector<uint8_t>& data)>;

/**
 * Remote peer requests a chunk of an outgoing file.
 * A length of zero signals that the remote has everything.
 */
using PullRequestCallback = std::function<void(PeerId peer_id, FileHandle file_handle, uint64_t position,
                                               size_t length)>;

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Announce an outgoing file to a peer
     * @param peer_id Target peer
     * @param kind File kind
     * @param file_size Size in bytes
     * @param file_id Identifier advertised to the peer
     * @param file_name Name advertised to the peer
     * @param file_handle_out Receives the handle used by later callbacks
     * @return Success, or TRANSPORT_ERROR with a description
     */
    virtual TransferResult initiate(PeerId peer_id, FileKind kind, uint64_t file_size,
                                    const FileId& file_id, const std::string& file_name,
                                    FileHandle& file_handle_out) = 0;

    virtual TransferResult push_chunk(PeerId peer_id, FileHandle file_handle, uint64_t position,
                                      const std::vector<uint8_t>& data) = 0;

    virtual TransferResult control(PeerId peer_id, FileHandle file_handle, FileControl control) = 0;

    // Callback registration; a later call replaces the earlier callback
    virtual void on_announce(AnnounceCallback callback) = 0;
    virtual void on_chunk(ChunkCallback callback) = 0;
    virtual void on_pull_request(PullRequestCallback callback) = 0;
};

} // namespace whisp
