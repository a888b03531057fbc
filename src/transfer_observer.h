#pragma once

#include "transfer_types.h"

namespace whisp {

class Transfer;

/**
 * Receives progress and completion notifications for every transfer of a
 * TransferManager.
 *
 * Methods are called on the thread servicing Transport events, after the
 * transfer lock has been released. Implementations must return promptly and
 * hand long work off to their own thread.
 */
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    // A remote peer announced a file; the transfer is PENDING until accepted
    virtual void on_incoming(const Transfer& transfer) { (void)transfer; }

    virtual void on_progress(const Transfer& transfer) { (void)transfer; }

    /**
     * Called when a transfer reaches COMPLETED or FAILED.
     * @param result Success, or the error that ended the transfer
     *        (CHECKSUM_MISMATCH may accompany a COMPLETED transfer)
     */
    virtual void on_complete(const Transfer& transfer, const TransferResult& result) {
        (void)transfer;
        (void)result;
    }
};

} // namespace whisp
