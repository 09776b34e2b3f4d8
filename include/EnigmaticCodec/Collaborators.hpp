#pragma once
// Collaborators.hpp – Interfaces to the ledger-facing world.
//
// The codec never talks to a node, a wallet or a key store itself. Callers
// implement these interfaces (an RPC client, an indexer, a hardware signer,
// an in-memory fake for tests) and hand them to the session layer.
//
// Implementations report failure by throwing one of the error types below;
// the session layer catches them at its boundary.

#include "Encoder.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace enigmatic {

// ─── Errors ───────────────────────────────────────────────────────────────────
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& msg) : std::runtime_error(msg) {}
};

class SignError : public CollaboratorError {
public:
    explicit SignError(const std::string& msg) : CollaboratorError(msg) {}
};

class BroadcastError : public CollaboratorError {
public:
    explicit BroadcastError(const std::string& msg) : CollaboratorError(msg) {}
};

// ─── Interfaces ───────────────────────────────────────────────────────────────
class CoinSource {
public:
    virtual ~CoinSource() = default;
    virtual std::vector<Coin> listSpendable(uint32_t min_confirmations) = 0;
};

class HeightSource {
public:
    virtual ~HeightSource() = default;
    virtual int64_t currentHeight() = 0;
};

struct ObservationBatch {
    std::vector<ObservedTx> txs;
    int64_t                 cursor{0}; // pass back on the next call
};

class TransactionObserver {
public:
    virtual ~TransactionObserver() = default;
    // Transactions touching `addresses` seen after `cursor`. A batch may
    // repeat transactions already delivered.
    virtual ObservationBatch observationsSince(const std::set<std::string>& addresses, int64_t cursor) = 0;
};

// Signs a frame whose inputs all reference real outpoints.
class Signer {
public:
    virtual ~Signer() = default;
    virtual std::vector<uint8_t> sign(const Frame& frame) = 0;
};

class Broadcaster {
public:
    virtual ~Broadcaster() = default;
    // Returns the txid of the accepted transaction.
    virtual std::string submit(const std::vector<uint8_t>& signed_tx) = 0;
};

// ─── Cancellation ─────────────────────────────────────────────────────────────
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace enigmatic
