#pragma once
#include <list>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "Consumer.hpp"
#include "SSEMessage.hpp"

/**
 * Owns the registry of live consumers. add, markStale, publish and shutdown
 * run under the exclusive lock, count under the shared one, so a reader never
 * sees a half-applied change. No connection I/O happens while the lock is held.
 */
class SSEBroadcaster {
public:
    SSEBroadcaster() = default;
    ~SSEBroadcaster();

    SSEBroadcaster(const SSEBroadcaster&) = delete;
    SSEBroadcaster& operator=(const SSEBroadcaster&) = delete;

    // Returns false once shut down; the consumer is then left to the caller.
    bool add(std::shared_ptr<Consumer> consumer);

    // Encodes once and enqueues to every consumer that isn't stale. Consumers
    // with a full queue miss this message. Afterwards joins removed consumers
    // whose delivery threads have finished.
    void publish(const Message& message);

    // Drops the consumer from the registry and closes its queue. Safe to call
    // for a consumer that is already gone.
    void markStale(Consumer& consumer);

    // Closes every consumer, dropping frames they haven't written yet, and
    // waits for their delivery threads. Later calls do nothing.
    void shutdown();

    size_t count() const;
    bool closed() const;

private:
    void reapRetired();

    std::list<std::shared_ptr<Consumer>> consumers;
    // removed consumers whose delivery threads still need joining
    std::vector<std::shared_ptr<Consumer>> retired;
    bool closed_ = false;
    mutable std::shared_mutex mutex;
};
