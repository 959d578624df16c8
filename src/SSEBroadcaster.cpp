#include "SSEBroadcaster.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>

SSEBroadcaster::~SSEBroadcaster() {
    shutdown();
}

bool SSEBroadcaster::add(std::shared_ptr<Consumer> consumer) {
    {
        std::unique_lock lock(mutex);
        if (closed_) {
            return false;
        }
        if (consumer->stale()) {
            // failed before it got registered; its markStale found nothing
            retired.push_back(std::move(consumer));
        } else {
            consumers.push_back(std::move(consumer));
        }
    }
    reapRetired();
    return true;
}

void SSEBroadcaster::publish(const Message& message) {
    std::string frame = encodeMessage(message);
    {
        std::unique_lock lock(mutex);
        if (closed_) {
            return;
        }
        for (auto& consumer : consumers) {
            if (!consumer->stale()) {
                // a full queue means a slow client; it loses this frame
                consumer->enqueue(frame);
            }
        }
    }
    reapRetired();
}

void SSEBroadcaster::markStale(Consumer& consumer) {
    std::unique_lock lock(mutex);
    auto it = std::find_if(consumers.begin(), consumers.end(),
                           [&consumer](const std::shared_ptr<Consumer>& c) { return c.get() == &consumer; });
    if (it == consumers.end()) {
        return;
    }
    (*it)->close();
    retired.push_back(std::move(*it));
    consumers.erase(it);
}

void SSEBroadcaster::reapRetired() {
    std::vector<std::shared_ptr<Consumer>> done;
    {
        std::unique_lock lock(mutex);
        auto split = std::partition(retired.begin(), retired.end(),
                                    [](const std::shared_ptr<Consumer>& c) { return !c->finished(); });
        done.assign(std::make_move_iterator(split), std::make_move_iterator(retired.end()));
        retired.erase(split, retired.end());
    }
    for (auto& consumer : done) {
        consumer->join();
    }
}

void SSEBroadcaster::shutdown() {
    std::vector<std::shared_ptr<Consumer>> closing;
    {
        std::unique_lock lock(mutex);
        if (closed_) {
            return;
        }
        closed_ = true;
        for (auto& consumer : consumers) {
            // undelivered frames would hold the join below for a write deadline each
            consumer->close(true);
            closing.push_back(std::move(consumer));
        }
        consumers.clear();
        for (auto& consumer : retired) {
            closing.push_back(std::move(consumer));
        }
        retired.clear();
    }
    // each delivery thread closes its own connection on the way out
    for (auto& consumer : closing) {
        consumer->join();
    }
}

size_t SSEBroadcaster::count() const {
    std::shared_lock lock(mutex);
    return consumers.size();
}

bool SSEBroadcaster::closed() const {
    std::shared_lock lock(mutex);
    return closed_;
}
