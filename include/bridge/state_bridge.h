#pragma once

/**
 * @file state_bridge.h
 * @brief Sole writer of bridge-owned session fields
 *
 * The vision consumer submits StateUpdateRequests; the event loop calls
 * drain_once() to apply them to the SessionStore in arrival order.
 */

#include "bridge/events.h"
#include "config.h"
#include "core/bounded_queue.h"
#include "session/session_store.h"
#include <cstddef>
#include <string>

namespace gate_sentry {

class StateBridge {
public:
    StateBridge(SessionStore& store, BoundedQueue<GateEvent>& events, const BridgeConfig& config);

    StateBridge(const StateBridge&) = delete;
    StateBridge& operator=(const StateBridge&) = delete;

    /// Enqueue an update; the oldest pending request is dropped on overflow
    void submit(StateUpdateRequest request);

    /**
     * @brief Apply at most max_batch pending requests
     * @return Number of requests applied
     *
     * Unknown sessions are dropped. Any other failure (error result or
     * exception) puts the request back at the head, to be retried on the
     * next cycle, up to MAX_ATTEMPTS in total.
     */
    size_t drain_once();

    /**
     * @brief Apply one update directly (caller is the single consumer)
     *
     * Activation edges emit exactly one greeting (false->true) or farewell
     * (true->false). The false edge also resets the conversation and bumps
     * the epoch before the remaining fields are written.
     */
    Result<void> apply(const StateUpdateRequest& request);

    size_t pending() const { return requests_.size(); }
    size_t dropped() const { return requests_.dropped(); }

private:
    void retry_or_drop(StateUpdateRequest request, const std::string& failure);

    SessionStore& store_;
    BoundedQueue<GateEvent>& events_;
    BridgeConfig config_;
    BoundedQueue<StateUpdateRequest> requests_;
};

} // namespace gate_sentry
