#ifndef TURNTABLE_STATUS_BROADCASTER_H
#define TURNTABLE_STATUS_BROADCASTER_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "Hardware.h"
#include "OperationState.h"

/**
 * Immutable copy of what listeners are told
 */
struct StatusSnapshot {
    std::string message;
    OperationMode mode = OperationMode::IDLE;
    step_interval_t speed = 0;
    TriggerMode triggerMode = TriggerMode::WIRED;
};

/**
 * A connected remote client that receives status payloads
 */
class StatusListener {
public:
    virtual ~StatusListener() = default;

    /**
     * @return false if delivery failed (client is then dropped)
     */
    virtual bool send(const std::string& payload) = 0;
};

/**
 * Set of connected listeners
 *
 * Membership changes only on connect/disconnect. broadcast() iterates a
 * copy, so a client disconnecting mid-broadcast is harmless.
 */
class ClientRegistry {
public:
    explicit ClientRegistry(TaskLock& lock) : lock_(lock) {}

    void add(const std::shared_ptr<StatusListener>& listener);
    void remove(const StatusListener* listener);
    std::vector<std::shared_ptr<StatusListener>> listeners();
    size_t size();

    // Release spare capacity left behind by disconnected clients
    void compact();

private:
    TaskLock& lock_;
    std::vector<std::shared_ptr<StatusListener>> listeners_;
};

typedef std::function<std::string(const StatusSnapshot&)> StatusEncoder;

/**
 * Mirrors the OperationState to every registered listener
 *
 * The snapshot is taken under the state lock; encoding and sending
 * happen after it is released.
 */
class StatusBroadcaster {
public:
    static constexpr millis_t HEARTBEAT_MS = 5000;

    StatusBroadcaster(SharedState& shared, ClientRegistry& clients,
                      TaskClock& clock, StatusEncoder encoder);

    StatusSnapshot snapshot();

    /**
     * Push the current status to every listener
     * @return Number of listeners reached
     */
    size_t broadcast();

    /**
     * Re-broadcast while IDLE if nothing was sent for HEARTBEAT_MS
     * @return true if a heartbeat went out
     */
    bool heartbeat(OperationMode mode);

    millis_t lastBroadcastAt() const { return lastBroadcastAt_.load(); }

private:
    SharedState& shared_;
    ClientRegistry& clients_;
    TaskClock& clock_;
    StatusEncoder encoder_;
    std::atomic<millis_t> lastBroadcastAt_;
};

#endif // TURNTABLE_STATUS_BROADCASTER_H
