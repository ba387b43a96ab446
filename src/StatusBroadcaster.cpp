#include "StatusBroadcaster.h"
#include <algorithm>
#include <utility>

void ClientRegistry::add(const std::shared_ptr<StatusListener>& listener) {
    if (!listener) return;
    TaskLockGuard guard(lock_);
    listeners_.push_back(listener);
}

void ClientRegistry::remove(const StatusListener* listener) {
    TaskLockGuard guard(lock_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [listener](const std::shared_ptr<StatusListener>& l) { return l.get() == listener; }),
        listeners_.end());
}

std::vector<std::shared_ptr<StatusListener>> ClientRegistry::listeners() {
    TaskLockGuard guard(lock_);
    return listeners_;
}

size_t ClientRegistry::size() {
    TaskLockGuard guard(lock_);
    return listeners_.size();
}

void ClientRegistry::compact() {
    TaskLockGuard guard(lock_);
    listeners_.shrink_to_fit();
}

StatusBroadcaster::StatusBroadcaster(SharedState& shared, ClientRegistry& clients,
                                     TaskClock& clock, StatusEncoder encoder)
    : shared_(shared)
    , clients_(clients)
    , clock_(clock)
    , encoder_(std::move(encoder))
    , lastBroadcastAt_(clock.nowMs())
{
}

StatusSnapshot StatusBroadcaster::snapshot() {
    SharedState::Access access = shared_.lock();
    const OperationState& state = access.state();

    StatusSnapshot snap;
    snap.message = state.message;
    snap.mode = state.mode;
    snap.speed = state.effectiveSpeed(access.speeds());
    snap.triggerMode = state.triggerMode;
    return snap;
}

size_t StatusBroadcaster::broadcast() {
    const std::string payload = encoder_(snapshot());
    lastBroadcastAt_.store(clock_.nowMs());

    size_t delivered = 0;
    for (const std::shared_ptr<StatusListener>& listener : clients_.listeners()) {
        if (listener->send(payload)) {
            delivered++;
        } else {
            clients_.remove(listener.get());
        }
    }
    return delivered;
}

bool StatusBroadcaster::heartbeat(OperationMode mode) {
    if (mode != OperationMode::IDLE) return false;
    if (millisDiff(clock_.nowMs(), lastBroadcastAt_.load()) <= static_cast<int32_t>(HEARTBEAT_MS)) {
        return false;
    }

    broadcast();
    clients_.compact();
    return true;
}
