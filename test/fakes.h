#ifndef TURNTABLE_TEST_FAKES_H
#define TURNTABLE_TEST_FAKES_H

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "Hardware.h"
#include "StatusBroadcaster.h"

// Host stand-in for the firmware's semaphore mutex
class HostLock : public TaskLock {
public:
    void lock() override {
        mutex_.lock();
        held = true;
        acquisitions++;
    }

    void unlock() override {
        held = false;
        mutex_.unlock();
    }

    bool held = false;
    int acquisitions = 0;

private:
    std::mutex mutex_;
};

// Virtual time: sleeping advances the clock instantly
class FakeClock : public TaskClock {
public:
    explicit FakeClock(millis_t start = 1000) : now_(start) {}

    millis_t nowMs() override { return now_; }

    void sleepMs(millis_t ms) override {
        now_ += ms;
        totalSlept += ms;
        if (onSleep) onSleep(ms);
    }

    void yield() override { yields++; }

    void advance(millis_t ms) { now_ += ms; }

    millis_t totalSlept = 0;
    int yields = 0;
    std::function<void(millis_t)> onSleep;

private:
    millis_t now_;
};

class FakeStepper : public StepperDriver {
public:
    void step(int direction) override {
        if (failOnStep) throw std::runtime_error("driver fault");
        if (failWithCode != 0) throw failWithCode;
        if (direction == STEP_FORWARD) forwardSteps++;
        else backwardSteps++;
        if (onStep) onStep();
    }

    void setStepInterval(step_interval_t ms) override {
        intervals.push_back(ms);
    }

    void release() override { releases++; }

    int forwardSteps = 0;
    int backwardSteps = 0;
    int releases = 0;
    bool failOnStep = false;
    int failWithCode = 0;  // thrown as a bare int when non-zero
    std::vector<step_interval_t> intervals;
    std::function<void()> onStep;
};

class FakeShutter : public ShutterOutput {
public:
    explicit FakeShutter(bool infraredFitted = true) : infraredFitted_(infraredFitted) {}

    void setWired(bool active) override {
        events.push_back(active ? "wired:on" : "wired:off");
        if (active) wiredPulses++;
    }

    void setIndicator(bool on) override {
        events.push_back(on ? "indicator:on" : "indicator:off");
        indicatorOn = on;
    }

    bool sendInfrared() override {
        if (failInfrared) throw std::runtime_error("rmt busy");
        if (!infraredFitted_) return false;
        events.push_back("ir");
        infraredCodes++;
        return true;
    }

    int triggers() const { return wiredPulses + infraredCodes; }

    std::vector<std::string> events;
    int wiredPulses = 0;
    int infraredCodes = 0;
    bool indicatorOn = false;
    bool failInfrared = false;

private:
    bool infraredFitted_;
};

class RecordingListener : public StatusListener {
public:
    bool send(const std::string& payload) override {
        payloads.push_back(payload);
        return connected;
    }

    std::vector<std::string> payloads;
    bool connected = true;
};

// Plain-text status encoding so the core tests don't depend on the JSON codec
inline std::string messageOnly(const StatusSnapshot& snap) {
    return snap.message;
}

inline std::string describeStatus(const StatusSnapshot& snap) {
    return snap.message + "|" + operationModeName(snap.mode) + "|" +
           std::to_string(snap.speed) + "|" + triggerModeName(snap.triggerMode);
}

#endif // TURNTABLE_TEST_FAKES_H
