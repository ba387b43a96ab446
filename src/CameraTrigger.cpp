#include "CameraTrigger.h"

namespace {

// Keeps the indicator lit for the lifetime of one trigger, even if
// the output driver throws
class IndicatorScope {
public:
    explicit IndicatorScope(ShutterOutput& output) : output_(output) { output_.setIndicator(true); }
    ~IndicatorScope() { output_.setIndicator(false); }

    IndicatorScope(const IndicatorScope&) = delete;
    IndicatorScope& operator=(const IndicatorScope&) = delete;

private:
    ShutterOutput& output_;
};

} // anonymous namespace

bool CameraTrigger::fire(TriggerMode mode) {
    IndicatorScope indicator(output_);
    bool sent = true;

    switch (mode) {
        case TriggerMode::WIRED:
            output_.setWired(true);
            clock_.sleepMs(WIRED_PULSE_MS);
            output_.setWired(false);
            break;
        case TriggerMode::IR:
            sent = output_.sendInfrared();
            break;
    }

    clock_.sleepMs(SETTLE_MS);
    return sent;
}
