#include "SpeedTable.h"
#include <algorithm>
#include <utility>

SpeedTable::SpeedTable(std::vector<step_interval_t> intervals, size_t initialIndex)
    : intervals_(isValid(intervals) ? std::move(intervals) : defaults())
    , index_(initialIndex < intervals_.size() ? initialIndex : 0)
{
}

bool SpeedTable::isValid(const std::vector<step_interval_t>& intervals) {
    if (intervals.size() < MIN_ENTRIES) return false;

    for (size_t i = 0; i < intervals.size(); i++) {
        if (intervals[i] == 0) return false;
        if (std::find(intervals.begin() + i + 1, intervals.end(), intervals[i]) != intervals.end()) {
            return false;
        }
    }
    return true;
}

std::vector<step_interval_t> SpeedTable::defaults() {
    return {13, 4, 1};
}

void SpeedTable::cycle() {
    index_ = (index_ + 1) % intervals_.size();
}

bool SpeedTable::select(step_interval_t interval) {
    auto it = std::find(intervals_.begin(), intervals_.end(), interval);
    if (it == intervals_.end()) return false;
    index_ = static_cast<size_t>(it - intervals_.begin());
    return true;
}
