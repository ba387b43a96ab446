#ifndef TURNTABLE_SPEED_TABLE_H
#define TURNTABLE_SPEED_TABLE_H

#include <cstddef>
#include <vector>
#include "types.h"

/**
 * Ordered set of selectable spin speeds (step intervals, slow -> fast)
 *
 * The button cycles through the entries; remote speed requests that
 * match an entry move the index so both inputs stay in agreement.
 * Not thread safe on its own - lives inside SharedState.
 */
class SpeedTable {
public:
    static constexpr size_t MIN_ENTRIES = 3;
    static constexpr size_t DEFAULT_INDEX = 1;

    /**
     * @param intervals Step intervals in ms; falls back to defaults() if invalid
     * @param initialIndex Starting entry, clamped into range
     */
    explicit SpeedTable(std::vector<step_interval_t> intervals = defaults(),
                        size_t initialIndex = DEFAULT_INDEX);

    // At least MIN_ENTRIES, all non-zero and distinct
    static bool isValid(const std::vector<step_interval_t>& intervals);
    static std::vector<step_interval_t> defaults();

    step_interval_t current() const { return intervals_[index_]; }
    size_t currentIndex() const { return index_; }
    size_t size() const { return intervals_.size(); }
    step_interval_t at(size_t i) const { return intervals_[i]; }

    // Advance to the next entry, wrapping to the first
    void cycle();

    /**
     * Move the index to the entry equal to interval
     * @return false (index unchanged) if interval is not in the table
     */
    bool select(step_interval_t interval);

private:
    std::vector<step_interval_t> intervals_;
    size_t index_;
};

#endif // TURNTABLE_SPEED_TABLE_H
