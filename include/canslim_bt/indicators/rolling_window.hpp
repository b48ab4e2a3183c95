// include/canslim_bt/indicators/rolling_window.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <utility>

namespace canslim_bt {

/**
 * @brief Running sum over the last `window` values
 *
 * Uses all available history up to the window size: the first push already
 * yields a value (partial windows are not NaN).
 */
class RollingSum {
public:
    explicit RollingSum(size_t window) : window_(window == 0 ? 1 : window) {}

    double push(double value) {
        values_.push_back(value);
        sum_ += value;
        if (values_.size() > window_) {
            sum_ -= values_.front();
            values_.pop_front();
        }
        return sum_;
    }

    double sum() const {
        return sum_;
    }

    size_t count() const {
        return values_.size();
    }

    size_t window() const {
        return window_;
    }

    void reset() {
        values_.clear();
        sum_ = 0.0;
    }

private:
    size_t window_;
    std::deque<double> values_;
    double sum_{0.0};
};

/**
 * @brief Running mean over the last `window` values, partial windows allowed
 */
class RollingMean {
public:
    explicit RollingMean(size_t window) : sum_(window) {}

    double push(double value) {
        sum_.push(value);
        return mean();
    }

    double mean() const {
        return sum_.count() == 0 ? 0.0 : sum_.sum() / static_cast<double>(sum_.count());
    }

    size_t count() const {
        return sum_.count();
    }

    void reset() {
        sum_.reset();
    }

private:
    RollingSum sum_;
};

/**
 * @brief Running maximum over the last `window` values
 *
 * Monotonic deque of (index, value); amortized O(1) per push.
 */
class RollingMax {
public:
    explicit RollingMax(size_t window) : window_(window == 0 ? 1 : window) {}

    double push(double value) {
        while (!candidates_.empty() && candidates_.back().second <= value) {
            candidates_.pop_back();
        }
        candidates_.emplace_back(index_, value);
        if (index_ >= window_ && candidates_.front().first <= index_ - window_) {
            candidates_.pop_front();
        }
        ++index_;
        return candidates_.front().second;
    }

    double max() const {
        return candidates_.empty() ? 0.0 : candidates_.front().second;
    }

    void reset() {
        candidates_.clear();
        index_ = 0;
    }

private:
    size_t window_;
    size_t index_{0};
    std::deque<std::pair<size_t, double>> candidates_;
};

}  // namespace canslim_bt
