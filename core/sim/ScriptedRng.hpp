#pragma once

#include "../IRng.hpp"
#include <cstddef>
#include <deque>
#include <initializer_list>

namespace senate::sim {

// Replays queued unit values in [0, 1). uniform() scales the value into
// [min, max); uniformInt() maps it onto the inclusive range. When the queue
// runs dry the fallback value is used.
class ScriptedRng : public IRng {
public:
    explicit ScriptedRng(double fallback = 0.99) : fallback_(fallback) {}
    ScriptedRng(std::initializer_list<double> values, double fallback = 0.99)
        : values_(values), fallback_(fallback) {}

    double uniform(double min = 0.0, double max = 1.0) override {
        return min + next() * (max - min);
    }

    int uniformInt(int min, int max) override {
        if (max <= min) {
            next();
            return min;
        }
        long long span = static_cast<long long>(max) - min + 1;
        auto offset = static_cast<long long>(next() * static_cast<double>(span));
        if (offset >= span) offset = span - 1;
        if (offset < 0) offset = 0;
        return static_cast<int>(min + offset);
    }

    void push(double value) { values_.push_back(value); }
    void push(std::initializer_list<double> values) { values_.insert(values_.end(), values); }
    void setFallback(double value) { fallback_ = value; }

    std::size_t remaining() const { return values_.size(); }
    std::size_t drawCount() const { return draws_; }

private:
    double next() {
        ++draws_;
        if (values_.empty()) {
            return fallback_;
        }
        double value = values_.front();
        values_.pop_front();
        return value;
    }

    std::deque<double> values_;
    double fallback_;
    std::size_t draws_ = 0;
};

} // namespace senate::sim
