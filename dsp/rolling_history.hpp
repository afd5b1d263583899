#pragma once

#include <cstddef>
#include <vector>

namespace beatlight::dsp {

// Fixed-capacity FIFO of scalar observations. Storage is allocated once in
// the constructor; push() evicts the oldest value when full.
class RollingHistory {
public:
    explicit RollingHistory(int capacity);

    void push(float value);
    void clear();

    // Mean over the stored values, 0 when empty. Re-summed in double on each
    // call so there is no running-sum drift.
    float mean() const;

    int size() const { return count_; }
    int capacity() const { return static_cast<int>(buffer_.size()); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == capacity(); }

    // Chronological access: at(0) is the oldest, at(size()-1) the newest
    float at(int index) const;
    float newest() const { return count_ > 0 ? at(count_ - 1) : 0.0f; }

    // True when the newest n values are strictly increasing (n >= 2, size() >= n)
    bool tail_strictly_increasing(int n) const;

private:
    std::vector<float> buffer_;
    int head_ = 0;   // next write position
    int count_ = 0;
};

} // namespace beatlight::dsp
