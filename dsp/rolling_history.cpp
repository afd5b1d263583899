#include "rolling_history.hpp"

#include <algorithm>

namespace beatlight::dsp {

RollingHistory::RollingHistory(int capacity)
    : buffer_(static_cast<size_t>(std::max(1, capacity)), 0.0f) {}

void RollingHistory::push(float value) {
    buffer_[head_] = value;
    head_ = (head_ + 1) % capacity();
    if (count_ < capacity()) ++count_;
}

void RollingHistory::clear() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    head_ = 0;
    count_ = 0;
}

float RollingHistory::mean() const {
    if (count_ == 0) return 0.0f;
    double sum = 0.0;
    for (int i = 0; i < count_; ++i) sum += at(i);
    return static_cast<float>(sum / count_);
}

float RollingHistory::at(int index) const {
    if (index < 0 || index >= count_) return 0.0f;
    const int oldest = (head_ - count_ + capacity()) % capacity();
    return buffer_[(oldest + index) % capacity()];
}

bool RollingHistory::tail_strictly_increasing(int n) const {
    if (n < 2 || count_ < n) return false;
    for (int i = count_ - n; i < count_ - 1; ++i) {
        if (!(at(i) < at(i + 1))) return false;
    }
    return true;
}

} // namespace beatlight::dsp
