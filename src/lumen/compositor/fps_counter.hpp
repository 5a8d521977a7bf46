#pragma once

#include "lumen/core/types.hpp"
#include <deque>

namespace lumen {

/// Frame rate over a sliding window of the most recent frame timestamps.
class FpsCounter
{
public:
    explicit FpsCounter(size_t window_size = 100)
        : window_size_(std::max<size_t>(window_size, 2))
    {
    }

    void add_frame(Clock::time_point time)
    {
        if (frames_.size() >= window_size_)
            frames_.pop_front();
        frames_.push_back(time);
    }

    /// (count - 1) / (last - first); 0.0 with fewer than two samples or no elapsed time.
    double fps() const
    {
        if (frames_.size() < 2)
            return 0.0;

        if (frames_.back() <= frames_.front())
            return 0.0;

        std::chrono::duration<double> span = frames_.back() - frames_.front();
        return static_cast<double>(frames_.size() - 1) / span.count();
    }

    size_t sample_count() const { return frames_.size(); }
    void clear() { frames_.clear(); }

private:
    size_t window_size_;
    std::deque<Clock::time_point> frames_;
};

} // namespace lumen
