#include "core/ProgressChannel.hpp"

namespace core {

    ProgressChannel::ProgressChannel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bool ProgressChannel::push(const ProgressSample& sample) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;

            stats_.pushed++;
            if (queue_.size() >= capacity_) {
                // Drop Policy: keep the newest value in the last slot
                queue_.back() = sample;
                stats_.coalesced++;
            } else {
                queue_.push_back(sample);
            }
        }
        ready_.notify_one();
        return true;
    }

    void ProgressChannel::close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    std::optional<ProgressSample> ProgressChannel::pop_latest() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return take_latest_locked();
    }

    std::optional<ProgressSample> ProgressChannel::try_pop_latest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_latest_locked();
    }

    std::vector<ProgressSample> ProgressChannel::drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProgressSample> samples(queue_.begin(), queue_.end());
        queue_.clear();
        return samples;
    }

    std::optional<ProgressSample> ProgressChannel::take_latest_locked() {
        if (queue_.empty()) return std::nullopt;
        ProgressSample latest = queue_.back();
        queue_.clear();
        return latest;
    }

    size_t ProgressChannel::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    ChannelStats ProgressChannel::stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

} // namespace core
