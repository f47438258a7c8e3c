#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "core/TransferTypes.hpp"

namespace core {

    struct ChannelStats {
        uint64_t pushed = 0;
        uint64_t coalesced = 0;   // Samples overwritten while the queue was full
    };

    // Bounded single-producer queue from the copy engine to the observer.
    //
    // Backpressure policy: push() never blocks. When the queue is full the
    // newest queued sample is replaced by the incoming one, so intermediate
    // samples are lost but the latest one (and therefore the final one) is
    // always observable.
    class ProgressChannel {
    public:
        explicit ProgressChannel(size_t capacity = DEFAULT_PROGRESS_CAPACITY);

        ProgressChannel(const ProgressChannel&) = delete;
        ProgressChannel& operator=(const ProgressChannel&) = delete;

        // Producer side. Returns false once the channel is closed.
        bool push(const ProgressSample& sample);

        // No more samples will be pushed; wakes a blocked consumer.
        void close();

        // Blocks until at least one sample is queued, then returns the newest
        // and discards the older ones. std::nullopt once closed and empty.
        std::optional<ProgressSample> pop_latest();

        // Non-blocking variant of pop_latest().
        std::optional<ProgressSample> try_pop_latest();

        // Non-blocking; everything queued, oldest first.
        std::vector<ProgressSample> drain();

        size_t size() const;
        ChannelStats stats() const;

    private:
        std::optional<ProgressSample> take_latest_locked();

        const size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::deque<ProgressSample> queue_;
        bool closed_ = false;
        ChannelStats stats_;
    };

} // namespace core
