#include "core/TransferSession.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace core {

    static const char* const kMissingPaths = "Source and Destination are both required";

    TransferSession::TransferSession(
        std::shared_ptr<CopyEngine> engine,
        std::shared_ptr<common::ILogger> logger
    ) : engine_(std::move(engine)),
        logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()),
        pool_(2) {}

    TransferSession::~TransferSession() {
        // A completion callback may start another transfer while we wait
        for (;;) {
            cancel();
            std::future<void> task;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                task = std::move(copy_task_);
            }
            if (!task.valid()) break;
            task.wait();
        }
    }

    void TransferSession::set_progress_callback(ProgressCallback callback) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        on_progress_ = std::move(callback);
    }

    void TransferSession::set_completion_callback(CompletionCallback callback) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        on_complete_ = std::move(callback);
    }

    common::EmptyResult TransferSession::start(const TransferRequest& request) {
        std::unique_lock<std::mutex> lock(state_mutex_);

        if (snapshot_.state == TransferState::Running) {
            return common::EmptyResult::err(common::ErrorCode::Busy, "A transfer is already running");
        }

        if (!request.is_valid()) {
            snapshot_.error = kMissingPaths;
            logger_->warn(std::string("[TransferSession] Rejected start: ") + kMissingPaths);
            return common::EmptyResult::err(common::ErrorCode::ValidationError, kMissingPaths);
        }

        // Fresh transfer: drop progress and error of the previous one
        snapshot_ = TransferSnapshot{};
        snapshot_.state = TransferState::Running;
        last_outcome_.reset();
        settled_ = false;
        const uint64_t generation = ++generation_;

        cancel_source_.reset();
        auto token = cancel_source_.get_token();
        auto channel = std::make_shared<ProgressChannel>(engine_->config().progress_capacity);

        auto drain = pool_.submit([this, channel]() {
            return drain_routine(channel);
        });
        copy_task_ = pool_.submit([this, request, token, channel, generation, drain = std::move(drain)]() mutable {
            copy_routine(request, token, channel, std::move(drain), generation);
        });

        logger_->info("[TransferSession] Running: " + request.source_path + " -> " + request.destination_path);
        return common::EmptyResult::success();
    }

    void TransferSession::cancel() {
        common::CancellationSource source;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (snapshot_.state != TransferState::Running) return;
            source = cancel_source_;
        }

        logger_->info("[TransferSession] Cancel requested");
        source.cancel();
    }

    TransferSnapshot TransferSession::snapshot() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return snapshot_;
    }

    TransferState TransferSession::get_state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return snapshot_.state;
    }

    std::optional<TransferOutcome> TransferSession::last_outcome() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return last_outcome_;
    }

    TransferSnapshot TransferSession::wait() {
        std::unique_lock<std::mutex> lock(state_mutex_);
        settled_cv_.wait(lock, [this]() { return settled_; });
        return snapshot_;
    }

    bool TransferSession::wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        return settled_cv_.wait_for(lock, timeout, [this]() { return settled_; });
    }

    void TransferSession::copy_routine(
        TransferRequest request,
        common::CancellationToken token,
        std::shared_ptr<ProgressChannel> channel,
        std::future<uint64_t> drain,
        uint64_t generation
    ) {
        TransferOutcome outcome;
        try {
            outcome = engine_->run(request, token, *channel);
        } catch (const std::exception& e) {
            outcome = TransferOutcome::failed(common::ErrorCode::Unknown, e.what());
        }

        // The engine is done pushing; let the drain task apply the last sample
        channel->close();
        try {
            uint64_t last = drain.get();
            logger_->debug("[TransferSession] Drained, last sample " + std::to_string(last) + " bytes");
        } catch (const std::exception& e) {
            logger_->error(std::string("[TransferSession] Progress drain failed: ") + e.what());
        }

        auto stats = channel->stats();
        if (stats.coalesced > 0) {
            logger_->debug("[TransferSession] " + std::to_string(stats.coalesced) + " of " +
                           std::to_string(stats.pushed) + " samples coalesced");
        }

        finish(outcome, generation);
    }

    uint64_t TransferSession::drain_routine(std::shared_ptr<ProgressChannel> channel) {
        uint64_t last = 0;
        while (auto sample = channel->pop_latest()) {
            last = sample->bytes_copied;
            apply_progress(*sample);
        }
        return last;
    }

    void TransferSession::apply_progress(const ProgressSample& sample) {
        ProgressCallback callback;
        TransferSnapshot current;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (snapshot_.state != TransferState::Running) return;

            uint64_t bytes = sample.bytes_copied;
            if (sample.total_bytes > 0) {
                bytes = std::min(bytes, sample.total_bytes);
            }
            if (bytes < snapshot_.bytes_copied) return;

            snapshot_.bytes_copied = bytes;
            snapshot_.total_bytes = sample.total_bytes;
            if (sample.total_bytes > 0) {
                snapshot_.fraction = std::min(1.0,
                    static_cast<double>(bytes) / static_cast<double>(sample.total_bytes));
                snapshot_.indeterminate = false;
            } else {
                snapshot_.fraction = 0.0;
                snapshot_.indeterminate = true;
            }

            callback = on_progress_;
            current = snapshot_;
        }

        if (callback) callback(current);
    }

    void TransferSession::finish(const TransferOutcome& outcome, uint64_t generation) {
        CompletionCallback callback;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            switch (outcome.kind) {
                case OutcomeKind::Success:
                    snapshot_.state = TransferState::Completed;
                    snapshot_.fraction = 1.0;
                    snapshot_.indeterminate = false;
                    break;
                case OutcomeKind::Cancelled:
                    snapshot_.state = TransferState::Cancelled;
                    break;
                case OutcomeKind::Failed:
                    // Keep the last good progress on screen
                    snapshot_.state = TransferState::Failed;
                    snapshot_.error = outcome.reason;
                    break;
            }
            last_outcome_ = outcome;
            callback = on_complete_;
        }

        if (outcome.is_failed()) {
            logger_->error("[TransferSession] Failed: " + outcome.reason);
        } else {
            logger_->info(std::string("[TransferSession] ") + to_string(outcome.kind));
        }

        if (callback) callback(outcome);

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            // A start() issued from the callback owns 'settled_' now
            if (generation_ == generation) {
                settled_ = true;
            }
        }
        settled_cv_.notify_all();
    }

} // namespace core
