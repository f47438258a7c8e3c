#pragma once
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "core/CopyEngine.hpp"
#include "core/ProgressChannel.hpp"
#include "core/ThreadPool.hpp"
#include "core/TransferTypes.hpp"

namespace core {

    // Owns at most one in-flight transfer.
    //
    //   Idle/terminal --start()--> Running --outcome--> Completed | Cancelled | Failed
    //
    // start() spawns two tasks on the session pool: the copy task running the
    // engine, and a drain task reducing the progress channel to its latest
    // sample. The copy task closes the channel once the engine returns, joins
    // the drain task and only then publishes the terminal state, so no
    // progress update can land after the outcome.
    //
    // cancel() only signals; the state changes when the engine reports back.
    class TransferSession {
    public:
        TransferSession(
            std::shared_ptr<CopyEngine> engine,
            std::shared_ptr<common::ILogger> logger
        );
        ~TransferSession();

        TransferSession(const TransferSession&) = delete;
        TransferSession& operator=(const TransferSession&) = delete;

        // Callbacks run on session worker threads. Set them before start().
        void set_progress_callback(ProgressCallback callback);
        void set_completion_callback(CompletionCallback callback);

        // Errors: ValidationError (empty path, state unchanged),
        //         Busy (a transfer is already running)
        common::EmptyResult start(const TransferRequest& request);

        // No-op unless Running. Never blocks on the engine.
        void cancel();

        TransferSnapshot snapshot() const;
        TransferState get_state() const;
        std::optional<TransferOutcome> last_outcome() const;

        // Blocks until the current transfer is terminal and its completion
        // callback has returned. Returns immediately when nothing is running.
        TransferSnapshot wait();
        bool wait_for(std::chrono::milliseconds timeout);

    private:
        void copy_routine(
            TransferRequest request,
            common::CancellationToken token,
            std::shared_ptr<ProgressChannel> channel,
            std::future<uint64_t> drain,
            uint64_t generation
        );
        uint64_t drain_routine(std::shared_ptr<ProgressChannel> channel);
        void apply_progress(const ProgressSample& sample);
        void finish(const TransferOutcome& outcome, uint64_t generation);

    private:
        std::shared_ptr<CopyEngine> engine_;
        std::shared_ptr<common::ILogger> logger_;

        mutable std::mutex state_mutex_;
        std::condition_variable settled_cv_;
        TransferSnapshot snapshot_;
        std::optional<TransferOutcome> last_outcome_;
        bool settled_ = true;
        uint64_t generation_ = 0;   // Bumped by every accepted start()

        ProgressCallback on_progress_;
        CompletionCallback on_complete_;

        common::CancellationSource cancel_source_;
        std::future<void> copy_task_;

        // Last member: joined first on destruction
        ThreadPool pool_;
    };

} // namespace core
