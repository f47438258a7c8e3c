#pragma once
#include <memory>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "core/ProgressChannel.hpp"
#include "core/ThreadPool.hpp"
#include "core/TransferTypes.hpp"
#include "interfaces/IStorage.hpp"

namespace core {

    // Streams one source into one destination in fixed-size chunks.
    //
    // Contract:
    // 1. Blocking call: run() returns once the source is exhausted, an I/O
    //    error occurs, or cancellation is observed. It never throws on I/O
    //    failure; every path yields exactly one TransferOutcome.
    // 2. Each read is executed on the engine's I/O pool and raced against
    //    the cancellation token. Cancellation wins a tie. After it is
    //    observed nothing more is written to the destination.
    // 3. A sample is pushed after every successful chunk write and never
    //    after run() returns. run() does not close the channel.
    //
    // One engine may serve consecutive transfers; concurrent run() calls are
    // not supported (the session guarantees a single active transfer).
    class CopyEngine {
    public:
        CopyEngine(
            std::shared_ptr<interfaces::IStorageProvider> storage,
            std::shared_ptr<common::ILogger> logger,
            EngineConfig config = {}
        );
        ~CopyEngine();

        CopyEngine(const CopyEngine&) = delete;
        CopyEngine& operator=(const CopyEngine&) = delete;

        TransferOutcome run(
            const TransferRequest& request,
            common::CancellationToken token,
            ProgressChannel& progress
        );

        const EngineConfig& config() const { return config_; }

    private:
        std::shared_ptr<interfaces::IStorageProvider> storage_;
        std::shared_ptr<common::ILogger> logger_;
        EngineConfig config_;
        ThreadPool io_pool_;
    };

} // namespace core
