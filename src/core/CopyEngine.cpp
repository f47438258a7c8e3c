#include "core/CopyEngine.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace core {

    namespace {

        // One read in flight on the I/O pool. Shared with the pool task so a
        // read abandoned by cancellation can still finish safely.
        struct PendingRead {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            common::Result<size_t> result{size_t{0}};
        };

        std::string describe(const TransferRequest& request) {
            return request.source_path + " -> " + request.destination_path;
        }

    } // namespace

    CopyEngine::CopyEngine(
        std::shared_ptr<interfaces::IStorageProvider> storage,
        std::shared_ptr<common::ILogger> logger,
        EngineConfig config
    ) : storage_(std::move(storage)),
        logger_(logger ? std::move(logger) : std::make_shared<common::NullLogger>()),
        config_(config),
        io_pool_(config.io_threads) {
        if (config_.chunk_size == 0) {
            config_.chunk_size = DEFAULT_CHUNK_SIZE;
        }
    }

    CopyEngine::~CopyEngine() = default;

    TransferOutcome CopyEngine::run(
        const TransferRequest& request,
        common::CancellationToken token,
        ProgressChannel& progress
    ) {
        auto fail = [this](const common::AppError& error) {
            logger_->error("[CopyEngine] " + error.message);
            return TransferOutcome::failed(error);
        };

        logger_->info("[CopyEngine] Starting " + describe(request));

        // 1. Source
        auto source_result = storage_->open_source(request.source_path);
        if (source_result.is_err()) {
            return fail(source_result.error());
        }
        std::shared_ptr<interfaces::IByteSource> source = source_result.unwrap();

        // 2. Size (denominator only)
        auto size_result = source->size();
        if (size_result.is_err()) {
            return fail(size_result.error());
        }
        const uint64_t total = size_result.unwrap();

        // 3. Destination
        if (source->is_same_target(request.destination_path)) {
            return fail(common::AppError{
                common::ErrorCode::DestinationOpenError,
                "destination error: destination is the source",
                request.destination_path});
        }
        auto sink_result = storage_->open_destination(request.destination_path);
        if (sink_result.is_err()) {
            return fail(sink_result.error());
        }
        std::shared_ptr<interfaces::IByteSink> sink = sink_result.unwrap();

        logger_->info("[CopyEngine] " + std::to_string(total) + " bytes from " +
                      interfaces::to_string(source->kind()) + " to " +
                      interfaces::to_string(sink->kind()));

        auto buffer = std::make_shared<std::vector<uint8_t>>(config_.chunk_size);
        uint64_t copied = 0;

        auto cancelled = [this, &copied]() {
            logger_->info("[CopyEngine] Cancelled after " + std::to_string(copied) + " bytes");
            return TransferOutcome::cancelled();
        };

        // 4. Transfer loop
        while (true) {
            if (token.is_cancellation_requested()) {
                return cancelled();
            }

            auto pending = std::make_shared<PendingRead>();
            auto registration = token.on_cancel([pending]() {
                std::lock_guard<std::mutex> lock(pending->mutex);
                pending->cv.notify_all();
            });

            bool queued = io_pool_.submit_detached([source, buffer, pending]() {
                common::Result<size_t> result{size_t{0}};
                try {
                    result = source->read(buffer->data(), buffer->size());
                } catch (const std::exception& e) {
                    result = common::Result<size_t>::err(
                        common::ErrorCode::ReadError, std::string("read error: ") + e.what());
                }

                {
                    std::lock_guard<std::mutex> lock(pending->mutex);
                    pending->result = std::move(result);
                    pending->done = true;
                }
                pending->cv.notify_all();
            });

            if (!queued) {
                return fail(common::AppError{
                    common::ErrorCode::ReadError, "read error: I/O pool is stopped", ""});
            }

            // Race: chunk ready vs cancellation fired. Cancellation first.
            common::Result<size_t> read_result{size_t{0}};
            {
                std::unique_lock<std::mutex> lock(pending->mutex);
                pending->cv.wait(lock, [&]() {
                    return pending->done || token.is_cancellation_requested();
                });

                if (token.is_cancellation_requested()) {
                    return cancelled();
                }
                read_result = std::move(pending->result);
            }

            if (read_result.is_err()) {
                return fail(read_result.error());
            }

            const size_t n = read_result.unwrap();
            if (n == 0) break;  // End of source

            auto write_result = sink->write_all(buffer->data(), n);
            if (write_result.is_err()) {
                return fail(write_result.error());
            }

            copied += n;
            progress.push(ProgressSample{copied, total});
            logger_->debug("[CopyEngine] " + std::to_string(copied) + "/" + std::to_string(total));
        }

        // 5. Flush
        if (config_.sync_on_finish && sink->kind() != interfaces::TargetKind::Other) {
            auto sync_result = sink->sync();
            if (sync_result.is_err()) {
                return fail(sync_result.error());
            }
        }

        logger_->info("[CopyEngine] Finished " + describe(request) + " (" +
                      std::to_string(copied) + " bytes)");
        return TransferOutcome::success();
    }

} // namespace core
