#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include "common/Result.hpp"

namespace core {

// ============================================================================
// Transfer Data Model
// ============================================================================

// Reference chunk size: big enough to amortize syscalls on block devices,
// small enough to keep cancellation responsive.
constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;
constexpr size_t DEFAULT_PROGRESS_CAPACITY = 100;

struct EngineConfig {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t progress_capacity = DEFAULT_PROGRESS_CAPACITY;
    size_t io_threads = 1;
    bool sync_on_finish = true;   // fsync the destination before reporting Success
};

struct TransferRequest {
    std::string source_path;
    std::string destination_path;

    bool is_valid() const {
        return !source_path.empty() && !destination_path.empty();
    }
};

struct ProgressSample {
    uint64_t bytes_copied = 0;
    uint64_t total_bytes = 0;     // 0 = size unknown
};

enum class OutcomeKind {
    Success,
    Cancelled,
    Failed
};

struct TransferOutcome {
    OutcomeKind kind = OutcomeKind::Failed;
    common::ErrorCode code = common::ErrorCode::Unknown;
    std::string reason;           // Empty unless Failed

    static TransferOutcome success() {
        return {OutcomeKind::Success, common::ErrorCode::Success, ""};
    }
    static TransferOutcome cancelled() {
        return {OutcomeKind::Cancelled, common::ErrorCode::Cancelled, ""};
    }
    static TransferOutcome failed(common::ErrorCode code, std::string reason) {
        return {OutcomeKind::Failed, code, std::move(reason)};
    }
    static TransferOutcome failed(const common::AppError& error) {
        return failed(error.code, error.message);
    }

    bool is_success() const { return kind == OutcomeKind::Success; }
    bool is_cancelled() const { return kind == OutcomeKind::Cancelled; }
    bool is_failed() const { return kind == OutcomeKind::Failed; }
};

enum class TransferState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* to_string(TransferState state) noexcept;
const char* to_string(OutcomeKind kind) noexcept;

// What the observer/UI sees of the current transfer
struct TransferSnapshot {
    TransferState state = TransferState::Idle;
    uint64_t bytes_copied = 0;
    uint64_t total_bytes = 0;
    double fraction = 0.0;        // [0, 1]; stays 0 while indeterminate
    bool indeterminate = true;    // true until a sample with a known size arrives
    std::string error;            // Last error text, cleared by the next start

    bool is_terminal() const {
        return state == TransferState::Completed ||
               state == TransferState::Cancelled ||
               state == TransferState::Failed;
    }
};

// "Ready", "Copying: 42.0%", "Complete!", "Cancelled" or the error text
std::string format_status(const TransferSnapshot& snapshot);

using ProgressCallback = std::function<void(const TransferSnapshot&)>;
using CompletionCallback = std::function<void(const TransferOutcome&)>;

} // namespace core
