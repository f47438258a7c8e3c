#include "core/TransferTypes.hpp"
#include <cstdio>

namespace core {

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle:      return "Idle";
        case TransferState::Running:   return "Running";
        case TransferState::Completed: return "Completed";
        case TransferState::Cancelled: return "Cancelled";
        case TransferState::Failed:    return "Failed";
    }
    return "Unknown";
}

const char* to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:   return "Success";
        case OutcomeKind::Cancelled: return "Cancelled";
        case OutcomeKind::Failed:    return "Failed";
    }
    return "Unknown";
}

std::string format_status(const TransferSnapshot& snapshot) {
    if (!snapshot.error.empty()) {
        return snapshot.error;
    }

    switch (snapshot.state) {
        case TransferState::Running: {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "Copying: %.1f%%", snapshot.fraction * 100.0);
            return buf;
        }
        case TransferState::Completed:
            return "Complete!";
        case TransferState::Cancelled:
            return "Cancelled";
        case TransferState::Failed:
            return "Failed";
        case TransferState::Idle:
            break;
    }
    return "Ready";
}

} // namespace core
