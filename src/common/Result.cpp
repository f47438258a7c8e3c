#include "common/Result.hpp"
#include <cstring>

namespace common {

    const char* to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::Success:              return "Success";
            case ErrorCode::Cancelled:            return "Cancelled";
            case ErrorCode::ValidationError:      return "ValidationError";
            case ErrorCode::SourceOpenError:      return "SourceOpenError";
            case ErrorCode::MetadataError:        return "MetadataError";
            case ErrorCode::DestinationOpenError: return "DestinationOpenError";
            case ErrorCode::ReadError:            return "ReadError";
            case ErrorCode::WriteError:           return "WriteError";
            case ErrorCode::Busy:                 return "Busy";
            case ErrorCode::Unknown:              break;
        }
        return "Unknown";
    }

    std::string phase_error(const char* phase, int errnum) {
        return std::string(phase) + " error: " + std::strerror(errnum);
    }

} // namespace common
