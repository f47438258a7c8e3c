#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "common/Result.hpp"

namespace interfaces {

// ============================================================================
// Storage Interface
// ============================================================================
// Byte-level access to a copy source and a copy destination. The copy engine
// only sees IByteSource / IByteSink; how a target was discovered or whether it
// is a regular file or a raw block device stays behind IStorageProvider.
//
// Error messages already carry their phase prefix ("read error: ...") so the
// engine can surface them verbatim.
// ============================================================================

enum class TargetKind {
    RegularFile,
    BlockDevice,
    Other          // Character devices, pipes: streamed, size unknown
};

inline const char* to_string(TargetKind kind) noexcept {
    switch (kind) {
        case TargetKind::RegularFile: return "file";
        case TargetKind::BlockDevice: return "block device";
        case TargetKind::Other:       return "stream";
    }
    return "unknown";
}

class IByteSource {
public:
    virtual ~IByteSource() = default;

    virtual TargetKind kind() const = 0;

    // Total size in bytes. 0 means unknown.
    virtual common::Result<uint64_t> size() = 0;

    // Reads up to 'capacity' bytes. Returns 0 at end of source.
    // Must be safe to call from a worker thread other than the opener's.
    virtual common::Result<size_t> read(uint8_t* buffer, size_t capacity) = 0;

    // True when 'path' resolves to this very source. Opening such a path as
    // the destination would truncate the data still to be read.
    virtual bool is_same_target(const std::string& path) const = 0;
};

class IByteSink {
public:
    virtual ~IByteSink() = default;

    virtual TargetKind kind() const = 0;

    // Writes all 'size' bytes or fails; a short write is an error.
    virtual common::EmptyResult write_all(const uint8_t* data, size_t size) = 0;

    // Pushes written data to stable storage.
    virtual common::EmptyResult sync() = 0;
};

class IStorageProvider {
public:
    virtual ~IStorageProvider() = default;

    // Failure: ErrorCode::SourceOpenError
    virtual common::Result<std::shared_ptr<IByteSource>> open_source(
        const std::string& path) = 0;

    // Creates/truncates a file, or opens a block device for writing.
    // Failure: ErrorCode::DestinationOpenError
    virtual common::Result<std::shared_ptr<IByteSink>> open_destination(
        const std::string& path) = 0;
};

} // namespace interfaces
