#include "LinuxStorageProvider.hpp"

#include <cerrno>
#include <utility>

// POSIX headers
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {
namespace linux_os {

// ============================================================================
// FileDescriptor
// ============================================================================

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.release();
    }
    return *this;
}

int FileDescriptor::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

static interfaces::TargetKind kind_from_mode(mode_t mode) {
    if (S_ISREG(mode)) return interfaces::TargetKind::RegularFile;
    if (S_ISBLK(mode)) return interfaces::TargetKind::BlockDevice;
    return interfaces::TargetKind::Other;
}

// ============================================================================
// Source
// ============================================================================

LinuxFileSource::LinuxFileSource(FileDescriptor fd, interfaces::TargetKind kind, std::string path)
    : fd_(std::move(fd)), kind_(kind), path_(std::move(path)) {}

common::Result<uint64_t> LinuxFileSource::size() {
    struct stat st;
    if (fstat(fd_.get(), &st) != 0) {
        return common::Result<uint64_t>::err(
            common::ErrorCode::MetadataError,
            common::phase_error("metadata", errno), path_);
    }

    if (S_ISBLK(st.st_mode)) {
        // Block devices report st_size == 0; ask the driver for capacity
        uint64_t bytes = 0;
        if (ioctl(fd_.get(), BLKGETSIZE64, &bytes) != 0) {
            return common::Result<uint64_t>::err(
                common::ErrorCode::MetadataError,
                common::phase_error("metadata", errno), path_);
        }
        return common::Result<uint64_t>::ok(bytes);
    }

    if (!S_ISREG(st.st_mode)) {
        return common::Result<uint64_t>::ok(0);
    }

    return common::Result<uint64_t>::ok(static_cast<uint64_t>(st.st_size));
}

common::Result<size_t> LinuxFileSource::read(uint8_t* buffer, size_t capacity) {
    size_t filled = 0;

    // Fill the whole chunk unless EOF comes first
    while (filled < capacity) {
        ssize_t n = ::read(fd_.get(), buffer + filled, capacity - filled);
        if (n < 0) {
            if (errno == EINTR) continue;
            return common::Result<size_t>::err(
                common::ErrorCode::ReadError,
                common::phase_error("read", errno), path_);
        }
        if (n == 0) break;  // EOF
        filled += static_cast<size_t>(n);
    }

    return common::Result<size_t>::ok(filled);
}

bool LinuxFileSource::is_same_target(const std::string& path) const {
    struct stat own;
    struct stat other;
    if (fstat(fd_.get(), &own) != 0 || stat(path.c_str(), &other) != 0) {
        return false;
    }
    return own.st_dev == other.st_dev && own.st_ino == other.st_ino;
}

// ============================================================================
// Sink
// ============================================================================

LinuxFileSink::LinuxFileSink(FileDescriptor fd, interfaces::TargetKind kind, std::string path)
    : fd_(std::move(fd)), kind_(kind), path_(std::move(path)) {}

common::EmptyResult LinuxFileSink::write_all(const uint8_t* data, size_t size) {
    size_t written = 0;

    while (written < size) {
        ssize_t n = ::write(fd_.get(), data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return common::EmptyResult::err(
                common::ErrorCode::WriteError,
                common::phase_error("write", errno), path_);
        }
        if (n == 0) {
            // Device full or gone; write(2) made no progress
            return common::EmptyResult::err(
                common::ErrorCode::WriteError,
                "write error: short write (" + std::to_string(written) +
                " of " + std::to_string(size) + " bytes)", path_);
        }
        written += static_cast<size_t>(n);
    }

    return common::EmptyResult::success();
}

common::EmptyResult LinuxFileSink::sync() {
    if (fsync(fd_.get()) != 0) {
        return common::EmptyResult::err(
            common::ErrorCode::WriteError,
            common::phase_error("write", errno), path_);
    }
    return common::EmptyResult::success();
}

// ============================================================================
// Provider
// ============================================================================

interfaces::TargetKind LinuxStorageProvider::classify(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return interfaces::TargetKind::RegularFile;
    }
    return kind_from_mode(st.st_mode);
}

common::Result<std::shared_ptr<interfaces::IByteSource>> LinuxStorageProvider::open_source(
    const std::string& path
) {
    using SourceResult = common::Result<std::shared_ptr<interfaces::IByteSource>>;

    FileDescriptor fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return SourceResult::err(
            common::ErrorCode::SourceOpenError,
            common::phase_error("source", errno), path);
    }

    struct stat st;
    if (fstat(fd.get(), &st) != 0) {
        return SourceResult::err(
            common::ErrorCode::MetadataError,
            common::phase_error("metadata", errno), path);
    }

    if (S_ISDIR(st.st_mode)) {
        return SourceResult::err(
            common::ErrorCode::SourceOpenError,
            common::phase_error("source", EISDIR), path);
    }

    std::shared_ptr<interfaces::IByteSource> source =
        std::make_shared<LinuxFileSource>(std::move(fd), kind_from_mode(st.st_mode), path);
    return SourceResult::ok(std::move(source));
}

common::Result<std::shared_ptr<interfaces::IByteSink>> LinuxStorageProvider::open_destination(
    const std::string& path
) {
    using SinkResult = common::Result<std::shared_ptr<interfaces::IByteSink>>;

    interfaces::TargetKind kind = classify(path);

    int flags = O_WRONLY | O_CLOEXEC;
    if (kind == interfaces::TargetKind::RegularFile) {
        flags |= O_CREAT | O_TRUNC;
    }

    FileDescriptor fd(open(path.c_str(), flags, 0644));
    if (!fd.valid()) {
        return SinkResult::err(
            common::ErrorCode::DestinationOpenError,
            common::phase_error("destination", errno), path);
    }

    std::shared_ptr<interfaces::IByteSink> sink =
        std::make_shared<LinuxFileSink>(std::move(fd), kind, path);
    return SinkResult::ok(std::move(sink));
}

} // namespace linux_os
} // namespace platform
