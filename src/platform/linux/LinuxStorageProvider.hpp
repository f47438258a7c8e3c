#pragma once
#include "interfaces/IStorage.hpp"
#include <string>

namespace platform {
namespace linux_os {

// ============================================================================
// LinuxStorageProvider - POSIX byte source/sink for the copy engine
// ============================================================================
// - open/fstat for regular files, ioctl(BLKGETSIZE64) for block devices
// - read/write loops that retry EINTR and fill/drain the whole buffer
// - fsync on sync()
//
// Destinations that already exist as block devices are opened O_WRONLY
// without O_CREAT/O_TRUNC; everything else is created or truncated (0644).
// ============================================================================

// Owns a file descriptor; closed on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();

private:
    int fd_ = -1;
};

class LinuxFileSource final : public interfaces::IByteSource {
public:
    LinuxFileSource(FileDescriptor fd, interfaces::TargetKind kind, std::string path);

    interfaces::TargetKind kind() const override { return kind_; }
    common::Result<uint64_t> size() override;
    common::Result<size_t> read(uint8_t* buffer, size_t capacity) override;
    bool is_same_target(const std::string& path) const override;

private:
    FileDescriptor fd_;
    interfaces::TargetKind kind_;
    std::string path_;
};

class LinuxFileSink final : public interfaces::IByteSink {
public:
    LinuxFileSink(FileDescriptor fd, interfaces::TargetKind kind, std::string path);

    interfaces::TargetKind kind() const override { return kind_; }
    common::EmptyResult write_all(const uint8_t* data, size_t size) override;
    common::EmptyResult sync() override;

private:
    FileDescriptor fd_;
    interfaces::TargetKind kind_;
    std::string path_;
};

class LinuxStorageProvider final : public interfaces::IStorageProvider {
public:
    LinuxStorageProvider() = default;
    ~LinuxStorageProvider() override = default;

    common::Result<std::shared_ptr<interfaces::IByteSource>> open_source(
        const std::string& path) override;

    common::Result<std::shared_ptr<interfaces::IByteSink>> open_destination(
        const std::string& path) override;

    // Classifies an existing path; RegularFile for paths that do not exist yet.
    static interfaces::TargetKind classify(const std::string& path);
};

} // namespace linux_os
} // namespace platform
