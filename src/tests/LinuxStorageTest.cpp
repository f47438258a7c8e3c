// ============================================================================
// Linux Storage Test Program
// ============================================================================
// Tests the POSIX storage provider and full transfers on real files:
// - LinuxStorageProvider (open, classify, size, truncate, errors)
// - 10 MiB copy in 4 MiB chunks (three samples, identical bytes)
// - Cancel right after the first chunk (exactly one chunk on disk)
// - Missing source (destination never created)
// - Destination that resolves to the source (refused, source intact)
//
// Run with: ./LinuxStorageTest
// Output: Console log with PASS/FAIL for each test
// ============================================================================

#ifdef ISOMAKER_PLATFORM_LINUX

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "LinuxStorageProvider.hpp"
#include "common/Logger.hpp"
#include "core/CopyEngine.hpp"
#include "core/TransferSession.hpp"
#include "testing/MockStorage.hpp"

using namespace platform::linux_os;
using namespace std::chrono_literals;

// ============================================================================
// Test Result Tracking
// ============================================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string details;
    double duration_ms;
};

std::vector<TestResult> g_results;

void log_test(const std::string& name, bool passed,
              const std::string& details = "", double duration_ms = 0) {
    TestResult r{name, passed, details, duration_ms};
    g_results.push_back(r);

    std::cout << (passed ? "[PASS]" : "[FAIL]")
              << " " << name;
    if (duration_ms > 0) {
        std::cout << " (" << std::fixed << std::setprecision(1)
                  << duration_ms << "ms)";
    }
    if (!details.empty()) {
        std::cout << " - " << details;
    }
    std::cout << std::endl;
}

// ============================================================================
// Helpers
// ============================================================================

static const size_t MiB = 1024 * 1024;

static std::string g_test_dir;

static std::vector<uint8_t> make_pattern(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> data(size);
    for (auto& b : data) {
        b = static_cast<uint8_t>(rng() & 0xFF);
    }
    return data;
}

static bool write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static bool exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static std::shared_ptr<core::CopyEngine> make_engine(
    std::shared_ptr<interfaces::IStorageProvider> storage, size_t chunk_size
) {
    core::EngineConfig config;
    config.chunk_size = chunk_size;
    return std::make_shared<core::CopyEngine>(
        storage, std::make_shared<common::NullLogger>(), config);
}

// Real files, but the N-th read of every source parks on a gate.
class GatedLinuxStorage : public interfaces::IStorageProvider {
public:
    GatedLinuxStorage(int gate_read_at, std::shared_ptr<testing::ReadGate> gate)
        : gate_read_at_(gate_read_at), gate_(std::move(gate)) {}

    common::Result<std::shared_ptr<interfaces::IByteSource>> open_source(
        const std::string& path) override {
        auto inner = real_.open_source(path);
        if (inner.is_err()) return inner;
        std::shared_ptr<interfaces::IByteSource> source =
            std::make_shared<GatedSource>(inner.unwrap(), gate_read_at_, gate_);
        return common::Result<std::shared_ptr<interfaces::IByteSource>>::ok(std::move(source));
    }

    common::Result<std::shared_ptr<interfaces::IByteSink>> open_destination(
        const std::string& path) override {
        return real_.open_destination(path);
    }

private:
    class GatedSource : public interfaces::IByteSource {
    public:
        GatedSource(std::shared_ptr<interfaces::IByteSource> inner, int gate_at,
                    std::shared_ptr<testing::ReadGate> gate)
            : inner_(std::move(inner)), gate_at_(gate_at), gate_(std::move(gate)) {}

        interfaces::TargetKind kind() const override { return inner_->kind(); }
        common::Result<uint64_t> size() override { return inner_->size(); }

        common::Result<size_t> read(uint8_t* buffer, size_t capacity) override {
            if (reads_++ == gate_at_) gate_->wait();
            return inner_->read(buffer, capacity);
        }

        bool is_same_target(const std::string& path) const override {
            return inner_->is_same_target(path);
        }

    private:
        std::shared_ptr<interfaces::IByteSource> inner_;
        int gate_at_;
        std::shared_ptr<testing::ReadGate> gate_;
        int reads_ = 0;
    };

    LinuxStorageProvider real_;
    int gate_read_at_;
    std::shared_ptr<testing::ReadGate> gate_;
};

// ============================================================================
// Test: LinuxStorageProvider
// ============================================================================

void test_storage_provider() {
    std::cout << "\n=== Testing LinuxStorageProvider ===" << std::endl;

    LinuxStorageProvider storage;

    // Test 1: source size and exact reads
    {
        std::string path = g_test_dir + "/size.bin";
        auto data = make_pattern(12345, 1);
        write_file(path, data);

        auto source = storage.open_source(path);
        bool passed = source.is_ok();
        std::string details;
        if (passed) {
            auto size = source.unwrap()->size();
            std::vector<uint8_t> buffer(20000);
            auto n = source.unwrap()->read(buffer.data(), buffer.size());
            auto eof = source.unwrap()->read(buffer.data(), buffer.size());
            passed = size.is_ok() && size.unwrap() == data.size() &&
                     n.is_ok() && n.unwrap() == data.size() &&
                     eof.is_ok() && eof.unwrap() == 0 &&
                     source.unwrap()->kind() == interfaces::TargetKind::RegularFile &&
                     std::equal(data.begin(), data.end(), buffer.begin());
            details = "size=" + std::to_string(size.is_ok() ? size.unwrap() : 0);
        } else {
            details = source.error().message;
        }
        log_test("LinuxStorageProvider::open_source", passed, details);
    }

    // Test 2: missing source and directory source
    {
        auto missing = storage.open_source(g_test_dir + "/does_not_exist");
        auto directory = storage.open_source(g_test_dir);
        bool passed = missing.is_err() &&
                      missing.error().code == common::ErrorCode::SourceOpenError &&
                      missing.error().message.rfind("source error:", 0) == 0 &&
                      directory.is_err() &&
                      directory.error().code == common::ErrorCode::SourceOpenError;
        log_test("LinuxStorageProvider::source_errors", passed,
                 missing.is_err() ? missing.error().message : "");
    }

    // Test 3: destination truncates an existing file
    {
        std::string path = g_test_dir + "/truncate.bin";
        write_file(path, make_pattern(5000, 3));

        auto sink = storage.open_destination(path);
        bool passed = sink.is_ok();
        if (passed) {
            std::vector<uint8_t> small = {1, 2, 3};
            passed = sink.unwrap()->write_all(small.data(), small.size()).is_ok() &&
                     sink.unwrap()->sync().is_ok();
        }
        passed = passed && read_file(path) == std::vector<uint8_t>{1, 2, 3};
        log_test("LinuxStorageProvider::truncate_destination", passed);
    }

    // Test 4: destination in a missing directory
    {
        auto sink = storage.open_destination(g_test_dir + "/no/such/dir/out.bin");
        bool passed = sink.is_err() &&
                      sink.error().code == common::ErrorCode::DestinationOpenError &&
                      sink.error().message.rfind("destination error:", 0) == 0;
        log_test("LinuxStorageProvider::destination_error", passed,
                 sink.is_err() ? sink.error().message : "");
    }

    // Test 5: classify
    {
        bool passed =
            LinuxStorageProvider::classify("/dev/null") == interfaces::TargetKind::Other &&
            LinuxStorageProvider::classify(g_test_dir + "/size.bin") == interfaces::TargetKind::RegularFile &&
            LinuxStorageProvider::classify(g_test_dir + "/not_yet") == interfaces::TargetKind::RegularFile;
        log_test("LinuxStorageProvider::classify", passed);
    }

    // Test 6: same-file detection follows the inode, not the spelling
    {
        std::string path = g_test_dir + "/size.bin";
        auto source = storage.open_source(path);
        bool passed = source.is_ok() &&
                      source.unwrap()->is_same_target(path) &&
                      source.unwrap()->is_same_target(g_test_dir + "/./size.bin") &&
                      !source.unwrap()->is_same_target(g_test_dir + "/truncate.bin") &&
                      !source.unwrap()->is_same_target(g_test_dir + "/not_yet");
        log_test("LinuxStorageProvider::is_same_target", passed);
    }
}

// ============================================================================
// Test: Transfers on real files
// ============================================================================

void test_transfers() {
    std::cout << "\n=== Testing Transfers ===" << std::endl;

    auto logger = std::make_shared<common::NullLogger>();
    auto storage = std::make_shared<LinuxStorageProvider>();

    std::string source_path = g_test_dir + "/source.iso";
    auto data = make_pattern(10 * MiB, 42);
    write_file(source_path, data);

    // Test 1: 10 MiB in 4 MiB chunks
    {
        std::string dest = g_test_dir + "/copy_a.img";
        auto engine = make_engine(storage, 4 * MiB);
        core::ProgressChannel channel(100);
        common::CancellationSource cancel;

        auto start = std::chrono::high_resolution_clock::now();
        auto outcome = engine->run({source_path, dest}, cancel.get_token(), channel);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        auto samples = channel.drain();
        bool passed = outcome.is_success() &&
                      samples.size() == 3 &&
                      samples[0].bytes_copied == 4 * MiB &&
                      samples[1].bytes_copied == 8 * MiB &&
                      samples[2].bytes_copied == 10 * MiB &&
                      samples[2].total_bytes == 10 * MiB &&
                      read_file(dest) == data;
        log_test("Transfer::full_copy_10MiB", passed,
                 "samples=" + std::to_string(samples.size()), ms);
    }

    // Test 2: same copy through the session, final fraction 1.0
    {
        std::string dest = g_test_dir + "/copy_session.img";
        core::TransferSession session(make_engine(storage, 4 * MiB), logger);

        std::mutex mutex;
        std::vector<double> fractions;
        session.set_progress_callback([&](const core::TransferSnapshot& s) {
            std::lock_guard<std::mutex> lock(mutex);
            fractions.push_back(s.fraction);
        });

        auto started = session.start({source_path, dest});
        auto snap = session.wait();

        bool monotonic = true;
        for (size_t i = 1; i < fractions.size(); ++i) {
            if (fractions[i] < fractions[i - 1]) monotonic = false;
        }
        bool passed = started.is_ok() &&
                      snap.state == core::TransferState::Completed &&
                      snap.fraction == 1.0 && snap.bytes_copied == 10 * MiB &&
                      monotonic && !fractions.empty() && fractions.back() == 1.0 &&
                      read_file(dest) == data;
        log_test("Transfer::session_complete", passed,
                 "updates=" + std::to_string(fractions.size()));
    }

    // Test 3: cancel right after the first chunk lands
    {
        std::string dest = g_test_dir + "/copy_b.img";
        auto gate = std::make_shared<testing::ReadGate>();
        auto gated = std::make_shared<GatedLinuxStorage>(1, gate);
        core::TransferSession session(make_engine(gated, 4 * MiB), logger);

        session.set_progress_callback([&session](const core::TransferSnapshot&) {
            session.cancel();
        });

        session.start({source_path, dest});
        auto snap = session.wait();
        gate->open();

        auto written = read_file(dest);
        bool passed = snap.state == core::TransferState::Cancelled &&
                      written.size() == 4 * MiB &&
                      std::equal(written.begin(), written.end(), data.begin());
        log_test("Transfer::cancel_after_first_chunk", passed,
                 "written=" + std::to_string(written.size()));
    }

    // Test 4: cancel before any read leaves an empty destination
    {
        std::string dest = g_test_dir + "/copy_empty.img";
        auto engine = make_engine(storage, 4 * MiB);
        core::ProgressChannel channel(100);
        common::CancellationSource cancel;
        cancel.cancel();

        auto outcome = engine->run({source_path, dest}, cancel.get_token(), channel);
        bool passed = outcome.is_cancelled() && exists(dest) && read_file(dest).empty();
        log_test("Transfer::cancel_before_read", passed);
    }

    // Test 5: missing source never creates the destination
    {
        std::string dest = g_test_dir + "/copy_c.img";
        core::TransferSession session(make_engine(storage, 4 * MiB), logger);

        session.start({g_test_dir + "/missing.iso", dest});
        auto snap = session.wait();
        auto outcome = session.last_outcome();

        bool passed = snap.state == core::TransferState::Failed &&
                      outcome && outcome->code == common::ErrorCode::SourceOpenError &&
                      snap.error.rfind("source error:", 0) == 0 &&
                      !exists(dest);
        log_test("Transfer::missing_source", passed, snap.error);
    }

    // Test 6: streaming to a character device skips fsync
    {
        auto engine = make_engine(storage, 1 * MiB);
        core::ProgressChannel channel(100);
        common::CancellationSource cancel;

        auto outcome = engine->run({source_path, "/dev/null"}, cancel.get_token(), channel);
        log_test("Transfer::to_dev_null", outcome.is_success(), outcome.reason);
    }

    // Test 7: copying a file onto itself fails and leaves it intact
    {
        std::string path = g_test_dir + "/self.bin";
        auto self_data = make_pattern(1 * MiB, 7);
        write_file(path, self_data);

        auto engine = make_engine(storage, 256 * 1024);
        core::ProgressChannel channel(100);
        common::CancellationSource cancel;

        auto outcome = engine->run({path, g_test_dir + "/./self.bin"}, cancel.get_token(), channel);
        bool passed = outcome.is_failed() &&
                      outcome.code == common::ErrorCode::DestinationOpenError &&
                      outcome.reason.rfind("destination error:", 0) == 0 &&
                      read_file(path) == self_data &&
                      channel.drain().empty();
        log_test("Transfer::destination_is_source", passed, outcome.reason);
    }
}

// ============================================================================
// Main Test Runner
// ============================================================================

int print_summary() {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    int passed = 0, failed = 0;
    for (const auto& r : g_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "Total:  " << g_results.size() << std::endl;

    if (failed > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& r : g_results) {
            if (!r.passed) {
                std::cout << "  - " << r.name << ": " << r.details << std::endl;
            }
        }
    }

    std::cout << std::string(60, '=') << std::endl;
    return failed;
}

static void remove_test_dir() {
    const char* names[] = {
        "size.bin", "truncate.bin", "source.iso", "copy_a.img",
        "copy_session.img", "copy_b.img", "copy_empty.img", "copy_c.img",
        "self.bin"
    };
    for (const char* name : names) {
        std::remove((g_test_dir + "/" + name).c_str());
    }
    rmdir(g_test_dir.c_str());
}

int main() {
    std::cout << "Linux Storage Test Suite" << std::endl;
    std::cout << "========================" << std::endl;

    char dir_template[] = "/tmp/isomaker_test_XXXXXX";
    if (!mkdtemp(dir_template)) {
        std::cerr << "[ERROR] Cannot create temp directory" << std::endl;
        return 1;
    }
    g_test_dir = dir_template;

    test_storage_provider();
    test_transfers();

    int failed = print_summary();
    remove_test_dir();
    return (g_results.empty() || failed > 0) ? 1 : 0;
}

#else
// Non-Linux stub
#include <iostream>
int main() {
    std::cout << "This test is only for Linux platform." << std::endl;
    return 1;
}
#endif
