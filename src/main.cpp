#include "app/CommandLine.hpp"
#include "common/Logger.hpp"
#include "core/CopyEngine.hpp"
#include "core/TransferSession.hpp"
#include "platform/linux/LinuxStorageProvider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

    std::atomic<bool> g_interrupted{false};

    void on_signal(int) {
        g_interrupted.store(true);
    }

    int exit_code(core::TransferState state) {
        switch (state) {
            case core::TransferState::Completed: return 0;
            case core::TransferState::Cancelled: return 130;
            default: return 1;
        }
    }

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = app::parse_command_line(args);
    if (parsed.is_err()) {
        std::cerr << parsed.error().message << "\n\n" << app::usage(argv[0]);
        return 2;
    }

    const app::CliOptions& options = parsed.unwrap();
    if (options.show_help) {
        std::cout << app::usage(argv[0]);
        return 0;
    }

    auto logger = std::make_shared<common::ConsoleLogger>(options.verbose);
    logger->info("[Main] isomaker starting");

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // 1. HAL
    auto storage = std::make_shared<platform::linux_os::LinuxStorageProvider>();

    // 2. Core
    auto engine = std::make_shared<core::CopyEngine>(storage, logger, options.engine);
    core::TransferSession session(engine, logger);

    std::atomic<bool> dirty{false};
    session.set_progress_callback([&dirty](const core::TransferSnapshot&) {
        dirty.store(true);
    });

    auto started = session.start(options.request);
    if (started.is_err()) {
        logger->error("[Main] " + started.error().message);
        return 2;
    }

    // 3. Render until terminal
    bool cancel_sent = false;
    while (!session.wait_for(std::chrono::milliseconds(200))) {
        if (g_interrupted.load() && !cancel_sent) {
            std::cout << std::endl;
            logger->info("[Main] Interrupted, cancelling");
            session.cancel();
            cancel_sent = true;
        }
        if (dirty.exchange(false)) {
            std::cout << "\r" << core::format_status(session.snapshot()) << std::flush;
        }
    }

    auto final_state = session.snapshot();
    std::cout << "\r" << core::format_status(final_state) << std::endl;
    return exit_code(final_state.state);
}
