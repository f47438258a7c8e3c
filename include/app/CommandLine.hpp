#pragma once
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "core/TransferTypes.hpp"

namespace app {

    // isomaker [options] <source> <destination>
    struct CliOptions {
        core::TransferRequest request;
        core::EngineConfig engine;
        bool verbose = false;
        bool show_help = false;
    };

    // Errors: ValidationError with a message suitable for the console
    common::Result<CliOptions> parse_command_line(const std::vector<std::string>& args);

    std::string usage(const std::string& program);

} // namespace app
