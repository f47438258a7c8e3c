#include "app/CommandLine.hpp"
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace app {

    namespace {

        using OptionsResult = common::Result<CliOptions>;

        // Strict unsigned parse: digits only, > 0, no overflow
        bool parse_count(const std::string& text, unsigned long long& out) {
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            unsigned long long value = std::strtoull(text.c_str(), &end, 10);
            if (errno == ERANGE || end == nullptr || *end != '\0' || value == 0) {
                return false;
            }
            out = value;
            return true;
        }

        OptionsResult invalid(const std::string& message) {
            return OptionsResult::err(common::ErrorCode::ValidationError, message);
        }

    } // namespace

    common::Result<CliOptions> parse_command_line(const std::vector<std::string>& args) {
        CliOptions options;
        std::vector<std::string> positional;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "-h" || arg == "--help") {
                options.show_help = true;
                return OptionsResult::ok(options);
            } else if (arg == "-v" || arg == "--verbose") {
                options.verbose = true;
            } else if (arg == "--no-sync") {
                options.engine.sync_on_finish = false;
            } else if (arg == "--chunk-size-kb" || arg == "--queue") {
                if (i + 1 >= args.size()) {
                    return invalid("Missing value for " + arg);
                }
                unsigned long long value = 0;
                if (!parse_count(args[++i], value)) {
                    return invalid("Invalid value for " + arg + ": " + args[i]);
                }
                if (arg == "--chunk-size-kb") {
                    // 1 GiB cap keeps the buffer allocation sane
                    if (value > 1024ULL * 1024ULL) {
                        return invalid("Chunk size too large: " + args[i] + " KiB");
                    }
                    options.engine.chunk_size = static_cast<size_t>(value) * 1024;
                } else {
                    options.engine.progress_capacity = static_cast<size_t>(value);
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                return invalid("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() != 2) {
            return invalid("Source and Destination are both required");
        }

        options.request.source_path = positional[0];
        options.request.destination_path = positional[1];
        return OptionsResult::ok(options);
    }

    std::string usage(const std::string& program) {
        std::ostringstream ss;
        ss << "Usage: " << program << " [options] <source> <destination>\n"
           << "\n"
           << "Copies <source> byte for byte onto <destination> (a file or a block device).\n"
           << "\n"
           << "Options:\n"
           << "  --chunk-size-kb N   Read/write chunk size in KiB (default "
           << core::DEFAULT_CHUNK_SIZE / 1024 << ")\n"
           << "  --queue N           Progress queue capacity (default "
           << core::DEFAULT_PROGRESS_CAPACITY << ")\n"
           << "  --no-sync           Skip fsync of the destination before reporting success\n"
           << "  -v, --verbose       Debug logging\n"
           << "  -h, --help          Show this help\n";
        return ss.str();
    }

} // namespace app
