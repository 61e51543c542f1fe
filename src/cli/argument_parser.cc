#include <algorithm>
#include <cctype>
#include <charconv>
#include <cli/argument_parser.h>
#include <stdexcept>

namespace peerdrop::cli {

std::uint32_t ParseNumber(const std::string& value,
                          const std::string& name,
                          std::uint32_t min,
                          std::uint32_t max) {
    std::uint32_t number = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, number);
    if (value.empty() || ec != std::errc() || ptr != end) {
        throw std::invalid_argument("Invalid " + name + ": " + value);
    }
    if (number < min || number > max) {
        throw std::invalid_argument(name + " must be between " + std::to_string(min) + " and "
                                    + std::to_string(max));
    }
    return number;
}

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            // First non-option argument starts the command
            parseCommand(options);
            break;
        }

        parseOption(arg, options);
        i++;
    }

    if (!options.show_help) {
        validateOptions(options);
    }
    return options;
}

std::string ArgumentParser::nextValue(const std::string& option) {
    if (++i >= argc_) {
        throw std::invalid_argument("Missing value for " + option);
    }
    return argv_[i];
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-p" || arg == "--port") {
        options.port = static_cast<std::uint16_t>(
            ParseNumber(nextValue(arg), "port", 1024, 65535));
    } else if (arg == "-o" || arg == "--output") {
        options.output_dir = nextValue(arg);
    } else if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue(arg);
    } else if (arg == "-l" || arg == "--log-level") {
        options.log_level = nextValue(arg);
    } else if (arg == "--pacing-ms") {
        options.pacing_delay_ms = ParseNumber(nextValue(arg), "pacing delay", 0, 10000);
    } else if (arg == "--timeout") {
        options.stall_timeout_seconds = ParseNumber(nextValue(arg), "timeout", 0, 86400);
    } else if (arg == "--allow-incomplete") {
        options.allow_incomplete = true;
    } else if (arg == "--json") {
        options.json_output = true;
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= argc_) {
        return;
    }

    options.command = argv_[i++];

    while (i < argc_) {
        options.command_args.push_back(argv_[i++]);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw std::invalid_argument("Invalid log level: " + *options.log_level);
        }
    }

    if (!options.command) {
        throw std::invalid_argument("Missing command");
    }
    if (*options.command == "send") {
        if (options.command_args.size() != 1) {
            throw std::invalid_argument("send expects exactly one FILE");
        }
    } else if (*options.command == "receive") {
        if (options.command_args.size() != 2) {
            throw std::invalid_argument("receive expects HOST PORT");
        }
        ParseNumber(options.command_args[1], "port", 1, 65535);
    } else {
        throw std::invalid_argument("Unknown command: " + *options.command);
    }
}

void ArgumentParser::ShowHelp(std::ostream& out) {
    out << "Usage: peerdrop [options] <command> [args...]\n\n"
        << "Options:\n"
        << "  -p, --port PORT        Port to listen on when sending (default: 56789)\n"
        << "  -o, --output DIR       Directory for received files\n"
        << "  -c, --config PATH      Config file path\n"
        << "  -l, --log-level LVL    Log level (debug|info|warning|error)\n"
        << "      --pacing-ms MS     Delay between two chunks (default: 10)\n"
        << "      --timeout SEC      Abort after SEC seconds without progress, 0 disables\n"
        << "      --allow-incomplete Keep a file even if chunks are missing\n"
        << "      --json             Print one JSON status per line\n"
        << "  -h, --help             Show this help message\n\n"
        << "Commands:\n"
        << "  send FILE              Wait for one receiver and send FILE\n"
        << "  receive HOST PORT      Connect to a sender and save the file\n";
}

} // namespace peerdrop::cli
