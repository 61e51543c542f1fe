#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace peerdrop::cli {

struct CliOptions {
    std::optional<std::uint16_t> port;
    std::optional<std::string> output_dir;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::uint32_t> pacing_delay_ms;
    std::optional<std::uint32_t> stall_timeout_seconds;
    bool allow_incomplete = false;
    bool json_output = false;
    bool show_help = false;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Throws std::invalid_argument on a usage error
    CliOptions Parse();

    static void ShowHelp(std::ostream& out);

private:
    int argc_;
    char** argv_;
    int i; // Index of the argument being parsed

    void parseOption(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);
    std::string nextValue(const std::string& option);

    void validateOptions(const CliOptions& options);
};

// Parses a decimal number in [min, max], throws std::invalid_argument naming the option
std::uint32_t ParseNumber(const std::string& value,
                          const std::string& name,
                          std::uint32_t min,
                          std::uint32_t max);

} // namespace peerdrop::cli
