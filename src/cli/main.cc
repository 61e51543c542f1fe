#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/io_context.hpp>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>
#include <stdexcept>

using namespace peerdrop;
using namespace peerdrop::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp(std::cerr);
        return 2;
    }
    if (options.show_help) {
        cli::ArgumentParser::ShowHelp(std::cout);
        return 0;
    }

    Logger logger(
#ifdef PEERDROP_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    InitConfig(options.config_path ? std::filesystem::path(*options.config_path)
                                   : kDefaultConfigPath);
    cli::CliManager::ApplyOverrides(options, settings);
    logger.set_log_level(Logger::ParseLevel(settings.log_level));

    net::io_context ioc;
    cli::CliManager manager(ioc, options);
    return manager.Run();
}
