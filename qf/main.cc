#include <iostream>

#include "driver.hh"
#include "generator_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace quickform::driver;

    GeneratorOptions opts;
    try {
        opts = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for usage.\n";
        return exit_failure;
    }

    LogLevel log_level = LogLevel::Normal;
    if (opts.quiet) log_level = LogLevel::Quiet;
    if (opts.verbose) log_level = LogLevel::Verbose;
    if (opts.debug) log_level = LogLevel::Debug;

    Logger logger(log_level, opts.color);

    try {
        Driver driver(opts, logger);
        return driver.run();
    } catch (const std::exception& e) {
        logger.error(e.what());
        return exit_failure;
    }
}
