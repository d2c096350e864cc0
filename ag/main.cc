#include <iostream>

#include "generator.hh"
#include "generator_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace apigen::driver;

    try {
        GeneratorOptions opts = parse_command_line(argc, argv);

        switch (opts.action) {
            case DriverAction::Help:
                print_help(argv[0]);
                return 0;
            case DriverAction::Version:
                print_version();
                return 0;
            case DriverAction::ListFormats:
                print_formats();
                return 0;
            case DriverAction::ListTemplates:
                print_templates();
                return 0;
            case DriverAction::Generate:
                break;
        }

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;
        if (opts.debug) log_level = LogLevel::Debug;

        ColorMode color = ColorMode::Auto;
        if (opts.color == ColorChoice::Always) color = ColorMode::Always;
        if (opts.color == ColorChoice::Never) color = ColorMode::Never;

        Logger logger(log_level, color);

        Generator generator(opts, logger);
        return generator.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
