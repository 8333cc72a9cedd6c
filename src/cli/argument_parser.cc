#include <algorithm>
#include <cli/argument_parser.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            parseCommand(options);
            break;
        }

        parseOptions(arg, options);
        i++;
    }

    if (!validateOptions(options)) {
        ShowHelp();
        std::exit(1);
    }

    return options;
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-u" || arg == "--user") {
        if (++i >= argc_) {
            throw std::runtime_error("Missing user id");
        }
        options.user_id = argv_[i];
    } else if (arg == "-i" || arg == "--interval") {
        if (++i >= argc_) {
            throw std::runtime_error("Missing notification interval");
        }
        options.notify_interval_ms = std::stoll(argv_[i]);
    } else if (arg == "-l" || arg == "--log-level") {
        if (++i >= argc_) {
            throw std::runtime_error("Missing log level");
        }
        options.log_level = argv_[i];
    } else if (arg == "-h" || arg == "--help") {
        ShowHelp();
        std::exit(0);
    } else {
        throw std::runtime_error("Unknown option: " + arg);
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

bool ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.user_id.empty()) {
        std::cerr << "Error: User id must not be empty" << std::endl;
        return false;
    }

    if (options.notify_interval_ms && *options.notify_interval_ms < 0) {
        std::cerr << "Error: Interval must not be negative" << std::endl;
        return false;
    }

    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            std::cerr << "Error: Invalid log level" << std::endl;
            return false;
        }
    }

    if (!options.command) {
        std::cerr << "Error: Missing command" << std::endl;
        return false;
    }

    return true;
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: fileferry [options] command [args...]\n\n"
              << "Options:\n"
              << "  -u, --user ID        Act as this user (default: local)\n"
              << "  -i, --interval MS    Minimum gap between progress updates\n"
              << "  -l, --log-level LVL  Set log level (debug|info|warning|error)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands:\n"
              << "  copy SRC DST         Copy a file, reporting progress\n"
              << "  prefix [TEXT]        Show or set the file name prefix\n"
              << "  caption [TEXT]       Show or set the upload caption\n"
              << "  mode [MODE]          Show or set the upload mode (auto|document|video|audio)\n"
              << "  thumbnail [PATH]     Show or set the thumbnail image\n"
              << "  delthumb             Delete the thumbnail\n"
              << "  stats                Show transfer statistics\n";
}
