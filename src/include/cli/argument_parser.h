#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
    std::string user_id = "local";
    std::optional<std::int64_t> notify_interval_ms;
    std::optional<std::string> log_level;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // Throws std::runtime_error on malformed input.
    CliOptions Parse();

    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // index of the argument being parsed

    void parseOptions(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);

    bool validateOptions(const CliOptions& options);
};
