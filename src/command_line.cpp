#include <format>
#include <string>
#include <string_view>

#include "command_line.hpp"

std::string usage(std::string_view program) {
    return std::format("usage: {} [-h] files [files ...]", program);
}

std::string help(std::string_view program) {
    return std::format("{}\n"
                       "\n"
                       "Process files containing US addresses and output a sorted JSON list.\n"
                       "\n"
                       "positional arguments:\n"
                       "  files       List of file paths to process\n"
                       "\n"
                       "options:\n"
                       "  -h, --help  show this help message and exit",
                       usage(program));
}

CommandLine parse_command_line(const std::vector<std::string_view>& args) {
    CommandLine result;
    std::vector<std::string_view> unknown;
    bool options_done = false;

    for (auto arg : args) {
        // "-" on its own is a file name
        if (options_done || arg == "-" || !arg.starts_with('-')) {
            result.files.emplace_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            result.help = true;
        } else {
            unknown.push_back(arg);
        }
    }

    // Help wins over anything else on the line
    if (result.help) {
        return result;
    }

    if (result.files.empty()) {
        throw UsageError("the following arguments are required: files");
    }

    if (!unknown.empty()) {
        std::string message = "unrecognized arguments:";
        for (auto arg : unknown) {
            message.append(" ");
            message.append(arg);
        }
        throw UsageError(message);
    }

    return result;
}
