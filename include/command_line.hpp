#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct CommandLine {
    std::vector<std::string> files{};
    bool help{false};
};

class UsageError : public std::runtime_error {
  public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// Throws UsageError when no file is given or an option is not known
CommandLine parse_command_line(const std::vector<std::string_view>& args);

std::string usage(std::string_view program);
std::string help(std::string_view program);
