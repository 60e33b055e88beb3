#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <plog/Severity.h>

#include "app.hpp"
#include "log_formatter.hpp"

int main(int argc, char** argv) {
    init_logging(plog::info);

    const std::string program =
        argc > 0 ? std::filesystem::path(argv[0]).filename().string() : std::string("addrnorm");
    std::vector<std::string_view> args(argv + std::min(argc, 1), argv + argc);

    return run(program, args, std::cout, std::cerr);
}
