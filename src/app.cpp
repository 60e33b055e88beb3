#include <exception>
#include <ostream>
#include <print>
#include <string>

#include <asio.hpp>
#include <plog/Log.h>

#include "address_processor.hpp"
#include "app.hpp"
#include "command_line.hpp"

int run(std::string_view program, const std::vector<std::string_view>& args, std::ostream& out,
        std::ostream& err) {
    CommandLine command_line;
    try {
        command_line = parse_command_line(args);
    } catch (const UsageError& e) {
        std::println(err, "{}", usage(program));
        std::println(err, "{}: error: {}", program, e.what());
        return 2;
    }

    if (command_line.help) {
        std::println(out, "{}", help(program));
        return 0;
    }

    // Nothing is written until every file has been read and sorted
    std::string json;
    try {
        asio::io_context io_context;
        AddressProcessor processor(io_context);

        json = to_json(processor.process(command_line.files)).dump(2, ' ', true);
    } catch (const std::exception& e) {
        // FormatError from a source file, or an I/O error reading one
        PLOG_ERROR << e.what();
        return 1;
    }

    std::println(out, "{}", json);
    return 0;
}
