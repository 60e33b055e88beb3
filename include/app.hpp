#pragma once

#include <ostream>
#include <string_view>
#include <vector>

// Runs the whole program on args (argv without the program name). The JSON
// result goes to out, usage errors to err, everything else to the log.
// Returns the process exit code: 0 on success, 1 when a file could not be
// read or is malformed, 2 on a usage error.
int run(std::string_view program, const std::vector<std::string_view>& args, std::ostream& out,
        std::ostream& err);
