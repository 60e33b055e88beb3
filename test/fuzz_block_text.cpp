#include <string_view>

#include "address_errors.hpp"
#include "block_text_parser.hpp"

extern "C" int LLVMFuzzerTestOneInput(const char* data, size_t size) {
    BlockTextParser p;

    try {
        p.parse("fuzz", std::string_view(data, size));
    } catch (const FormatError&) {
        return 0;
    }

    return 0;
}
