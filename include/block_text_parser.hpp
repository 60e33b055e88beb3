#ifndef INCLUDE_BLOCK_TEXT_PARSER_HPP_
#define INCLUDE_BLOCK_TEXT_PARSER_HPP_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "address.hpp"

struct CityStateZip {
    std::string_view city;
    std::string_view state;
    std::string zip;
};

// "Springfield, IL 62704" -> {"Springfield", "IL", "62704"}. The split is on
// the last comma, then on the last space. Empty when either separator is
// missing or a part ends up empty.
std::optional<CityStateZip> split_city_state_zip(std::string_view line);

// Trims and drops a dangling '-': "62704 -" and "62704-" become "62704"
std::string format_zip(std::string_view zip);

// Entries are paragraphs separated by a blank line:
//
//     Jane Doe
//     123 Main St
//     Sangamon County      (optional)
//     Springfield, IL 62704
class BlockTextParser {
  public:
    static constexpr size_t min_lines = 3;
    static constexpr size_t max_lines = 4;

    // source is only used to label errors
    std::vector<Address> parse(std::string_view source, std::string_view content) const;
};

#endif /* INCLUDE_BLOCK_TEXT_PARSER_HPP_ */
