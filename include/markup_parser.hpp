#ifndef INCLUDE_MARKUP_PARSER_HPP_
#define INCLUDE_MARKUP_PARSER_HPP_

#include <array>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "address.hpp"

class MarkupParser {
  public:
    static constexpr std::string_view entry_tag = "ENT";
    static constexpr std::array<std::string_view, 9> required_tags = {
        "NAME", "COMPANY", "STREET", "STREET_2", "STREET_3",
        "CITY", "STATE",   "COUNTRY", "POSTAL_CODE"};

    // source is only used to label errors
    std::vector<Address> parse(std::string_view source, std::string_view content) const;

  private:
    Address parse_entry(const pugi::xml_node& entry) const;
};

#endif /* INCLUDE_MARKUP_PARSER_HPP_ */
