#ifndef INCLUDE_TABULAR_PARSER_HPP_
#define INCLUDE_TABULAR_PARSER_HPP_

#include <array>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "address.hpp"

using Record = std::vector<std::string>;

// Splits delimited text into records. A field starting with '"' is quoted and
// may hold delimiters and newlines, "" inside it is a literal quote. Blank
// lines come back as empty records.
std::vector<Record> read_records(std::string_view content, char delimiter);

class TabularParser {
  public:
    static constexpr char delimiter = '\t';
    static constexpr std::array<std::string_view, 10> required_headers = {
        "first", "middle", "last",   "organization", "address",
        "city",  "state",  "county", "zip",          "zip4"};

    // source is only used to label errors
    std::vector<Address> parse(std::string_view source, std::string_view content) const;

  private:
    class Row {
      public:
        Row(const Record& record, const std::unordered_map<std::string, size_t>& columns)
            : _record(record), _columns(columns) {}

        // A header the row is too short for reads as ""
        std::string_view operator[](std::string_view header) const;

      private:
        const Record& _record;
        const std::unordered_map<std::string, size_t>& _columns;
    };

    Address parse_row(const Row& row) const;
};

#endif /* INCLUDE_TABULAR_PARSER_HPP_ */
