#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "address_errors.hpp"
#include "block_text_parser.hpp"
#include "string_utils.hpp"

std::string format_zip(std::string_view zip) {
    strip(zip);
    rstrip(zip, "-");
    strip(zip);
    return std::string(zip);
}

std::optional<CityStateZip> split_city_state_zip(std::string_view line) {
    size_t comma = line.rfind(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }

    // A dangling " -" after the zip would otherwise be split off as the zip
    std::string_view state_zip = stripped(line.substr(comma + 1));
    rstrip(state_zip, " -");

    size_t space = state_zip.rfind(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }

    CityStateZip result{.city = stripped(line.substr(0, comma)),
                        .state = stripped(state_zip.substr(0, space)),
                        .zip = format_zip(state_zip.substr(space + 1))};

    if (result.city.empty() || result.state.empty() || result.zip.empty()) {
        return std::nullopt;
    }

    return result;
}

namespace {

std::vector<std::string_view> split_paragraphs(std::string_view text) {
    std::vector<std::string_view> paragraphs;

    while (true) {
        size_t end = text.find("\n\n");
        paragraphs.push_back(text.substr(0, end));

        if (end == std::string_view::npos)
            break;

        text.remove_prefix(end + 2);
    }

    return paragraphs;
}

std::vector<std::string_view> entry_lines(std::string_view entry) {
    std::vector<std::string_view> lines;

    while (!entry.empty()) {
        size_t end = entry.find('\n');
        std::string_view line = stripped(entry.substr(0, end));
        if (!line.empty()) {
            lines.push_back(line);
        }

        if (end == std::string_view::npos)
            break;

        entry.remove_prefix(end + 1);
    }

    return lines;
}

} // namespace

std::vector<Address> BlockTextParser::parse(std::string_view source,
                                            std::string_view content) const {
    std::string text = normalize_newlines(content);
    std::string_view body = stripped(text);

    std::vector<Address> addresses;
    if (body.empty()) {
        return addresses;
    }

    // Counts non-blank lines plus one separator per entry, so the reported
    // range drifts from the real one when entries are split by extra blanks
    size_t line_number = 0;

    for (auto entry : split_paragraphs(body)) {
        std::vector<std::string_view> lines = entry_lines(entry);
        line_number += lines.size() + 1;

        size_t first_line = line_number - lines.size();
        size_t last_line = line_number - 1;

        if (lines.size() < min_lines || lines.size() > max_lines) {
            throw EntryShapeError(std::format("{} at line {}-{} ({} lines)", source, first_line,
                                              last_line, lines.size()));
        }

        Address address;
        address.set(AddressField::name, lines[0]);
        address.set(AddressField::street, lines[1]);

        if (lines.size() == max_lines) {
            address.set(AddressField::county, lines[2]);
        }

        auto city_state_zip = split_city_state_zip(lines.back());
        if (!city_state_zip) {
            throw MalformedEntryError(std::format("{} at line {}-{}: '{}'", source, first_line,
                                                  last_line, lines.back()));
        }

        address.set(AddressField::city, city_state_zip->city);
        address.set(AddressField::state, city_state_zip->state);
        address.set(AddressField::zip, city_state_zip->zip);

        addresses.push_back(std::move(address));
    }

    return addresses;
}
