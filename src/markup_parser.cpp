#include <algorithm>
#include <format>
#include <functional>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "address_errors.hpp"
#include "markup_parser.hpp"
#include "string_utils.hpp"

namespace {

// Visits every element below the document node. Entries are only taken from
// below the root element, the root itself never counts as one.
struct EntryCollector : pugi::xml_tree_walker {
    std::set<std::string, std::less<>> tags;
    std::vector<pugi::xml_node> entries;

    bool for_each(pugi::xml_node& node) override {
        if (node.type() != pugi::node_element)
            return true;

        tags.emplace(node.name());
        if (depth() > 0 && node.name() == MarkupParser::entry_tag) {
            entries.push_back(node);
        }

        return true;
    }
};

std::string_view child_text(const pugi::xml_node& entry, std::string_view tag) {
    // Only called with string literals, so data() is null terminated
    return entry.child(tag.data()).text().get();
}

// Turns a byte offset from pugixml into a 1-based line and column
std::pair<size_t, size_t> offset_position(std::string_view content, ptrdiff_t offset) {
    size_t end = std::min(static_cast<size_t>(std::max<ptrdiff_t>(offset, 0)), content.length());
    std::string_view before = content.substr(0, end);

    size_t line = std::ranges::count(before, '\n') + 1;
    size_t line_start = before.find_last_of('\n');
    size_t column = line_start == std::string_view::npos ? end + 1 : end - line_start;

    return {line, column};
}

struct MarkupFault {
    size_t offset;
    std::string_view description;
};

// Only the predefined entities and character references are known, there is
// no DTD support
bool is_reference(std::string_view content, size_t offset) {
    static const std::regex reference_regex(R"(&(amp|lt|gt|quot|apos|#[0-9]+|#x[0-9A-Fa-f]+);)");
    return std::regex_search(content.begin() + offset, content.end(), reference_regex,
                             std::regex_constants::match_continuous);
}

// pugixml passes unknown entity references through as text, and silently
// skips text and extra elements beside the document element. This scan
// runs after a successful load, so tags are known to balance.
std::optional<MarkupFault> find_markup_fault(std::string_view content) {
    size_t depth = 0;
    size_t roots = 0;
    size_t i = content.starts_with("\xEF\xBB\xBF") ? 3 : 0;

    auto skip_past = [&](std::string_view terminator) {
        size_t end = content.find(terminator, i);
        i = end == std::string_view::npos ? content.length() : end + terminator.length();
    };

    while (i < content.length()) {
        char c = content[i];

        if (c == '&') {
            if (!is_reference(content, i)) {
                return MarkupFault{i, "undefined entity"};
            }
            ++i;
        } else if (c != '<') {
            if (depth == 0 && whitespace.find(c) == std::string_view::npos) {
                return MarkupFault{i, roots == 0 ? "text before document element"
                                                 : "junk after document element"};
            }
            ++i;
        } else if (content.substr(i).starts_with("<!--")) {
            skip_past("-->");
        } else if (content.substr(i).starts_with("<![CDATA[")) {
            skip_past("]]>");
        } else if (content.substr(i).starts_with("<?")) {
            skip_past("?>");
        } else if (content.substr(i).starts_with("<!")) {
            // DOCTYPE, the internal subset may hold '>' inside brackets
            size_t brackets = 0;
            for (++i; i < content.length(); ++i) {
                if (content[i] == '[') {
                    ++brackets;
                } else if (content[i] == ']' && brackets > 0) {
                    --brackets;
                } else if (content[i] == '>' && brackets == 0) {
                    ++i;
                    break;
                }
            }
        } else if (content.substr(i).starts_with("</")) {
            if (depth > 0) {
                --depth;
            }
            skip_past(">");
        } else {
            if (depth == 0 && ++roots > 1) {
                return MarkupFault{i, "junk after document element"};
            }

            // Attribute values may hold '>' and references
            char quote = 0;
            for (++i; i < content.length(); ++i) {
                char t = content[i];
                if (quote) {
                    if (t == quote) {
                        quote = 0;
                    } else if (t == '&' && !is_reference(content, i)) {
                        return MarkupFault{i, "undefined entity"};
                    }
                } else if (t == '"' || t == '\'') {
                    quote = t;
                } else if (t == '>') {
                    break;
                }
            }

            bool empty_element = i < content.length() && content[i - 1] == '/';
            ++i;
            if (!empty_element) {
                ++depth;
            }
        }
    }

    return std::nullopt;
}

// Required tags that appear nowhere in the document, in required order
std::vector<std::string> missing_tags(const std::set<std::string, std::less<>>& tags) {
    std::vector<std::string> missing;
    for (auto tag : MarkupParser::required_tags) {
        if (!tags.contains(tag)) {
            missing.emplace_back(tag);
        }
    }

    return missing;
}

} // namespace

std::vector<Address> MarkupParser::parse(std::string_view source, std::string_view content) const {
    pugi::xml_document doc;

    // Whitespace only text is still text, the same as any other value
    pugi::xml_parse_result result =
        doc.load_buffer(content.data(), content.size(), pugi::parse_default | pugi::parse_ws_pcdata);

    if (!result) {
        auto [line, column] = offset_position(content, result.offset);
        throw MarkupSyntaxError(std::format("{}: {}: line {}, column {}", source,
                                            result.description(), line, column));
    }

    if (auto fault = find_markup_fault(content)) {
        auto [line, column] = offset_position(content, static_cast<ptrdiff_t>(fault->offset));
        throw MarkupSyntaxError(std::format("{}: {}: line {}, column {}", source,
                                            fault->description, line, column));
    }

    EntryCollector collector;
    doc.traverse(collector);

    auto missing = missing_tags(collector.tags);
    if (!missing.empty()) {
        throw MissingTagsError(std::format("{}: {}", source, join(missing, ", ")));
    }

    std::vector<Address> addresses;
    addresses.reserve(collector.entries.size());

    for (const auto& entry : collector.entries) {
        addresses.push_back(parse_entry(entry));
    }

    return addresses;
}

Address MarkupParser::parse_entry(const pugi::xml_node& entry) const {
    Address address;

    std::string_view name = stripped(child_text(entry, "NAME"));
    if (!name.empty()) {
        address.set(AddressField::name, name);
    }

    std::string_view company = stripped(child_text(entry, "COMPANY"));
    if (!company.empty()) {
        address.set(AddressField::organization, company);
    }

    std::string street = join_present({stripped(child_text(entry, "STREET")),
                                       stripped(child_text(entry, "STREET_2")),
                                       stripped(child_text(entry, "STREET_3"))});
    if (!street.empty()) {
        address.set(AddressField::street, street);
    }

    // City and state are kept as written, surrounding blanks included
    std::string_view city = child_text(entry, "CITY");
    if (!city.empty()) {
        address.set(AddressField::city, city);
    }

    std::string_view state = child_text(entry, "STATE");
    if (!state.empty()) {
        address.set(AddressField::state, state);
    }

    // "12345 - " and "12345-" both come out as "12345"
    std::string_view postal_code = child_text(entry, "POSTAL_CODE");
    strip(postal_code);
    rstrip(postal_code, " -");
    if (!postal_code.empty()) {
        address.set(AddressField::zip, postal_code);
    }

    return address;
}
