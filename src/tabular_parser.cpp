#include <format>
#include <string>
#include <string_view>
#include <utility>

#include "address_errors.hpp"
#include "string_utils.hpp"
#include "tabular_parser.hpp"

std::vector<Record> read_records(std::string_view content, char delimiter) {
    enum class state { start_record, start_field, in_field, in_quoted, quote_in_quoted };

    std::string text = normalize_newlines(content);

    std::vector<Record> records;
    Record record;
    std::string field;
    state st = state::start_record;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field.clear();
    };

    auto end_record = [&]() {
        end_field();
        records.push_back(std::move(record));
        record.clear();
        st = state::start_record;
    };

    for (char c : text) {
        switch (st) {
        case state::start_record:
            if (c == '\n') {
                records.emplace_back();
                break;
            }
            st = state::start_field;
            [[fallthrough]];

        case state::start_field:
            if (c == '"') {
                st = state::in_quoted;
            } else if (c == delimiter) {
                end_field();
            } else if (c == '\n') {
                end_record();
            } else {
                field.push_back(c);
                st = state::in_field;
            }
            break;

        case state::in_field:
            if (c == delimiter) {
                end_field();
                st = state::start_field;
            } else if (c == '\n') {
                end_record();
            } else {
                field.push_back(c);
            }
            break;

        case state::in_quoted:
            if (c == '"') {
                st = state::quote_in_quoted;
            } else {
                field.push_back(c);
            }
            break;

        case state::quote_in_quoted:
            if (c == '"') {
                // Doubled quote
                field.push_back(c);
                st = state::in_quoted;
            } else if (c == delimiter) {
                end_field();
                st = state::start_field;
            } else if (c == '\n') {
                end_record();
            } else {
                // Text after a closing quote is kept as is
                field.push_back(c);
                st = state::in_field;
            }
            break;
        }
    }

    // Last line without a trailing newline, or an unterminated quote
    if (st != state::start_record) {
        end_record();
    }

    return records;
}

std::string_view TabularParser::Row::operator[](std::string_view header) const {
    auto it = _columns.find(std::string(header));
    if (it == _columns.end() || it->second >= _record.size()) {
        return {};
    }

    return _record[it->second];
}

std::vector<Address> TabularParser::parse(std::string_view source,
                                          std::string_view content) const {
    std::vector<Record> records = read_records(content, delimiter);

    // An empty file has no header row at all
    Record headers = records.empty() ? Record{} : records.front();

    std::unordered_map<std::string, size_t> columns;
    for (size_t i = 0; i < headers.size(); ++i) {
        // A repeated header name refers to its last column
        columns[headers[i]] = i;
    }

    std::vector<std::string> missing;
    for (auto header : required_headers) {
        if (!columns.contains(std::string(header))) {
            missing.emplace_back(header);
        }
    }

    if (!missing.empty()) {
        throw MissingHeadersError(std::format("{}: {}", source, join(missing, ", ")));
    }

    std::vector<Address> addresses;
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i].empty())
            continue;

        addresses.push_back(parse_row(Row(records[i], columns)));
    }

    return addresses;
}

Address TabularParser::parse_row(const Row& row) const {
    Address address;

    if (!is_valid_data(row["first"]) && is_valid_data(row["last"])) {
        // No first name means the last name column holds a company
        address.set(AddressField::organization, row["last"]);
    } else {
        std::vector<std::string_view> parts;
        for (auto header : {"first", "middle", "last"}) {
            if (is_valid_data(row[header])) {
                parts.push_back(row[header]);
            }
        }

        std::string name = join_present(parts);
        if (!name.empty()) {
            address.set(AddressField::name, name);
        }
    }

    for (auto [header, field] : {std::pair{"address", AddressField::street},
                                 std::pair{"city", AddressField::city},
                                 std::pair{"county", AddressField::county},
                                 std::pair{"state", AddressField::state}}) {
        if (is_valid_data(row[header])) {
            address.set(field, row[header]);
        }
    }

    // zip4 is only ever a suffix, it is dropped without a base zip
    if (is_valid_data(row["zip"])) {
        std::string zip(row["zip"]);
        if (is_valid_data(row["zip4"])) {
            zip.append("-");
            zip.append(row["zip4"]);
        }
        address.set(AddressField::zip, zip);
    }

    return address;
}
