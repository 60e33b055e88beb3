#include <algorithm>
#include <format>
#include <stdexcept>
#include <string_view>

#include "address.hpp"

Address::Address(std::initializer_list<std::pair<AddressField, std::string_view>> fields) {
    for (const auto& [field, value] : fields) {
        set(field, value);
    }
}

void Address::set(AddressField field, std::string_view value) {
    if (value.empty()) {
        throw std::invalid_argument(std::format("Address field {} cannot be empty", field_name(field)));
    }

    if (has(field)) {
        throw std::invalid_argument(std::format("Address field {} already set", field_name(field)));
    }

    _fields.emplace_back(field, std::string(value));
}

std::optional<std::string_view> Address::get(AddressField field) const {
    auto it = std::ranges::find(_fields, field, &FieldList::value_type::first);
    if (it == _fields.end()) {
        return std::nullopt;
    }

    return std::string_view(it->second);
}

const std::string Address::str() const {
    std::string result = "{";

    for (const auto& [field, value] : _fields) {
        if (result.length() > 1) {
            result.append(", ");
        }
        result.append(std::format("{}: '{}'", field_name(field), value));
    }

    result.push_back('}');
    return result;
}
