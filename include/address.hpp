#ifndef INCLUDE_ADDRESS_HPP_
#define INCLUDE_ADDRESS_HPP_

#include <array>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class AddressField { name = 0, organization, street, city, state, county, zip };

constexpr std::string_view field_name(const AddressField field) {
    constexpr std::array<std::string_view, 7> names = {"name",  "organization", "street", "city",
                                                       "state", "county",       "zip"};
    return names[static_cast<int>(field)];
}

// A normalized postal address. Fields keep the order they were set in, which is
// also the order they are written out in.
class Address {
  public:
    using FieldList = std::vector<std::pair<AddressField, std::string>>;

    Address() = default;
    Address(std::initializer_list<std::pair<AddressField, std::string_view>> fields);

    // Throws std::invalid_argument for an empty value or a field set twice
    void set(AddressField field, std::string_view value);

    std::optional<std::string_view> get(AddressField field) const;
    bool has(AddressField field) const { return get(field).has_value(); }

    // Zip as text, "" when the source had none
    std::string_view sort_key() const { return get(AddressField::zip).value_or(""); }

    const FieldList& fields() const { return _fields; }
    bool empty() const { return _fields.empty(); }

    const std::string str() const;
    bool operator==(const Address& rhs) const { return _fields == rhs._fields; }

  private:
    FieldList _fields{};
};

#endif /* INCLUDE_ADDRESS_HPP_ */
