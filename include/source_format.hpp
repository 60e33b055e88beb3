#ifndef INCLUDE_SOURCE_FORMAT_HPP_
#define INCLUDE_SOURCE_FORMAT_HPP_

#include <array>
#include <optional>
#include <string_view>

class SourceFormat {
  public:
    enum class type_id { markup = 0, tabular, block_text };

    constexpr SourceFormat(type_id type) : _type(type) {}
    constexpr type_id get_id() const { return _type; }
    constexpr const std::string_view get_name() const { return _name[static_cast<int>(_type)]; }
    constexpr const std::string_view get_suffix() const {
        return _suffix[static_cast<int>(_type)];
    }

    constexpr operator int() const { return static_cast<int>(_type); }
    constexpr bool operator==(const SourceFormat& rhs) const { return _type == rhs._type; }

    // Suffix match is case sensitive, "ADDR.XML" is not a markup source
    static constexpr std::optional<SourceFormat> from_path(std::string_view path) {
        for (type_id type : {type_id::markup, type_id::tabular, type_id::block_text}) {
            if (path.ends_with(_suffix[static_cast<int>(type)])) {
                return SourceFormat(type);
            }
        }

        return std::nullopt;
    }

  private:
    static constexpr std::array<std::string_view, 3> _name = {"XML", "TSV", "TXT"};
    static constexpr std::array<std::string_view, 3> _suffix = {".xml", ".tsv", ".txt"};
    type_id _type;
};

#endif /* INCLUDE_SOURCE_FORMAT_HPP_ */
