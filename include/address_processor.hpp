#ifndef INCLUDE_ADDRESS_PROCESSOR_HPP_
#define INCLUDE_ADDRESS_PROCESSOR_HPP_

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "address.hpp"
#include "block_text_parser.hpp"
#include "markup_parser.hpp"
#include "source_format.hpp"
#include "tabular_parser.hpp"

using SourceParser = std::variant<MarkupParser, TabularParser, BlockTextParser>;

SourceParser make_parser(SourceFormat format);

// Stable, compares zips as text: "10000-1234" sorts after "10000"
void sort_by_zip(std::vector<Address>& addresses);

nlohmann::ordered_json to_json(const std::vector<Address>& addresses);

class AddressProcessor {
  public:
    explicit AddressProcessor(asio::io_context& io_context) : _io_context(io_context) {}

    // Missing files and unknown suffixes are logged and skipped. A FormatError
    // from any file ends the whole run.
    std::vector<Address> process(const std::vector<std::string>& paths) const;

    std::vector<Address> process_file(const std::filesystem::path& path, SourceFormat format) const;

  private:
    asio::io_context& _io_context;
};

#endif /* INCLUDE_ADDRESS_PROCESSOR_HPP_ */
