#include <algorithm>
#include <filesystem>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <plog/Log.h>

#include "address_processor.hpp"
#include "source_file.hpp"

SourceParser make_parser(SourceFormat format) {
    switch (format.get_id()) {
    case SourceFormat::type_id::markup:
        return MarkupParser{};
    case SourceFormat::type_id::tabular:
        return TabularParser{};
    case SourceFormat::type_id::block_text:
        return BlockTextParser{};
    }

    throw std::invalid_argument("Unhandled source format");
}

void sort_by_zip(std::vector<Address>& addresses) {
    std::ranges::stable_sort(addresses, std::ranges::less{}, &Address::sort_key);
}

nlohmann::ordered_json to_json(const std::vector<Address>& addresses) {
    nlohmann::ordered_json result = nlohmann::ordered_json::array();

    for (const auto& address : addresses) {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (const auto& [field, value] : address.fields()) {
            object[std::string(field_name(field))] = value;
        }
        result.push_back(std::move(object));
    }

    return result;
}

std::vector<Address> AddressProcessor::process_file(const std::filesystem::path& path,
                                                    SourceFormat format) const {
    std::string content;
    {
        SourceFile file(_io_context, path);
        content = file.read_all();
    }

    std::vector<Address> addresses = std::visit(
        [&path, &content](const auto& parser) { return parser.parse(path.string(), content); },
        make_parser(format));

    PLOG_DEBUG << "Read " << addresses.size() << " addresses from " << std::string(format.get_name())
               << " file " << path.string();

    return addresses;
}

std::vector<Address> AddressProcessor::process(const std::vector<std::string>& paths) const {
    std::vector<Address> all_addresses;

    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            PLOG_ERROR << "File not found: " << path;
            continue;
        }

        auto format = SourceFormat::from_path(path);
        if (!format) {
            PLOG_WARNING << "Unsupported file format: " << path;
            continue;
        }

        std::vector<Address> addresses = process_file(path, *format);
        all_addresses.insert(all_addresses.end(), std::make_move_iterator(addresses.begin()),
                             std::make_move_iterator(addresses.end()));
    }

    for (const auto& address : all_addresses) {
        if (address.empty()) {
            PLOG_WARNING << "Address without any fields sorted first";
        } else if (!address.has(AddressField::zip)) {
            PLOG_WARNING << "Address without zip sorted first: " << address.str();
        }
    }

    sort_by_zip(all_addresses);
    return all_addresses;
}
