#pragma once

#include <exception>
#include <string>
#include <unordered_map>

enum class AddressErrorCode {
    // 100-series: markup sources
    Missing_Tags = 100,
    Markup_Syntax_Error = 101,

    // 200-series: tabular sources
    Missing_Headers = 200,

    // 300-series: block text sources
    Entry_Line_Count = 300,
    Malformed_Entry = 301, // city/state/zip line cannot be split
};

static const std::unordered_map<AddressErrorCode, const std::string> AddressErrorMessages = {
    {AddressErrorCode::Missing_Tags, "XML file is missing tags"},
    {AddressErrorCode::Markup_Syntax_Error, "Error parsing XML"},
    {AddressErrorCode::Missing_Headers, "TSV file is missing headers"},
    {AddressErrorCode::Entry_Line_Count, "Entry with incorrect number of lines"},
    {AddressErrorCode::Malformed_Entry, "Malformed city, state and zip line"}};

class FormatError : public std::exception {
  public:
    FormatError() = delete;
    FormatError(const AddressErrorCode code) : _code(code) {}
    FormatError(const AddressErrorCode code, const std::string& context)
        : _code(code), _context_message(AddressErrorMessages.at(_code) + ": " + context) {}

    AddressErrorCode code() const { return _code; }

    const char* what() const noexcept override {
        if (_context_message.empty()) {
            return AddressErrorMessages.at(_code).c_str();
        } else {
            return _context_message.c_str();
        }
    }

  private:
    const AddressErrorCode _code;
    std::string _context_message;
};

#define AddressException(name, code)                                                               \
    class name : public FormatError {                                                              \
      public:                                                                                      \
        name() : FormatError(code) {}                                                              \
        name(const std::string& context) : FormatError(code, context) {}                           \
    }

AddressException(MissingTagsError, AddressErrorCode::Missing_Tags);
AddressException(MarkupSyntaxError, AddressErrorCode::Markup_Syntax_Error);
AddressException(MissingHeadersError, AddressErrorCode::Missing_Headers);
AddressException(EntryShapeError, AddressErrorCode::Entry_Line_Count);
AddressException(MalformedEntryError, AddressErrorCode::Malformed_Entry);

#undef AddressException
