#pragma once

#include <filesystem>
#include <string>

#include <asio.hpp>

// An input file opened read only. The descriptor is released when the object
// goes out of scope.
class SourceFile {
  public:
    // Throws std::system_error when the file cannot be opened
    SourceFile(asio::io_context& io_context, const std::filesystem::path& path);
    ~SourceFile();

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    // Reads from the current position to end of file
    std::string read_all();

    const std::string& get_path() const { return _path; }

  private:
    asio::posix::stream_descriptor _file;
    const std::string _path;
};
