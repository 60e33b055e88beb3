#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <format>
#include <stdexcept>
#include <string>
#include <system_error>

#include "source_file.hpp"

static int open_read_only(const std::filesystem::path& path) {
    // MIGHT BLOCK
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                std::format("Error opening {}", path.string()));
    }

    return fd;
}

// Regular files cannot be registered with epoll, asio falls back to plain
// blocking reads for them, which is all that is needed here
SourceFile::SourceFile(asio::io_context& io_context, const std::filesystem::path& path)
    : _file(io_context, open_read_only(path)), _path(path.string()) {}

SourceFile::~SourceFile() {
    asio::error_code ec;

    if (_file.is_open()) {
        _file.close(ec);
    }
}

std::string SourceFile::read_all() {
    asio::error_code ec;
    std::string data;

    // MIGHT BLOCK
    asio::read(_file, asio::dynamic_buffer(data), ec);

    if (ec && ec != asio::error::eof) {
        throw std::runtime_error(std::format("Error reading from {}: {}", _path, ec.message()));
    }

    return data;
}
