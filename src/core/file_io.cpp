#include "upsync/core/file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace upsync {
namespace fs = std::filesystem;

namespace {

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

Result<void> fsync_directory(const fs::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to open directory", directory));
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to sync directory", directory));
    }
    return Ok();
}

} // namespace

Result<void> write_file_atomic(const fs::path& path, const std::string& contents) {
    const auto parent = path.has_parent_path() ? path.parent_path() : fs::path(".");
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorKind::Io, "Failed to create directory: " + parent.string());
    }

    fs::path temp_path = path;
    temp_path += ".tmp";

    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to create", temp_path));
    }

    std::size_t written = 0;
    while (written < contents.size()) {
        const auto rc = ::write(fd, contents.data() + written, contents.size() - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = errno_message("Failed to write", temp_path);
            ::close(fd);
            return Err<void>(ErrorKind::Io, std::move(message));
        }
        written += static_cast<std::size_t>(rc);
    }

    if (::fsync(fd) != 0) {
        auto message = errno_message("Failed to sync", temp_path);
        ::close(fd);
        return Err<void>(ErrorKind::Io, std::move(message));
    }
    if (::close(fd) != 0) {
        return Err<void>(ErrorKind::Io, errno_message("Failed to close", temp_path));
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to move " + temp_path.string() + " into place: " + ec.message());
    }

    return fsync_directory(parent);
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read file: " + path.string());
    }
    return Ok(buffer.str());
}

std::string fnv1a_hex(const std::string& text) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (unsigned char byte : text) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= prime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

} // namespace upsync
