#include "storage/FileUtils.hpp"

#include "log/TaggedLogger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace MS::Storage {

namespace {

auto errnoError(std::string_view prefix) -> Error {
    auto code = (errno == EACCES || errno == EPERM) ? Error::Code::InvalidPermissions : Error::Code::IOFailure;
    return Error{code, std::string(prefix) + ": " + std::strerror(errno)};
}

auto closeDescriptor(int fd) -> int {
#ifdef _WIN32
    return _close(fd);
#else
    return ::close(fd);
#endif
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
#ifdef _WIN32
    if (_commit(fd) != 0) {
        return std::unexpected(Error{Error::Code::IOFailure, "_commit failed"});
    }
#else
    if (::fsync(fd) != 0) {
        return std::unexpected(errnoError("fsync failed"));
    }
#endif
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
#ifdef _WIN32
    (void)dir;
    return {};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(errnoError("open directory failed"));
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
#endif
}

auto writeFileAtomic(std::filesystem::path const& path,
                     std::span<const std::byte> data,
                     bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IOFailure, "Failed to create directories: " + ec.message()});
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

#ifdef _WIN32
    int fd = _open(tmpPath.string().c_str(), _O_CREAT | _O_TRUNC | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
#endif
    if (fd < 0) {
        return std::unexpected(errnoError("Failed to open temp file"));
    }

    std::size_t totalWritten = 0;
    while (totalWritten < data.size()) {
        auto const* ptr       = data.data() + static_cast<std::ptrdiff_t>(totalWritten);
        auto const  remaining = data.size() - totalWritten;
#ifdef _WIN32
        auto written = _write(fd, reinterpret_cast<void const*>(ptr), static_cast<unsigned int>(remaining));
#else
        auto written = ::write(fd, reinterpret_cast<void const*>(ptr), remaining);
#endif
        if (written <= 0) {
            auto err = errnoError("Failed to write temp file");
            closeDescriptor(fd);
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(err);
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            closeDescriptor(fd);
            std::filesystem::remove(tmpPath, ec);
            return sync;
        }
    }

    if (closeDescriptor(fd) != 0) {
        auto err = errnoError("Failed to close temp file");
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(err);
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tmpPath, removeEc);
        return std::unexpected(Error{Error::Code::IOFailure, "Failed to rename temp file: " + ec.message()});
    }

    if (fsyncData && !parent.empty()) {
        auto syncDir = fsyncDirectory(parent);
        if (!syncDir) {
            ms_log("Renamed " + path.string() + " but syncing its directory failed", LogTag::Storage, LogTag::Warning);
            return syncDir;
        }
    }

    return {};
}

auto writeTextFileAtomic(std::filesystem::path const& path,
                         std::string const& text,
                         bool fsyncData) -> Expected<void> {
    auto span = std::as_bytes(std::span(text.data(), text.size()));
    return writeFileAtomic(path, span, fsyncData);
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    errno = 0;
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        if (errno == ENOENT)
            return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
        return std::unexpected(errnoError("Failed to open " + path.string()));
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IOFailure, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

auto removeFile(std::filesystem::path const& path) -> Expected<bool> {
    std::error_code ec;
    auto            removed = std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IOFailure, "Failed to remove " + path.string() + ": " + ec.message()});
    }
    return removed;
}

} // namespace MS::Storage
