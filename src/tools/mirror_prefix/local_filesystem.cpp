#include "local_filesystem.hpp"

#include "capabilities.hpp"

#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <boost/system/system_category.hpp>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <span>
#include <sys/stat.h>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>

namespace s3pull::tools::mirror_prefix {

namespace {

[[nodiscard]] boost::system::error_code last_error() {
    return boost::system::error_code{errno, boost::system::system_category()};
}

[[nodiscard]] boost::system::error_code from_std(const std::error_code &ec) {
    // std::filesystem reports errno values on POSIX
    return boost::system::error_code{ec.value(), boost::system::system_category()};
}

} // namespace

LocalOutputFile::~LocalOutputFile() {
    if (fd != -1) {
        ::close(fd);
    }
}

std::expected<void, boost::system::error_code> LocalOutputFile::write_at(std::uint64_t offset,
                                                                         std::span<const std::byte> data) {
    while (!data.empty()) {
        const ssize_t written = ::pwrite(fd, data.data(), data.size(), static_cast<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected{last_error()};
        }
        data = data.subspan(static_cast<std::size_t>(written));
        offset += static_cast<std::uint64_t>(written);
    }
    return {};
}

std::expected<void, boost::system::error_code> LocalOutputFile::reset() {
    if (::lseek(fd, 0, SEEK_SET) == -1) {
        return std::unexpected{last_error()};
    }
    if (::ftruncate(fd, 0) == -1) {
        return std::unexpected{last_error()};
    }
    return {};
}

std::expected<void, boost::system::error_code>
LocalFileSystem::create_directories(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    // two workers may race on a shared parent, losing that race is fine
    if (std::error_code dir_ec; ec && !std::filesystem::is_directory(path, dir_ec)) {
        return std::unexpected{from_std(ec)};
    }
    return {};
}

std::expected<std::unique_ptr<OutputFile>, boost::system::error_code>
LocalFileSystem::create_file(const std::filesystem::path &path) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    const int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd == -1) {
        return std::unexpected{last_error()};
    }
    return std::make_unique<LocalOutputFile>(fd);
}

std::expected<void, boost::system::error_code> LocalFileSystem::remove(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected{from_std(ec)};
    }
    return {};
}

} // namespace s3pull::tools::mirror_prefix
