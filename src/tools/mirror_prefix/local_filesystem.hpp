#pragma once

#include "capabilities.hpp"

#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>

namespace s3pull::tools::mirror_prefix {

// Owns a POSIX file descriptor opened for writing.
class LocalOutputFile final : public OutputFile {
private:
    int fd;

public:
    [[nodiscard]] explicit LocalOutputFile(int fd) : fd{fd} {}
    ~LocalOutputFile() override;

    [[nodiscard]] std::expected<void, boost::system::error_code>
    write_at(std::uint64_t offset, std::span<const std::byte> data) override;

    [[nodiscard]] std::expected<void, boost::system::error_code> reset() override;
};

class LocalFileSystem final : public FileSystem {
public:
    [[nodiscard]] std::expected<void, boost::system::error_code>
    create_directories(const std::filesystem::path &path) override;

    [[nodiscard]] std::expected<std::unique_ptr<OutputFile>, boost::system::error_code>
    create_file(const std::filesystem::path &path) override;

    [[nodiscard]] std::expected<void, boost::system::error_code>
    remove(const std::filesystem::path &path) override;
};

} // namespace s3pull::tools::mirror_prefix
