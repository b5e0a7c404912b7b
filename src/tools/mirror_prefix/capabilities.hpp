#pragma once

#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// The collaborators of a mirror run. WorkerManager only talks to these interfaces, production code
// plugs in the S3 and local filesystem implementations, tests plug in scripted ones.

namespace s3pull::tools::mirror_prefix {

struct KeyPage {
    std::vector<std::string> keys;
    // unset on the last page
    std::optional<std::string> continuation_token;
};

class KeyListing {
public:
    KeyListing() = default;
    KeyListing(const KeyListing &) = delete;
    KeyListing &operator=(const KeyListing &) = delete;
    KeyListing(KeyListing &&) = delete;
    KeyListing &operator=(KeyListing &&) = delete;
    virtual ~KeyListing() = default;

    [[nodiscard]] virtual meta::crt<boost::asio::awaitable<std::expected<KeyPage, std::string>>>
    list_page(std::string bucket, std::string prefix, std::optional<std::string> continuation_token) = 0;
};

class ObjectFetcher {
public:
    ObjectFetcher() = default;
    ObjectFetcher(const ObjectFetcher &) = delete;
    ObjectFetcher &operator=(const ObjectFetcher &) = delete;
    ObjectFetcher(ObjectFetcher &&) = delete;
    ObjectFetcher &operator=(ObjectFetcher &&) = delete;
    virtual ~ObjectFetcher() = default;

    // Writes the object body into sink starting at offset 0, returns the number of bytes written.
    [[nodiscard]] virtual meta::crt<boost::asio::awaitable<std::expected<std::size_t, std::string>>>
    fetch(std::string bucket, std::string key, aws::s3::ObjectSink &sink) = 0;
};

// A destination file opened for writing.
class OutputFile : public aws::s3::ObjectSink {
public:
    // seek to the start and truncate to zero length
    [[nodiscard]] virtual std::expected<void, boost::system::error_code> reset() = 0;
};

class FileSystem {
public:
    FileSystem() = default;
    FileSystem(const FileSystem &) = delete;
    FileSystem &operator=(const FileSystem &) = delete;
    FileSystem(FileSystem &&) = delete;
    FileSystem &operator=(FileSystem &&) = delete;
    virtual ~FileSystem() = default;

    // succeeds if the directory exists already, also when another thread created it concurrently
    [[nodiscard]] virtual std::expected<void, boost::system::error_code>
    create_directories(const std::filesystem::path &path) = 0;

    // creates the file or truncates an existing one
    [[nodiscard]] virtual std::expected<std::unique_ptr<OutputFile>, boost::system::error_code>
    create_file(const std::filesystem::path &path) = 0;

    [[nodiscard]] virtual std::expected<void, boost::system::error_code>
    remove(const std::filesystem::path &path) = 0;
};

} // namespace s3pull::tools::mirror_prefix
