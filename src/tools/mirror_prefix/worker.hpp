#pragma once

#include "capabilities.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace s3pull::tools::mirror_prefix {

// Maps an object key to its local path below destination. Leading slashes are dropped, keys that
// would leave destination are rejected.
[[nodiscard]] std::expected<std::filesystem::path, std::string>
destination_path(const std::filesystem::path &destination, std::string_view key);

class Worker {
private:
    std::size_t id;
    std::string bucket;
    std::filesystem::path destination;
    std::shared_ptr<ObjectFetcher> fetcher;
    std::shared_ptr<FileSystem> filesystem;

    // Shared run state - references to WorkerManager's state
    std::shared_ptr<KeyQueue> queue;
    std::shared_ptr<Progress> stats;
    std::shared_ptr<const std::atomic<bool>> aborted;

    void report_completed(std::string_view key);
    void discard(const std::filesystem::path &path);

public:
    [[nodiscard]] Worker(std::size_t id, std::string bucket, std::filesystem::path destination,
                         std::shared_ptr<ObjectFetcher> fetcher, std::shared_ptr<FileSystem> filesystem,
                         std::shared_ptr<KeyQueue> queue, std::shared_ptr<Progress> stats,
                         std::shared_ptr<const std::atomic<bool>> aborted);

    // Downloads one key with up to max_attempts attempts. Any error returned is fatal for the run.
    [[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> retrieve(std::string key);

    // Drains the queue until it is closed and empty or the run is aborted.
    [[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> work();
};

} // namespace s3pull::tools::mirror_prefix
