#pragma once

#include "capabilities.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace s3pull::tools::mirror_prefix {

class WorkerManager {
private:
    // declared before the queue so that the queue is destroyed first
    std::unique_ptr<boost::asio::thread_pool> pool;
    std::shared_ptr<KeyListing> listing;
    std::shared_ptr<ObjectFetcher> fetcher;
    std::shared_ptr<FileSystem> filesystem;
    MirrorConfig config;
    bool started = false;

    // Shared run state
    std::shared_ptr<Progress> stats = std::make_shared<Progress>();
    std::shared_ptr<std::atomic<bool>> aborted = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<std::size_t>> active_workers = std::make_shared<std::atomic<std::size_t>>(0);
    std::shared_ptr<KeyQueue> queue;

    std::mutex outcome_mutex;
    std::optional<FatalError> fatal_error;
    std::optional<std::string> listing_error;

    // Keeps the first error, stops the lister and wakes idle workers. Later errors are only logged.
    void abort_run(FatalError error);

    [[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> spawn_worker(std::size_t id);

public:
    [[nodiscard]] WorkerManager(std::shared_ptr<KeyListing> listing, std::shared_ptr<ObjectFetcher> fetcher,
                                std::shared_ptr<FileSystem> filesystem, MirrorConfig config,
                                std::unique_ptr<boost::asio::thread_pool> pool);

    // coroutines running on the pool point back into the manager
    WorkerManager(const WorkerManager &) = delete;
    WorkerManager &operator=(const WorkerManager &) = delete;
    WorkerManager(WorkerManager &&) = delete;
    WorkerManager &operator=(WorkerManager &&) = delete;
    ~WorkerManager() = default;

    // Runs the lister and all workers to completion. Blocks until every spawned coroutine has
    // finished. May only be called once.
    [[nodiscard]] std::expected<RunSummary, FatalError> run();

    [[nodiscard]] std::shared_ptr<const Progress> progress() const { return stats; }
    [[nodiscard]] std::size_t running_workers() const { return active_workers->load(); }
};

} // namespace s3pull::tools::mirror_prefix
