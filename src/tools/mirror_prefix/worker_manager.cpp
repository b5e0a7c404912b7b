#include "worker_manager.hpp"

#include "capabilities.hpp"
#include "lister.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"
#include "worker.hpp"

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/thread_pool.hpp>
#include <boost/scope/scope_exit.hpp>
#include <cstddef>
#include <exception>
#include <expected>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>

namespace s3pull::tools::mirror_prefix {

WorkerManager::WorkerManager(std::shared_ptr<KeyListing> listing, std::shared_ptr<ObjectFetcher> fetcher,
                             std::shared_ptr<FileSystem> filesystem, MirrorConfig config,
                             std::unique_ptr<boost::asio::thread_pool> pool)
    : pool{std::move(pool)}, listing{std::move(listing)}, fetcher{std::move(fetcher)},
      filesystem{std::move(filesystem)}, config{std::move(config)} {
    if (this->config.concurrency == 0) {
        throw std::invalid_argument{"concurrency must be at least 1"};
    }
    queue = std::make_shared<KeyQueue>(this->pool->get_executor(), this->config.queue_capacity);
}

void WorkerManager::abort_run(FatalError error) {
    {
        const std::scoped_lock lock{outcome_mutex};
        if (fatal_error.has_value()) {
            std::println(std::cerr, "ERROR run already aborting, additionally: {}", error);
            return;
        }
        std::println(std::cerr, "ERROR aborting run: {}", error);
        fatal_error = std::move(error);
    }

    aborted->store(true);
    // wakes a lister blocked on a full queue and every idle worker
    queue->cancel();
    queue->close();
}

meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> WorkerManager::spawn_worker(std::size_t id) {
    Worker worker{id, config.bucket, config.destination, fetcher, filesystem, queue, stats, aborted};

    (*active_workers)++;
    const boost::scope::scope_exit decrement_active_workers{[this]() { (*active_workers)--; }};
    co_return co_await worker.work();
}

std::expected<RunSummary, FatalError> WorkerManager::run() {
    if (std::exchange(started, true)) {
        throw std::logic_error{"WorkerManager::run may only be called once"};
    }

    boost::asio::co_spawn(*pool, run_lister(*listing, config.bucket, config.prefix, *queue, *stats),
                          [this](std::exception_ptr exception, ListingOutcome outcome) {
                              if (exception) {
                                  outcome.error = describe_exception(exception);
                                  std::println(std::cerr, "ERROR listing aborted: {}", *outcome.error);
                              }
                              if (outcome.error) {
                                  const std::scoped_lock lock{outcome_mutex};
                                  listing_error = std::move(outcome.error);
                              }
                          });

    for (std::size_t id = 0; id < config.concurrency; id++) {
        boost::asio::co_spawn(*pool, spawn_worker(id),
                              [this, id](std::exception_ptr exception, std::expected<void, FatalError> result) {
                                  if (exception) {
                                      abort_run(FatalError{.reason = FatalReason::INTERNAL,
                                                           .key = {},
                                                           .detail = std::format("worker {}: {}", id,
                                                                                 describe_exception(exception))});
                                  } else if (!result) {
                                      abort_run(std::move(result.error()));
                                  }
                              });
    }

    // join barrier, returns once the lister and every worker have finished
    pool->join();

    const std::scoped_lock lock{outcome_mutex};
    if (fatal_error) {
        return std::unexpected{std::move(*fatal_error)};
    }
    return RunSummary{
        .discovered = stats->discovered(), .completed = stats->completed(), .listing_error = listing_error};
}

} // namespace s3pull::tools::mirror_prefix
