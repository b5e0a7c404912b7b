#include "worker.hpp"

#include "capabilities.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"

#include <atomic>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <utility>

namespace s3pull::tools::mirror_prefix {

std::expected<std::filesystem::path, std::string> destination_path(const std::filesystem::path &destination,
                                                                   std::string_view key) {
    if (const auto first = key.find_first_not_of('/'); first != std::string_view::npos) {
        key.remove_prefix(first);
    } else {
        return std::unexpected{"key has no path components"};
    }

    const std::filesystem::path relative = std::filesystem::path{key}.lexically_normal();
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return std::unexpected{"key resolves to a path outside of the destination"};
    }
    // "a/b/.." names a directory, only keys ending in '/' may do that
    if (!key.ends_with('/') && !relative.has_filename()) {
        return std::unexpected{"key resolves to a directory"};
    }
    return destination / relative;
}

Worker::Worker(std::size_t id, std::string bucket, std::filesystem::path destination,
               std::shared_ptr<ObjectFetcher> fetcher, std::shared_ptr<FileSystem> filesystem,
               std::shared_ptr<KeyQueue> queue, std::shared_ptr<Progress> stats,
               std::shared_ptr<const std::atomic<bool>> aborted)
    : id{id}, bucket{std::move(bucket)}, destination{std::move(destination)}, fetcher{std::move(fetcher)},
      filesystem{std::move(filesystem)}, queue{std::move(queue)}, stats{std::move(stats)},
      aborted{std::move(aborted)} {}

void Worker::report_completed(std::string_view key) {
    const ProgressSnapshot snapshot = stats->record_completed();
    std::println("worker {} ({}/{}) downloaded {}", id, snapshot.completed, snapshot.discovered, key);
}

void Worker::discard(const std::filesystem::path &path) {
    if (auto removed = filesystem->remove(path); !removed) {
        std::println(std::cerr, "ERROR worker {}: failed to remove partial file {}: {}", id, path.string(),
                     removed.error().message());
    }
}

meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> Worker::retrieve(std::string key) {
    using rtype = std::expected<void, FatalError>;
    const auto fail = [&key](FatalReason reason, std::string detail) {
        return std::unexpected{FatalError{.reason = reason, .key = key, .detail = std::move(detail)}};
    };

    const auto local_path = destination_path(destination, key);
    if (!local_path) {
        co_return fail(FatalReason::INVALID_KEY, local_path.error());
    }

    // directory markers have no content worth fetching
    if (key.ends_with('/')) {
        if (auto created = filesystem->create_directories(*local_path); !created) {
            co_return fail(FatalReason::CREATE_DIRECTORY,
                           std::format("{}: {}", local_path->string(), created.error().message()));
        }
        report_completed(key);
        co_return rtype{};
    }

    if (const std::filesystem::path parent = local_path->parent_path(); !parent.empty()) {
        if (auto created = filesystem->create_directories(parent); !created) {
            co_return fail(FatalReason::CREATE_DIRECTORY,
                           std::format("{}: {}", parent.string(), created.error().message()));
        }
    }

    auto created = filesystem->create_file(*local_path);
    if (!created) {
        co_return fail(FatalReason::CREATE_FILE,
                       std::format("{}: {}", local_path->string(), created.error().message()));
    }
    std::unique_ptr<OutputFile> file = std::move(*created);

    for (int attempt = 1;; attempt++) {
        const auto fetched = co_await fetcher->fetch(bucket, key, *file);
        if (fetched) {
            break;
        }

        std::println(std::cerr, "WARN worker {}: attempt {}/{} failed to download {}: {}", id, attempt,
                     max_attempts, key, fetched.error());
        if (attempt == max_attempts) {
            file = nullptr;
            discard(*local_path);
            co_return fail(FatalReason::RETRIES_EXHAUSTED,
                           std::format("no success after {} attempts, last error: {}", max_attempts,
                                       fetched.error()));
        }

        // never let a partial body of this attempt end up in front of the next one
        if (auto reset = file->reset(); !reset) {
            file = nullptr;
            discard(*local_path);
            co_return fail(FatalReason::RESET_FILE,
                           std::format("{}: {}", local_path->string(), reset.error().message()));
        }
    }

    report_completed(key);
    co_return rtype{};
}

meta::crt<boost::asio::awaitable<std::expected<void, FatalError>>> Worker::work() {
    while (!aborted->load()) {
        auto [receive_ec, key] =
            co_await queue->async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
        // channel_closed once the lister is done and the queue is drained, channel_cancelled on abort
        if (receive_ec.failed() || aborted->load()) {
            break;
        }

        if (auto res = co_await retrieve(std::move(key)); !res) {
            co_return res;
        }
    }
    co_return std::expected<void, FatalError>{};
}

} // namespace s3pull::tools::mirror_prefix
