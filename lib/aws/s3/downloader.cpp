#include "s3pull/aws/s3/downloader.hpp"

#include "s3pull/aws/s3/client.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/aws/s3/types.hpp"

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/status.hpp>
#include <cstdint>
#include <exception>
#include <expected>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace s3pull::aws::s3 {

// Shared by the part coroutines of one download. Lives in the frame of download(), which outlives
// all of them.
struct Downloader::PartQueue {
    const std::string &bucket;
    const std::string &key;
    ObjectSink &sink;
    std::uint64_t size;
    std::uint64_t part_count;
    // part 0 is fetched by download() itself
    std::atomic<std::uint64_t> next{1};
    std::atomic<bool> failed{false};
};

namespace {

[[nodiscard]] std::string range_header(std::uint64_t first, std::uint64_t last) {
    return std::format("bytes={}-{}", first, last);
}

[[nodiscard]] Error part_mismatch(const std::string &bucket, const std::string &key, std::uint64_t first) {
    std::println(std::cerr, "ERROR GetObject {}/{} returned a part that does not match the range at {}", bucket,
                 key, first);
    return boost::beast::error_code{boost::beast::http::error::partial_message};
}

} // namespace

Downloader::Downloader(std::shared_ptr<ObjectReader> reader, DownloaderConfig config)
    : reader_{std::move(reader)}, config_{config} {
    if (config_.part_size == 0 || config_.concurrency == 0) {
        throw std::invalid_argument{"part size and concurrency must be positive"};
    }
}

Result<std::uint64_t> Downloader::download(std::string bucket, std::string key, ObjectSink &sink) const {
    const std::uint64_t part_size = config_.part_size;

    auto first =
        co_await reader_->read({.Bucket = bucket, .Key = key, .Range = range_header(0, part_size - 1)}, sink, 0);
    if (!first) {
        // S3 rejects any range on an empty object
        if (const auto *status = std::get_if<boost::beast::http::status>(&first.error());
            status != nullptr && *status == boost::beast::http::status::range_not_satisfiable) {
            co_return 0;
        }
        co_return std::unexpected{first.error()};
    }
    if (!first->ContentRange.has_value()) {
        // the server ignored the range and sent the whole object
        co_return first->ContentLength;
    }

    const ByteRange &range = first->ContentRange.value();
    if (!range.CompleteLength.has_value()) {
        std::println(std::cerr, "ERROR GetObject {}/{} did not report the object size", bucket, key);
        co_return std::unexpected<Error>{boost::beast::error_code{boost::beast::http::error::bad_field}};
    }
    const std::uint64_t size = range.CompleteLength.value();
    if (range.First != 0 || range.Last + 1 != first->ContentLength ||
        first->ContentLength != std::min(part_size, size)) {
        co_return std::unexpected{part_mismatch(bucket, key, 0)};
    }

    PartQueue parts{.bucket = bucket,
                    .key = key,
                    .sink = sink,
                    .size = size,
                    .part_count = (size + part_size - 1) / part_size};
    if (parts.part_count == 1) {
        co_return size;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    const auto workers = std::min<std::uint64_t>(config_.concurrency, parts.part_count - 1);
    using part_operation =
        decltype(boost::asio::co_spawn(executor, download_parts(parts), boost::asio::deferred));
    std::vector<part_operation> operations;
    operations.reserve(workers);
    for (std::uint64_t i = 0; i < workers; i++) {
        operations.push_back(boost::asio::co_spawn(executor, download_parts(parts), boost::asio::deferred));
    }

    auto [order, exceptions, results] =
        co_await boost::asio::experimental::make_parallel_group(std::move(operations))
            .async_wait(boost::asio::experimental::wait_for_all(), boost::asio::use_awaitable);
    for (const auto &exception : exceptions) {
        if (exception) {
            std::rethrow_exception(exception);
        }
    }
    for (auto &result : results) {
        if (!result) {
            co_return std::unexpected{std::move(result.error())};
        }
    }
    co_return size;
}

Result<void> Downloader::download_parts(PartQueue &parts) const {
    using rtype = Result<void>::value_type;

    while (!parts.failed.load()) {
        const std::uint64_t part = parts.next.fetch_add(1);
        if (part >= parts.part_count) {
            break;
        }
        const std::uint64_t first = part * config_.part_size;
        const std::uint64_t last = std::min(first + config_.part_size, parts.size) - 1;

        auto res = co_await reader_->read(
            {.Bucket = parts.bucket, .Key = parts.key, .Range = range_header(first, last)}, parts.sink, first);
        if (!res) {
            parts.failed = true;
            co_return std::unexpected{std::move(res.error())};
        }
        const auto &range = res->ContentRange;
        if (!range.has_value() || range->First != first || range->Last != last ||
            range->CompleteLength != parts.size || res->ContentLength != last - first + 1) {
            parts.failed = true;
            co_return std::unexpected{part_mismatch(parts.bucket, parts.key, first)};
        }
    }
    co_return rtype{};
}

} // namespace s3pull::aws::s3
