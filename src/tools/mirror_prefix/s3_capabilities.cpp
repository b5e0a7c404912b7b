#include "s3_capabilities.hpp"

#include "capabilities.hpp"
#include "s3pull/aws/s3/client.hpp"
#include "s3pull/aws/s3/downloader.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/aws/s3/types.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <expected>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <utility>

namespace s3pull::tools::mirror_prefix {

S3KeyListing::S3KeyListing(aws::s3::Client client) : client{std::move(client)} {}

meta::crt<boost::asio::awaitable<std::expected<KeyPage, std::string>>>
S3KeyListing::list_page(std::string bucket, std::string prefix, std::optional<std::string> continuation_token) {
    auto res = co_await client.list_objects_v2({.Bucket = std::move(bucket),
                                                .ContinuationToken = std::move(continuation_token),
                                                .Prefix = std::move(prefix)});
    if (!res) {
        co_return std::unexpected{aws::s3::describe_error(res.error())};
    }

    KeyPage page{.continuation_token = std::move(res->NextContinuationToken)};
    page.keys.reserve(res->Contents.size());
    for (auto &object : res->Contents) {
        if (!object.Key.has_value()) {
            std::println(std::cerr, "ERROR received object without key, ETag {}",
                         object.ETag.value_or("<no ETag>"));
            continue;
        }
        page.keys.emplace_back(std::move(*object.Key));
    }
    co_return page;
}

S3ObjectFetcher::S3ObjectFetcher(aws::s3::Downloader downloader) : downloader{std::move(downloader)} {}

meta::crt<boost::asio::awaitable<std::expected<std::size_t, std::string>>>
S3ObjectFetcher::fetch(std::string bucket, std::string key, aws::s3::ObjectSink &sink) {
    auto res = co_await downloader.download(std::move(bucket), std::move(key), sink);
    if (!res) {
        co_return std::unexpected{aws::s3::describe_error(res.error())};
    }
    co_return *res;
}

} // namespace s3pull::tools::mirror_prefix
