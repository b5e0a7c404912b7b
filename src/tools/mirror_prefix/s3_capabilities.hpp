#pragma once

#include "capabilities.hpp"
#include "s3pull/aws/s3/client.hpp"
#include "s3pull/aws/s3/downloader.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>

namespace s3pull::tools::mirror_prefix {

class S3KeyListing final : public KeyListing {
private:
    aws::s3::Client client;

public:
    [[nodiscard]] explicit S3KeyListing(aws::s3::Client client);

    [[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<KeyPage, std::string>>>
    list_page(std::string bucket, std::string prefix, std::optional<std::string> continuation_token) override;
};

// Every attempt is a fresh ranged download of the whole object.
class S3ObjectFetcher final : public ObjectFetcher {
private:
    aws::s3::Downloader downloader;

public:
    [[nodiscard]] explicit S3ObjectFetcher(aws::s3::Downloader downloader);

    [[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<std::size_t, std::string>>>
    fetch(std::string bucket, std::string key, aws::s3::ObjectSink &sink) override;
};

} // namespace s3pull::tools::mirror_prefix
