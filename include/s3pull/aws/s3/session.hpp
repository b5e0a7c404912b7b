#pragma once

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp>      // IWYU pragma: keep
#include <boost/beast/http/message.hpp>     // IWYU pragma: keep
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/url/url.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace s3pull::aws::s3 {

// Outcome of a streamed GET. The body only went to the sink for status 200 and 206; for every other
// status it is collected in error_body.
struct StreamedResponse {
    boost::beast::http::status status{};
    std::size_t bytes_written{};
    // raw Content-Range header, empty if the response had none
    std::string content_range;
    std::string error_body;
};

// Signs and sends requests to one endpoint. Every request uses its own connection.
class Session {
public:
    using crt = meta::crt<boost::asio::awaitable<std::expected<
        boost::beast::http::response<boost::beast::http::string_body>, boost::beast::error_code>>>;
    using streamed_crt =
        meta::crt<boost::asio::awaitable<std::expected<StreamedResponse, boost::beast::error_code>>>;

private:
    iam::Credentials credentials_;
    boost::urls::url endpoint_;
    boost::asio::any_io_executor executor_;
    mutable boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};

public:
    [[nodiscard]] Session(iam::Credentials credentials, boost::urls::url endpoint,
                          boost::asio::any_io_executor executor);

    [[nodiscard]] const iam::Credentials &credentials() const { return credentials_; }
    [[nodiscard]] const boost::urls::url &endpoint() const { return endpoint_; }

    [[nodiscard]] [[clang::coro_wrapper]] crt get(std::string_view path, std::string_view query = "",
                                                  boost::beast::http::fields headers = {}) const;

    // The first body byte goes to sink_offset.
    [[nodiscard]] streamed_crt get_into(std::string_view path, std::string_view query,
                                        boost::beast::http::fields headers,
                                        ObjectSink &sink [[clang::lifetimebound]],
                                        std::uint64_t sink_offset = 0) const;
};

} // namespace s3pull::aws::s3
