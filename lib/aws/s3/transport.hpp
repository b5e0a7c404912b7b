#pragma once

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/meta.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/beast/http/span_body.hpp>
#pragma GCC diagnostic pop

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <variant>

namespace s3pull::aws::s3::_internal {

using Stream = std::variant<boost::beast::tcp_stream, boost::asio::ssl::stream<boost::beast::tcp_stream>>;
using Request = boost::beast::http::request<boost::beast::http::span_body<const std::byte>>;

// inactivity timeout, re-armed before every read and write
constexpr std::chrono::seconds io_timeout{300};

[[nodiscard]] Stream make_stream(bool is_ssl, boost::asio::any_io_executor executor,
                                 boost::asio::ssl::context &ssl_ctx);

// resolve, connect and, for https, handshake with SNI and host name verification
[[nodiscard]] meta::crt<boost::asio::awaitable<std::expected<Stream, boost::beast::error_code>>>
connect_stream(Stream stream, boost::urls::url endpoint, boost::asio::any_io_executor executor);

[[nodiscard]] Request sign_request(Request request, const iam::Credentials &credentials,
                                   const boost::urls::url &endpoint);

} // namespace s3pull::aws::s3::_internal
