#include "transport.hpp"

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/aws/iam/signer.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <openssl/err.h>
#include <openssl/tls1.h>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace s3pull::aws::s3::_internal {

namespace {
constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);
}

Stream make_stream(bool is_ssl, boost::asio::any_io_executor executor, boost::asio::ssl::context &ssl_ctx) {
    if (is_ssl) {
        return boost::asio::ssl::stream<boost::beast::tcp_stream>{std::move(executor), ssl_ctx};
    }
    return {boost::beast::tcp_stream{std::move(executor)}};
}

meta::crt<boost::asio::awaitable<std::expected<Stream, boost::beast::error_code>>>
connect_stream(Stream stream, boost::urls::url endpoint, boost::asio::any_io_executor executor) {
    using rtype = std::expected<Stream, boost::beast::error_code>;

    std::visit([](auto &stream_) { boost::beast::get_lowest_layer(stream_).expires_after(io_timeout); },
               stream);

    boost::asio::ip::tcp::resolver resolver{executor};
    const std::string port_or_scheme =
        endpoint.has_port() ? endpoint.port() : (endpoint.has_scheme() ? endpoint.scheme() : "https");

    const auto [dns_ec, resolved_ep] =
        co_await resolver.async_resolve(endpoint.host(), port_or_scheme, token);
    if (dns_ec.failed()) {
        co_return rtype{std::unexpect, dns_ec};
    }

    {
        const auto [con_ec, con_ep] = co_await std::visit(
            [&](auto &stream_) {
                // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
                return boost::beast::get_lowest_layer(stream_).async_connect(resolved_ep, token);
            },
            stream);
        if (con_ec.failed()) {
            co_return rtype{std::unexpect, con_ec};
        }
    }

    if (auto *ssl_stream = std::get_if<1>(&stream); ssl_stream != nullptr) {
        const std::string host = endpoint.host_name();
        if (SSL_set_tlsext_host_name(ssl_stream->native_handle(), host.c_str()) != 1) {
            co_return rtype{std::unexpect, boost::beast::error_code{static_cast<int>(::ERR_get_error()),
                                                                   boost::asio::error::get_ssl_category()}};
        }
        ssl_stream->set_verify_callback(boost::asio::ssl::host_name_verification{host});
        const auto [shake_ec] =
            co_await ssl_stream->async_handshake(boost::asio::ssl::stream_base::client, token);
        if (shake_ec.failed()) {
            co_return rtype{std::unexpect, shake_ec};
        }
    }

    co_return rtype{std::move(stream)};
}

Request sign_request(Request request, const iam::Credentials &credentials,
                     const boost::urls::url &endpoint) {
    request.set(boost::beast::http::field::host, std::string_view{endpoint.encoded_host_and_port()});
    if (credentials.session_token.has_value()) {
        request.set("x-amz-security-token", *credentials.session_token);
    }
    const std::string amz_date = iam::format_amz_date(std::chrono::system_clock::now());
    request.set("x-amz-date", amz_date);
    request.set(boost::beast::http::field::accept_encoding, "identity");
    request.content_length(request.payload_size());

    if (request["x-amz-content-sha256"].empty()) {
        request.set("x-amz-content-sha256",
                    iam::hash_payload(std::span<const std::byte>{request.body().data(),
                                                                 request.body().size()}));
    }

    const iam::Scope scope{.date = amz_date.substr(0, 8), .region = credentials.region, .service = "s3"};
    const iam::CanonicalRequest canonical = iam::canonicalize_request(request);
    request.set(boost::beast::http::field::authorization,
                iam::authorization(credentials, canonical, amz_date, scope));

    return request;
}

} // namespace s3pull::aws::s3::_internal
