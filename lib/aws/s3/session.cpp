#include "s3pull/aws/s3/session.hpp"

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/aws/iam/urlencode.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "transport.hpp"

#include <algorithm>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>  // IWYU pragma: keep
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/url/url.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace s3pull::aws::s3 {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

constexpr std::size_t chunk_size = 256 * 1024;

// S3 error documents are small, anything beyond this is cut off
constexpr std::size_t max_error_body = 64 * 1024;

[[nodiscard]] std::string make_target(std::string_view path, std::string_view query) {
    std::string target = iam::urlencode_path_required(path) ? iam::urlencode_path(path) : std::string{path};
    if (!query.empty()) {
        target = std::format("{}?{}", target, query);
    }
    return target;
}

[[nodiscard]] _internal::Request make_request(std::string_view target, boost::beast::http::fields headers,
                                              const iam::Credentials &credentials,
                                              const boost::urls::url &endpoint) {
    _internal::Request request{boost::beast::http::verb::get, target, 11, std::span<const std::byte>{},
                               std::move(headers)};
    return _internal::sign_request(std::move(request), credentials, endpoint);
}

} // namespace

Session::Session(iam::Credentials credentials, boost::urls::url endpoint,
                 boost::asio::any_io_executor executor)
    : credentials_{std::move(credentials)}, endpoint_{std::move(endpoint)}, executor_{std::move(executor)} {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
}

Session::crt Session::get(std::string_view path, std::string_view query,
                          boost::beast::http::fields headers) const {
    using rtype = Session::crt::value_type;

    const std::string target = make_target(path, query);
    auto request = make_request(target, std::move(headers), credentials_, endpoint_);

    const bool is_ssl = endpoint_.scheme() != "http";
    // TODO: gracefully shut down the ssl stream instead of dropping the connection
    auto prep_res = co_await _internal::connect_stream(_internal::make_stream(is_ssl, executor_, ssl_ctx_),
                                                       endpoint_, executor_);
    if (!prep_res) {
        co_return rtype{std::unexpect, prep_res.error()};
    }
    auto stream = std::move(prep_res.value());

    boost::beast::flat_buffer buf;
    boost::beast::http::response<boost::beast::http::string_body> response;

    const auto [send_ec, send_n] = co_await std::visit(
        [&request](auto &stream_) { return boost::beast::http::async_write(stream_, request, token); }, stream);
    if (send_ec.failed()) {
        co_return rtype{std::unexpect, send_ec};
    }

    const auto [recv_ec, recv_n] = co_await std::visit(
        [&buf, &response](auto &stream_) {
            // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
            return boost::beast::http::async_read(stream_, buf, response, token);
        },
        stream);
    if (recv_ec.failed()) {
        co_return rtype{std::unexpect, recv_ec};
    }

    co_return response;
}

Session::streamed_crt Session::get_into(std::string_view path, std::string_view query,
                                        boost::beast::http::fields headers, ObjectSink &sink,
                                        std::uint64_t sink_offset) const {
    using rtype = Session::streamed_crt::value_type;

    const std::string target = make_target(path, query);
    auto request = make_request(target, std::move(headers), credentials_, endpoint_);

    const bool is_ssl = endpoint_.scheme() != "http";
    auto prep_res = co_await _internal::connect_stream(_internal::make_stream(is_ssl, executor_, ssl_ctx_),
                                                       endpoint_, executor_);
    if (!prep_res) {
        co_return rtype{std::unexpect, prep_res.error()};
    }
    auto stream = std::move(prep_res.value());

    const auto [send_ec, send_n] = co_await std::visit(
        [&request](auto &stream_) { return boost::beast::http::async_write(stream_, request, token); }, stream);
    if (send_ec.failed()) {
        co_return rtype{std::unexpect, send_ec};
    }

    boost::beast::flat_buffer buf;
    boost::beast::http::response_parser<boost::beast::http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    const auto [header_ec, header_n] = co_await std::visit(
        [&buf, &parser](auto &stream_) {
            return boost::beast::http::async_read_header(stream_, buf, parser, token);
        },
        stream);
    if (header_ec.failed()) {
        co_return rtype{std::unexpect, header_ec};
    }

    StreamedResponse ret{.status = parser.get().result(),
                         .content_range = std::string{parser.get()[boost::beast::http::field::content_range]}};
    const bool to_sink = ret.status == boost::beast::http::status::ok ||
                         ret.status == boost::beast::http::status::partial_content;

    std::vector<char> chunk(chunk_size);
    std::uint64_t offset = 0;
    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();

        std::visit(
            [](auto &stream_) {
                boost::beast::get_lowest_layer(stream_).expires_after(_internal::io_timeout);
            },
            stream);
        auto [read_ec, read_n] = co_await std::visit(
            [&buf, &parser](auto &stream_) { return boost::beast::http::async_read(stream_, buf, parser, token); },
            stream);
        if (read_ec == boost::beast::http::error::need_buffer) {
            read_ec = {};
        }
        if (read_ec.failed()) {
            co_return rtype{std::unexpect, read_ec};
        }

        const std::size_t filled = chunk.size() - parser.get().body().size;
        const std::span<const std::byte> data =
            std::as_bytes(std::span<const char>{chunk.data(), filled});
        if (to_sink) {
            if (auto written = sink.write_at(sink_offset + offset, data); !written) {
                co_return rtype{std::unexpect, written.error()};
            }
            offset += filled;
        } else if (ret.error_body.size() < max_error_body) {
            ret.error_body.append(chunk.data(), std::min(filled, max_error_body - ret.error_body.size()));
        }
    }

    ret.bytes_written = offset;
    co_return ret;
}

} // namespace s3pull::aws::s3
