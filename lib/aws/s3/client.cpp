#include "s3pull/aws/s3/client.hpp"

#include "parse.hpp"
#include "s3pull/aws/iam/urlencode.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/aws/s3/types.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/status.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <iostream>
#include <print>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace s3pull::aws::s3 {

namespace {

[[nodiscard]] std::string list_objects_v2_query(const ListObjectsV2Parameters &parameters) {
    std::string query;
    auto add_param = [&query](std::string_view param) {
        if (!query.empty()) {
            query.append("&");
        }
        query.append(param);
    };

    if (parameters.ContinuationToken.has_value()) {
        add_param(std::format("continuation-token={}", iam::urlencode(parameters.ContinuationToken.value())));
    }
    add_param("list-type=2");
    add_param(std::format("max-keys={}", parameters.MaxKeys));
    if (parameters.Prefix.has_value()) {
        add_param(std::format("prefix={}", iam::urlencode(parameters.Prefix.value())));
    }
    if (parameters.StartAfter.has_value()) {
        add_param(std::format("start-after={}", iam::urlencode(parameters.StartAfter.value())));
    }

    return query;
}

} // namespace

std::string describe_error(const Error &error) {
    struct Visitor {
        static std::string operator()(const boost::beast::error_code &ec) { return ec.message(); }
        static std::string operator()(const pugi::xml_parse_status &status) {
            return std::format("pugixml error {}", std::to_underlying(status));
        }
        static std::string operator()(const boost::beast::http::status &status) {
            return std::format("HTTP status {}", static_cast<unsigned>(status));
        }
    };
    return std::visit(Visitor{}, error);
}

Result<ListObjectsV2Result> Client::list_objects_v2(ListObjectsV2Parameters parameters,
                                                    boost::beast::http::fields headers) const {
    const std::string query = list_objects_v2_query(parameters);

    auto res = co_await session_->get(std::format("/{}", parameters.Bucket), query, std::move(headers));
    if (!res) {
        co_return std::unexpected<Error>{res.error()};
    }
    if (res->result() != boost::beast::http::status::ok) {
        std::println(std::cerr, "ERROR ListObjectsV2 {} returned {}: {}", query, res->result_int(),
                     res->body());
        co_return std::unexpected<Error>{res->result()};
    }
    co_return _internal::parse_list_objects_v2(res->body())
        .transform_error([&query](pugi::xml_parse_status err) {
            std::println(std::cerr, "ERROR query {}", query);
            return Error{err};
        });
}

Result<GetObjectResult> Client::get_object(GetObjectParameters parameters, ObjectSink &sink,
                                           std::uint64_t sink_offset, boost::beast::http::fields headers) const {
    const std::string path = std::format("/{}/{}", parameters.Bucket, parameters.Key);
    if (parameters.Range.has_value()) {
        headers.set(boost::beast::http::field::range, parameters.Range.value());
    }

    auto res = co_await session_->get_into(path, "", std::move(headers), sink, sink_offset);
    if (!res) {
        co_return std::unexpected<Error>{res.error()};
    }
    switch (res->status) {
    case boost::beast::http::status::ok:
        co_return GetObjectResult{.ContentLength = res->bytes_written};
    case boost::beast::http::status::partial_content:
        break;
    case boost::beast::http::status::range_not_satisfiable:
        if (parameters.Range.has_value()) {
            co_return std::unexpected<Error>{res->status};
        }
        [[fallthrough]];
    default:
        std::println(std::cerr, "ERROR GetObject {} returned {}: {}", path, static_cast<unsigned>(res->status),
                     res->error_body);
        co_return std::unexpected<Error>{res->status};
    }

    const auto content_range = _internal::parse_content_range(res->content_range);
    if (!content_range) {
        std::println(std::cerr, "ERROR GetObject {} returned an invalid Content-Range {}", path,
                     res->content_range);
        co_return std::unexpected<Error>{boost::beast::error_code{boost::beast::http::error::bad_field}};
    }
    co_return GetObjectResult{.ContentLength = res->bytes_written, .ContentRange = content_range};
}

Result<GetBucketLocationResult> Client::get_bucket_location(GetBucketLocationParameters parameters,
                                                            boost::beast::http::fields headers) const {
    auto res = co_await session_->get(std::format("/{}", parameters.Bucket), "location", std::move(headers));
    if (!res) {
        co_return std::unexpected<Error>{res.error()};
    }
    if (res->result() != boost::beast::http::status::ok) {
        std::println(std::cerr, "ERROR GetBucketLocation {} returned {}: {}", parameters.Bucket,
                     res->result_int(), res->body());
        co_return std::unexpected<Error>{res->result()};
    }
    co_return _internal::parse_bucket_location(res->body())
        .transform_error([](pugi::xml_parse_status err) { return Error{err}; });
}

} // namespace s3pull::aws::s3
