#pragma once

#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/meta.hpp"
#include "session.hpp"
#include "types.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/status.hpp>
#include <boost/describe/class.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <utility>
#include <variant>

namespace s3pull::aws::s3 {

// transport failure, unparseable response body, or an unexpected HTTP status
using Error = std::variant<boost::beast::error_code, pugi::xml_parse_status, boost::beast::http::status>;

template <typename T> using Result = meta::crt<boost::asio::awaitable<std::expected<T, Error>>>;

struct ListObjectsV2Parameters {
    std::string Bucket;
    std::optional<std::string> ContinuationToken;
    std::size_t MaxKeys = 1000;
    std::optional<std::string> Prefix;
    std::optional<std::string> StartAfter;
};
BOOST_DESCRIBE_STRUCT(ListObjectsV2Parameters, (), (Bucket, ContinuationToken, MaxKeys, Prefix, StartAfter));

struct GetObjectParameters {
    std::string Bucket;
    std::string Key;
    // HTTP Range header value, e.g. "bytes=0-5242879"
    std::optional<std::string> Range;
};
BOOST_DESCRIBE_STRUCT(GetObjectParameters, (), (Bucket, Key, Range));

struct GetBucketLocationParameters {
    std::string Bucket;
};
BOOST_DESCRIBE_STRUCT(GetBucketLocationParameters, (), (Bucket));

// Path-style S3 client. Cheap to copy, all copies share the session.
class Client {
private:
    std::shared_ptr<const Session> session_;

public:
    [[nodiscard]] explicit Client(std::shared_ptr<const Session> session) : session_{std::move(session)} {}

    [[nodiscard]] std::shared_ptr<const Session> session() const { return session_; }

    [[nodiscard]] Result<ListObjectsV2Result> list_objects_v2(ListObjectsV2Parameters parameters,
                                                              boost::beast::http::fields headers = {}) const;

    // Streams the object body, or the requested range of it, into sink starting at sink_offset.
    // An empty object answers a range request with range_not_satisfiable, which is not logged.
    [[nodiscard]] Result<GetObjectResult> get_object(GetObjectParameters parameters,
                                                     ObjectSink &sink [[clang::lifetimebound]],
                                                     std::uint64_t sink_offset = 0,
                                                     boost::beast::http::fields headers = {}) const;

    [[nodiscard]] Result<GetBucketLocationResult>
    get_bucket_location(GetBucketLocationParameters parameters, boost::beast::http::fields headers = {}) const;
};

// human readable description of an Error
[[nodiscard]] std::string describe_error(const Error &error);

} // namespace s3pull::aws::s3
