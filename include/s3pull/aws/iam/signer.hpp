#pragma once

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/meta.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// AWS Signature Version 4, see
// https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html

namespace s3pull::aws::iam {

struct Scope {
    // YYYYMMDD
    std::string date;
    std::string region;
    std::string service;
    constexpr static std::string_view terminator = "aws4_request";
};

struct CanonicalRequest {
    std::string request;
    // semicolon separated, lowercase and sorted
    std::string signed_headers;
};

template <typename T>
    requires meta::is_specialization_v<T, std::chrono::time_point>
[[nodiscard]] std::string format_amz_date(const T &time) {
    // some endpoints won't work with the +offset format
    return std::format("{0:%Y%m%d}T{0:%H%M}{0:%OS}Z", std::chrono::floor<std::chrono::seconds>(time));
}

namespace _internal {

[[nodiscard]] CanonicalRequest canonicalize_request(std::string_view method,
                                                    std::string_view encoded_target,
                                                    std::span<const std::byte> body,
                                                    boost::beast::http::fields &headers);

} // namespace _internal

// Adds x-amz-content-sha256 to the request headers if it is missing. A header added this way is
// not part of SignedHeaders, so requests that are sent should carry it already.
template <typename Request> [[nodiscard]] CanonicalRequest canonicalize_request(Request &request) {
    return _internal::canonicalize_request(
        request.method_string(), request.target(),
        std::span<const std::byte>{meta::safe_reinterpret_cast<const std::byte *>(request.body().data()),
                                   request.body().size()},
        request.base());
}

// lowercase hex SHA-256, the value of x-amz-content-sha256
[[nodiscard]] std::string hash_payload(std::span<const std::byte> payload);

[[nodiscard]] std::string string_to_sign(std::string_view canonical_request, const Scope &scope,
                                         std::string_view amz_date);

[[nodiscard]] std::vector<std::uint8_t> derive_signing_key(std::string_view secret_access_key,
                                                           const Scope &scope);

// value of the Authorization header
[[nodiscard]] std::string authorization(const Credentials &credentials, const CanonicalRequest &canonical,
                                        std::string_view amz_date, const Scope &scope);

} // namespace s3pull::aws::iam

template <> struct std::formatter<s3pull::aws::iam::Scope> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const s3pull::aws::iam::Scope &scope, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}/{}/{}/{}", scope.date, scope.region, scope.service,
                              s3pull::aws::iam::Scope::terminator);
    }
};
