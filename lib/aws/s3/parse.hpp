#pragma once

#include "s3pull/aws/s3/types.hpp"

#include <expected>
#include <pugixml.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace s3pull::aws::s3::_internal {

// Parses in place, body is modified. Throws std::runtime_error on a truncated result without a
// NextContinuationToken.
[[nodiscard]] std::expected<ListObjectsV2Result, pugi::xml_parse_status>
parse_list_objects_v2(std::string &body);

[[nodiscard]] std::expected<GetBucketLocationResult, pugi::xml_parse_status>
parse_bucket_location(std::string &body);

// Parses "bytes <first>-<last>/<complete length or *>". The unsatisfied form "bytes */<length>" is
// rejected.
[[nodiscard]] std::optional<ByteRange> parse_content_range(std::string_view header);

} // namespace s3pull::aws::s3::_internal
