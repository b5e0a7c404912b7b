#pragma once

#include <string>
#include <string_view>

namespace s3pull::aws::iam {

// percent-encodes everything outside of the RFC 3986 unreserved set, as SigV4 requires for query
// parameter names and values
[[nodiscard]] std::string urlencode(std::string_view input);

// as urlencode, but keeps '/' so that object keys stay hierarchical
[[nodiscard]] std::string urlencode_path(std::string_view input);
[[nodiscard]] bool urlencode_path_required(std::string_view input);

} // namespace s3pull::aws::iam
