#pragma once

#include <optional>
#include <string>

namespace s3pull::aws::iam {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    // temporary credentials carry a token that has to be sent as x-amz-security-token
    std::optional<std::string> session_token;
    std::string region;
};

} // namespace s3pull::aws::iam
