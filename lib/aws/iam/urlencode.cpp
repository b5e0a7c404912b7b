#include "s3pull/aws/iam/urlencode.hpp"

#include <boost/url/encode.hpp> // IWYU pragma: keep
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <string>
#include <string_view>

namespace s3pull::aws::iam {

namespace {

constexpr boost::urls::grammar::lut_chars unreserved = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                       "abcdefghijklmnopqrstuvwxyz"
                                                       "1234567890"
                                                       "-._~";

constexpr boost::urls::grammar::lut_chars path_chars = unreserved + "/";

} // namespace

std::string urlencode(std::string_view input) { return boost::urls::encode(input, unreserved); }

std::string urlencode_path(std::string_view input) { return boost::urls::encode(input, path_chars); }

bool urlencode_path_required(std::string_view input) {
    return boost::urls::grammar::find_if_not(input.begin(), input.end(), path_chars) != input.end();
}

} // namespace s3pull::aws::iam
