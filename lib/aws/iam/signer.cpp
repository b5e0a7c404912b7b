#include "s3pull/aws/iam/signer.hpp"

#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/meta.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/url/param.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <botan/hash.h>
#include <botan/hex.h>
#include <botan/mac.h>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <iterator>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace s3pull::aws::iam {

namespace {

[[nodiscard]] std::vector<std::uint8_t> hmac(std::span<const std::uint8_t> key, std::string_view data) {
    auto mac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-256)");
    mac->set_key(key);
    mac->update(data);
    return mac->final_stdvec();
}

void append_canonical_query(std::string &out, const boost::urls::url_view &target) {
    // parameters are sorted by their encoded name
    std::multimap<std::string, std::string, std::less<>> params;
    for (const auto &param : target.encoded_params()) {
        params.emplace(std::string_view{param.key},
                       param.has_value ? std::string_view{param.value} : std::string_view{});
    }
    bool first = true;
    for (const auto &[key, value] : params) {
        if (!first) {
            out += '&';
        }
        first = false;
        std::format_to(std::back_inserter(out), "{}={}", key, value);
    }
}

} // namespace

namespace _internal {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
CanonicalRequest canonicalize_request(std::string_view method, std::string_view encoded_target,
                                      std::span<const std::byte> body, boost::beast::http::fields &headers) {
    CanonicalRequest ret;
    const boost::urls::url_view target = boost::urls::parse_origin_form(encoded_target).value();

    std::string &out = ret.request;
    std::format_to(std::back_inserter(out), "{}\n{}\n", method, std::string_view{target.encoded_path()});
    append_canonical_query(out, target);
    out += '\n';

    std::map<std::string, std::string, std::less<>> signed_headers;
    signed_headers.emplace("host", std::string_view{headers[boost::beast::http::field::host]});
    for (const auto &header : headers) {
        std::string name{header.name_string()};
        boost::algorithm::to_lower(name);
        if (name.starts_with("x-amz-") || name == "content-md5") {
            std::string value{std::string_view{header.value()}};
            boost::algorithm::trim(value);
            signed_headers.emplace(std::move(name), std::move(value));
        }
    }

    for (const auto &[name, value] : signed_headers) {
        std::format_to(std::back_inserter(out), "{}:{}\n", name, value);
    }
    out += '\n';

    for (const auto &[name, value] : signed_headers) {
        if (!ret.signed_headers.empty()) {
            ret.signed_headers += ';';
        }
        ret.signed_headers += name;
    }
    // a hash header added here is not part of SignedHeaders
    if (headers["x-amz-content-sha256"].empty()) {
        headers.set("x-amz-content-sha256", hash_payload(body));
    }
    std::format_to(std::back_inserter(out), "{}\n{}", ret.signed_headers,
                   std::string_view{headers["x-amz-content-sha256"]});

    return ret;
}

} // namespace _internal

std::string hash_payload(std::span<const std::byte> payload) {
    auto hash = Botan::HashFunction::create_or_throw("SHA-256");
    hash->update(meta::as_chars(payload));
    return Botan::hex_encode(hash->final_stdvec(), false);
}

std::string string_to_sign(std::string_view canonical_request, const Scope &scope,
                           std::string_view amz_date) {
    return std::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", amz_date, scope,
                       hash_payload(meta::as_bytes(canonical_request)));
}

std::vector<std::uint8_t> derive_signing_key(std::string_view secret_access_key, const Scope &scope) {
    std::vector<std::uint8_t> key;
    std::format_to(std::back_inserter(key), "AWS4{}", secret_access_key);

    key = hmac(key, scope.date);
    key = hmac(key, scope.region);
    key = hmac(key, scope.service);
    return hmac(key, Scope::terminator);
}

std::string authorization(const Credentials &credentials, const CanonicalRequest &canonical,
                          std::string_view amz_date, const Scope &scope) {
    const std::vector<std::uint8_t> signing_key = derive_signing_key(credentials.secret_access_key, scope);
    const std::string signature =
        Botan::hex_encode(hmac(signing_key, string_to_sign(canonical.request, scope, amz_date)), false);

    return std::format("AWS4-HMAC-SHA256 Credential={}/{},SignedHeaders={},Signature={}",
                       credentials.access_key_id, scope, canonical.signed_headers, signature);
}

} // namespace s3pull::aws::iam
