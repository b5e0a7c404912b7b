#include "parse.hpp"

#include "s3pull/aws/s3/types.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <format>
#include <iostream>
#include <print>
#include <optional>
#include <pugixml.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace s3pull::aws::s3::_internal {

namespace {

[[nodiscard]] std::expected<pugi::xml_node, pugi::xml_parse_status>
load_root(pugi::xml_document &document, std::string &body, const char *root_name) {
    if (const pugi::xml_parse_status status =
            document.load_buffer_inplace(body.data(), body.size(), pugi::parse_default, pugi::encoding_utf8)
                .status;
        status != pugi::xml_parse_status::status_ok) {
        return std::unexpected{status};
    }
    const pugi::xml_node node = document.child(root_name);
    if (node == nullptr) {
        std::println(std::cerr, "ERROR response has no {} element", root_name);
        return std::unexpected{pugi::xml_parse_status::status_no_document_element};
    }
    return node;
}

// consumes a decimal number from the front of text
[[nodiscard]] std::optional<std::uint64_t> consume_number(std::string_view &text) {
    std::uint64_t value{};
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc{} || res.ptr == text.data()) {
        return std::nullopt;
    }
    text.remove_prefix(static_cast<std::size_t>(res.ptr - text.data()));
    return value;
}

} // namespace

std::expected<ListObjectsV2Result, pugi::xml_parse_status> parse_list_objects_v2(std::string &body) {
    pugi::xml_document document;
    const auto root = load_root(document, body, "ListBucketResult");
    if (!root) {
        return std::unexpected{root.error()};
    }
    const pugi::xml_node &node = *root;

    ListObjectsV2Result ret;
    for (const auto &child : node.children("Contents")) {
        ret.Contents.emplace_back(child);
    }

    if (const char *ContinuationToken_ = node.child_value("ContinuationToken");
        std::strlen(ContinuationToken_) != 0) {
        ret.ContinuationToken = ContinuationToken_;
    }

    if (const std::string_view KeyCount_ = node.child_value("KeyCount"); !KeyCount_.empty()) {
        const char *end = KeyCount_.data() + KeyCount_.size();
        if (const auto res = std::from_chars(KeyCount_.data(), end, ret.KeyCount);
            res.ec != std::errc{} || res.ptr != end) {
            throw std::runtime_error{std::format("failed to parse KeyCount {}", KeyCount_)};
        }
    } else {
        ret.KeyCount = ret.Contents.size();
    }

    if (const std::string_view IsTruncated_ = node.child_value("IsTruncated"); IsTruncated_ == "true") {
        ret.IsTruncated = true;
        const char *NextContinuationToken_ = node.child_value("NextContinuationToken");
        if (std::strlen(NextContinuationToken_) == 0) {
            throw std::runtime_error{"missing NextContinuationToken"};
        }
        ret.NextContinuationToken = NextContinuationToken_;
    } else if (IsTruncated_ == "false") {
        ret.IsTruncated = false;
    } else {
        throw std::runtime_error{std::format("unknown IsTruncated value {}", IsTruncated_)};
    }

    ret.Name = node.child_value("Name");
    ret.Prefix = node.child_value("Prefix");

    return ret;
}

std::expected<GetBucketLocationResult, pugi::xml_parse_status> parse_bucket_location(std::string &body) {
    pugi::xml_document document;
    const auto root = load_root(document, body, "LocationConstraint");
    if (!root) {
        return std::unexpected{root.error()};
    }

    // buckets in us-east-1 report an empty constraint, very old eu-west-1 buckets report "EU"
    const std::string_view constraint = root->child_value();
    if (constraint.empty()) {
        return GetBucketLocationResult{.Region = "us-east-1"};
    }
    if (constraint == "EU") {
        return GetBucketLocationResult{.Region = "eu-west-1"};
    }
    return GetBucketLocationResult{.Region = std::string{constraint}};
}

std::optional<ByteRange> parse_content_range(std::string_view header) {
    constexpr std::string_view unit = "bytes ";
    if (!header.starts_with(unit)) {
        return std::nullopt;
    }
    header.remove_prefix(unit.size());

    ByteRange ret;
    const auto first = consume_number(header);
    if (!first || !header.starts_with('-')) {
        return std::nullopt;
    }
    header.remove_prefix(1);
    const auto last = consume_number(header);
    if (!last || *last < *first || !header.starts_with('/')) {
        return std::nullopt;
    }
    header.remove_prefix(1);
    ret.First = *first;
    ret.Last = *last;

    if (header == "*") {
        return ret;
    }
    const auto complete_length = consume_number(header);
    if (!complete_length || !header.empty() || *complete_length <= *last) {
        return std::nullopt;
    }
    ret.CompleteLength = complete_length;
    return ret;
}

} // namespace s3pull::aws::s3::_internal
