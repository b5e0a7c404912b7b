#pragma once

#include <boost/describe/class.hpp>
#include <boost/describe/enum.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <pugixml.hpp>
#include <string>
#include <vector>

namespace s3pull::aws::s3 {

struct Object {
    enum class StorageClass_t : std::uint8_t {
        STANDARD,
        REDUCED_REDUNDANCY,
        GLACIER,
        STANDARD_IA,
        ONEZONE_IA,
        INTELLIGENT_TIERING,
        DEEP_ARCHIVE,
        OUTPOSTS,
        GLACIER_IR,
        SNOW,
        EXPRESS_ONEZONE,
        FSX_OPENZFS
    };
    BOOST_DESCRIBE_NESTED_ENUM(StorageClass_t, STANDARD, REDUCED_REDUNDANCY, GLACIER, STANDARD_IA, ONEZONE_IA,
                               INTELLIGENT_TIERING, DEEP_ARCHIVE, OUTPOSTS, GLACIER_IR, SNOW, EXPRESS_ONEZONE,
                               FSX_OPENZFS);

    std::optional<std::string> ETag;
    std::optional<std::string> Key;
    std::optional<std::size_t> Size;
    std::optional<StorageClass_t> StorageClass;

    [[nodiscard]] explicit Object(const pugi::xml_node &xml);
};
BOOST_DESCRIBE_STRUCT(Object, (), (ETag, Key, Size, StorageClass));

struct ListObjectsV2Result {
    std::vector<Object> Contents;
    std::optional<std::string> ContinuationToken;
    bool IsTruncated{};
    std::size_t KeyCount{};
    std::string Name;
    std::optional<std::string> NextContinuationToken;
    std::string Prefix;
};
BOOST_DESCRIBE_STRUCT(ListObjectsV2Result, (),
                      (Contents, ContinuationToken, IsTruncated, KeyCount, Name, NextContinuationToken,
                       Prefix));

// Content-Range of a 206 response, both ends inclusive. CompleteLength is unset for "bytes a-b/*".
struct ByteRange {
    std::uint64_t First{};
    std::uint64_t Last{};
    std::optional<std::uint64_t> CompleteLength;
};
BOOST_DESCRIBE_STRUCT(ByteRange, (), (First, Last, CompleteLength));

struct GetObjectResult {
    // bytes written to the sink
    std::uint64_t ContentLength{};
    // only set when the server answered a ranged request with a part of the object
    std::optional<ByteRange> ContentRange;
};
BOOST_DESCRIBE_STRUCT(GetObjectResult, (), (ContentLength, ContentRange));

struct GetBucketLocationResult {
    // already mapped from the legacy values ("" and "EU")
    std::string Region;
};
BOOST_DESCRIBE_STRUCT(GetBucketLocationResult, (), (Region));

} // namespace s3pull::aws::s3
