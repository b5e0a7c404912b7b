#include "s3pull/aws/s3/types.hpp"

#include <boost/describe/enum_from_string.hpp>
#include <charconv>
#include <cstring>
#include <format>
#include <pugixml.hpp>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace s3pull::aws::s3 {

Object::Object(const pugi::xml_node &xml) {
    if (const pugi::xml_node key = xml.child("Key"); key != nullptr) {
        Key = key.child_value();
    }

    if (const char *parsed = xml.child_value("ETag"); std::strlen(parsed) > 0) {
        ETag = parsed;
    }

    if (const std::string_view size_str = xml.child_value("Size"); !size_str.empty()) {
        std::size_t parsed_size{};
        const char *end = size_str.data() + size_str.size();
        if (const auto res = std::from_chars(size_str.data(), end, parsed_size);
            res.ec != std::errc{} || res.ptr != end) {
            throw std::runtime_error{std::format("failed to parse object size {}", size_str)};
        }
        Size = parsed_size;
    }

    if (const char *parsed = xml.child_value("StorageClass"); std::strlen(parsed) > 0) {
        // storage classes get added regularly, an unknown one is not worth failing a listing page for
        if (enum StorageClass_t storage_class {}; boost::describe::enum_from_string(parsed, storage_class)) {
            StorageClass = storage_class;
        }
    }
}

} // namespace s3pull::aws::s3
