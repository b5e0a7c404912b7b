#pragma once

#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

namespace s3pull::aws::s3 {

// Destination of a streamed object body. Writes are positioned so that a consumer can rewind and
// overwrite a previous, partial transfer. A ranged download calls write_at concurrently for
// disjoint ranges.
class ObjectSink {
public:
    ObjectSink() = default;
    ObjectSink(const ObjectSink &) = delete;
    ObjectSink &operator=(const ObjectSink &) = delete;
    ObjectSink(ObjectSink &&) = delete;
    ObjectSink &operator=(ObjectSink &&) = delete;
    virtual ~ObjectSink() = default;

    [[nodiscard]] virtual std::expected<void, boost::system::error_code>
    write_at(std::uint64_t offset, std::span<const std::byte> data) = 0;
};

} // namespace s3pull::aws::s3
