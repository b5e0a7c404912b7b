#pragma once

#include "client.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace s3pull::aws::s3 {

// Where a Downloader gets its bytes from.
class ObjectReader {
public:
    ObjectReader() = default;
    ObjectReader(const ObjectReader &) = delete;
    ObjectReader &operator=(const ObjectReader &) = delete;
    ObjectReader(ObjectReader &&) = delete;
    ObjectReader &operator=(ObjectReader &&) = delete;
    virtual ~ObjectReader() = default;

    [[nodiscard]] virtual Result<GetObjectResult> read(GetObjectParameters parameters,
                                                       ObjectSink &sink [[clang::lifetimebound]],
                                                       std::uint64_t sink_offset) = 0;
};

class ClientObjectReader final : public ObjectReader {
private:
    Client client_;

public:
    [[nodiscard]] explicit ClientObjectReader(Client client) : client_{std::move(client)} {}

    [[nodiscard]] Result<GetObjectResult> read(GetObjectParameters parameters, ObjectSink &sink,
                                               std::uint64_t sink_offset) override {
        return client_.get_object(std::move(parameters), sink, sink_offset);
    }
};

struct DownloaderConfig {
    std::uint64_t part_size = 5 * 1024 * 1024;
    // ranged GETs in flight per object
    std::size_t concurrency = 3;
};

// Downloads an object as a series of ranged GETs of part_size bytes. The first part also yields the
// object size from its Content-Range. The remaining parts are fetched concurrently and written to
// the sink at their own offsets, in whatever order they arrive. download() only returns once no
// part is in flight anymore, on failure as well, so the caller may rewind the sink right away.
class Downloader {
private:
    struct PartQueue;

    std::shared_ptr<ObjectReader> reader_;
    DownloaderConfig config_;

    [[nodiscard]] Result<void> download_parts(PartQueue &parts) const;

public:
    // throws std::invalid_argument for a zero part size or concurrency
    [[nodiscard]] explicit Downloader(std::shared_ptr<ObjectReader> reader, DownloaderConfig config = {});

    [[nodiscard]] const DownloaderConfig &config() const { return config_; }

    // returns the object size
    [[nodiscard]] Result<std::uint64_t> download(std::string bucket, std::string key,
                                                 ObjectSink &sink [[clang::lifetimebound]]) const;
};

} // namespace s3pull::aws::s3
