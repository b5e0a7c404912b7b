#include "s3pull/aws/s3/client.hpp"
#include "s3pull/aws/s3/downloader.hpp"
#include "s3pull/aws/s3/object_sink.hpp"
#include "s3pull/aws/s3/types.hpp"
#include "s3pull/meta.hpp"

#include <algorithm>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace s3pull::aws::s3;

namespace {

// "bytes=<first>-<last>"
[[nodiscard]] std::optional<std::pair<std::uint64_t, std::uint64_t>> parse_range(std::string_view range) {
    constexpr std::string_view unit = "bytes=";
    if (!range.starts_with(unit)) {
        return std::nullopt;
    }
    range.remove_prefix(unit.size());
    std::uint64_t first{};
    std::uint64_t last{};
    const char *end = range.data() + range.size();
    const auto first_res = std::from_chars(range.data(), end, first);
    if (first_res.ec != std::errc{} || first_res.ptr == end || *first_res.ptr != '-') {
        return std::nullopt;
    }
    const auto last_res = std::from_chars(first_res.ptr + 1, end, last);
    if (last_res.ec != std::errc{} || last_res.ptr != end) {
        return std::nullopt;
    }
    return std::pair{first, last};
}

// Serves one object from memory. Parts further into the object answer sooner, so that a
// concurrent download receives them back to front.
class FakeReader final : public ObjectReader {
private:
    std::string content;
    bool honor_range;
    std::optional<std::uint64_t> failing_offset;

public:
    std::vector<std::string> ranges;
    std::size_t in_flight{};
    std::size_t max_in_flight{};

    explicit FakeReader(std::string content, bool honor_range = true,
                        std::optional<std::uint64_t> failing_offset = std::nullopt)
        : content{std::move(content)}, honor_range{honor_range}, failing_offset{failing_offset} {}

    Result<GetObjectResult> read(GetObjectParameters parameters, ObjectSink &sink,
                                 std::uint64_t sink_offset) override {
        ranges.push_back(parameters.Range.value_or(""));
        max_in_flight = std::max(max_in_flight, ++in_flight);
        const boost::scope::scope_exit leave{[this]() { in_flight--; }};

        if (!honor_range) {
            if (auto written = sink.write_at(sink_offset, s3pull::meta::as_bytes(content)); !written) {
                co_return std::unexpected<Error>{written.error()};
            }
            co_return GetObjectResult{.ContentLength = content.size()};
        }
        if (content.empty()) {
            co_return std::unexpected<Error>{boost::beast::http::status::range_not_satisfiable};
        }

        const auto range = parse_range(parameters.Range.value_or(""));
        if (!range || range->first >= content.size()) {
            co_return std::unexpected<Error>{boost::beast::http::status::range_not_satisfiable};
        }
        const std::uint64_t first = range->first;
        const std::uint64_t last = std::min<std::uint64_t>(range->second, content.size() - 1);

        const auto delay = static_cast<std::chrono::milliseconds::rep>(2 * (content.size() - first));
        boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor,
                                        std::chrono::milliseconds{delay}};
        static_cast<void>(co_await timer.async_wait(boost::asio::as_tuple(boost::asio::use_awaitable)));

        if (failing_offset == first) {
            co_return std::unexpected<Error>{boost::beast::http::status::internal_server_error};
        }
        const std::string_view part = std::string_view{content}.substr(first, last - first + 1);
        if (auto written = sink.write_at(sink_offset, s3pull::meta::as_bytes(part)); !written) {
            co_return std::unexpected<Error>{written.error()};
        }
        co_return GetObjectResult{.ContentLength = part.size(),
                                  .ContentRange = ByteRange{.First = first,
                                                               .Last = last,
                                                               .CompleteLength = content.size()}};
    }
};

class MemorySink final : public ObjectSink {
public:
    std::string data;
    std::vector<std::uint64_t> offsets;

    std::expected<void, boost::system::error_code> write_at(std::uint64_t offset,
                                                            std::span<const std::byte> bytes) override {
        offsets.push_back(offset);
        const std::string_view chars = s3pull::meta::as_chars(bytes);
        if (data.size() < offset + chars.size()) {
            data.resize(offset + chars.size());
        }
        data.replace(offset, chars.size(), chars);
        return {};
    }
};

[[nodiscard]] std::expected<std::uint64_t, Error> download(const Downloader &downloader, ObjectSink &sink) {
    boost::asio::io_context context;
    std::expected<std::uint64_t, Error> ret;
    boost::asio::co_spawn(context, downloader.download("bucket", "key", sink),
                          [&ret](std::exception_ptr exception, std::expected<std::uint64_t, Error> res) {
                              if (exception) {
                                  std::rethrow_exception(std::move(exception));
                              }
                              ret = std::move(res);
                          });
    context.run();
    return ret;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    const std::string content = "the quick brown fox jumps over the lazy dog";
    const DownloaderConfig config{.part_size = 4, .concurrency = 3};

    // eleven parts, the ones behind the first arrive out of order and land at their own offsets
    {
        const auto reader = std::make_shared<FakeReader>(content);
        const Downloader downloader{reader, config};
        MemorySink sink;
        const auto res = download(downloader, sink);
        if (!res || *res != content.size()) {
            std::cerr << "ranged download failed\n";
            return 1;
        }
        if (sink.data != content) {
            std::cerr << "ranged download wrote " << sink.data << "\n";
            return 1;
        }
        if (reader->ranges.size() != 11 || reader->ranges.front() != "bytes=0-3" ||
            std::set<std::string>(reader->ranges.begin(), reader->ranges.end()).size() != 11) {
            std::cerr << "ranged download requested " << reader->ranges.size() << " parts\n";
            return 1;
        }
        if (std::ranges::is_sorted(sink.offsets)) {
            std::cerr << "parts were not written out of order\n";
            return 1;
        }
        if (reader->max_in_flight != config.concurrency) {
            std::cerr << reader->max_in_flight << " parts were in flight at once\n";
            return 1;
        }
    }

    // an object smaller than one part takes a single request
    {
        const auto reader = std::make_shared<FakeReader>("fox");
        const Downloader downloader{reader, config};
        MemorySink sink;
        if (const auto res = download(downloader, sink); !res || *res != 3 || sink.data != "fox") {
            std::cerr << "small object download failed\n";
            return 1;
        }
        if (reader->ranges.size() != 1) {
            std::cerr << "small object took " << reader->ranges.size() << " requests\n";
            return 1;
        }
    }

    // empty objects reject every range
    {
        const Downloader downloader{std::make_shared<FakeReader>(""), config};
        MemorySink sink;
        if (const auto res = download(downloader, sink); !res || *res != 0 || !sink.offsets.empty()) {
            std::cerr << "empty object download failed\n";
            return 1;
        }
    }

    // a server without range support sends everything at once
    {
        const auto reader = std::make_shared<FakeReader>(content, false);
        const Downloader downloader{reader, config};
        MemorySink sink;
        if (const auto res = download(downloader, sink); !res || *res != content.size() || sink.data != content) {
            std::cerr << "download without range support failed\n";
            return 1;
        }
        if (reader->ranges.size() != 1) {
            std::cerr << "download without range support took " << reader->ranges.size() << " requests\n";
            return 1;
        }
    }

    // one failed part fails the download, and nothing is in flight anymore when it returns
    {
        const auto reader = std::make_shared<FakeReader>(content, true, 20);
        const Downloader downloader{reader, config};
        MemorySink sink;
        const auto res = download(downloader, sink);
        const auto *status = res ? nullptr : std::get_if<boost::beast::http::status>(&res.error());
        if (status == nullptr || *status != boost::beast::http::status::internal_server_error) {
            std::cerr << "failed part did not fail the download\n";
            return 1;
        }
        if (reader->in_flight != 0) {
            std::cerr << "download returned with parts in flight\n";
            return 1;
        }
    }
}
