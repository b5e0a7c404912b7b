#include "local_filesystem.hpp"
#include "misc.hpp"
#include "s3_capabilities.hpp"
#include "s3pull/aws/iam/credentials.hpp"
#include "s3pull/aws/s3/client.hpp"
#include "s3pull/aws/s3/downloader.hpp"
#include "s3pull/aws/s3/session.hpp"
#include "s3pull/aws/s3/types.hpp"
#include "stats_reporter.hpp"
#include "worker_manager.hpp"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#ifndef S3PULL_VERSION
#define S3PULL_VERSION "unknown"
#endif

using namespace s3pull::tools::mirror_prefix;

namespace {

constexpr std::string_view default_region = "us-east-1";

[[nodiscard]] std::string file_to_string(const std::filesystem::path &path) {
    const std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{std::format("failed to open {}", path.string())};
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

[[nodiscard]] std::optional<std::string> from_env(const char *name) {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

struct Options {
    MirrorConfig mirror;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;
    s3pull::aws::iam::Credentials credentials;
    s3pull::aws::s3::DownloaderConfig download;
    std::size_t stats_interval_seconds{};
};

[[nodiscard]] Options parse_opts(int argc, char **argv) {
    Options ret;
    std::string destination;
    std::string access_key_file;
    std::string secret_key_file;

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("version,v", "print the version")
        ("bucket,b", boost::program_options::value<std::string>(&ret.mirror.bucket)->required(), "S3 bucket name")
        ("prefix,p", boost::program_options::value<std::string>(&ret.mirror.prefix)->required(), "key prefix to mirror")
        ("destination,d", boost::program_options::value<std::string>(&destination)->required(), "local directory the keys are written to")
        ("concurrency,c", boost::program_options::value<std::size_t>(&ret.mirror.concurrency)->default_value(50), "number of concurrent downloads")
        ("queue-capacity", boost::program_options::value<std::size_t>(&ret.mirror.queue_capacity)->default_value(1000), "number of listed keys buffered ahead of the downloads")
        ("part-size", boost::program_options::value<std::uint64_t>(&ret.download.part_size)->default_value(ret.download.part_size), "bytes per ranged GET")
        ("part-concurrency", boost::program_options::value<std::size_t>(&ret.download.concurrency)->default_value(ret.download.concurrency), "ranged GETs in flight per object")
        ("region", boost::program_options::value<std::string>(), "bucket region, discovered through GetBucketLocation if neither region nor endpoint are given")
        ("endpoint,e", boost::program_options::value<std::string>(), "endpoint URL, including protocol and (if required) port")
        ("access-key-file", boost::program_options::value<std::string>(&access_key_file), "path to access key file, defaults to $AWS_ACCESS_KEY_ID")
        ("secret-access-key-file", boost::program_options::value<std::string>(&secret_key_file), "path to secret key file, defaults to $AWS_SECRET_ACCESS_KEY")
        ("stats-interval", boost::program_options::value<std::size_t>(&ret.stats_interval_seconds)->default_value(0), "print throughput statistics every N seconds, 0 disables them")
    ;
    // clang-format on

    boost::program_options::variables_map varmap;
    boost::program_options::store(boost::program_options::parse_command_line(argc, argv, descr), varmap);
    if (varmap.contains("help")) {
        std::println("mirror all objects below a S3 prefix into a local directory\n");
        std::cout << descr << '\n';
        exit(0);
    }
    if (varmap.contains("version")) {
        std::println("mirror_prefix {}", S3PULL_VERSION);
        exit(0);
    }
    boost::program_options::notify(varmap);

    if (ret.mirror.prefix.empty()) {
        throw boost::program_options::error{"prefix must not be empty"};
    }
    if (ret.mirror.concurrency == 0) {
        throw boost::program_options::error{"concurrency must be at least 1"};
    }
    if (ret.mirror.queue_capacity == 0) {
        throw boost::program_options::error{"queue-capacity must be at least 1"};
    }
    if (ret.download.part_size == 0) {
        throw boost::program_options::error{"part-size must be at least 1"};
    }
    if (ret.download.concurrency == 0) {
        throw boost::program_options::error{"part-concurrency must be at least 1"};
    }
    ret.mirror.destination = std::filesystem::path{destination};
    if (varmap.contains("region")) {
        ret.region = varmap["region"].as<std::string>();
    }
    if (varmap.contains("endpoint")) {
        ret.endpoint = varmap["endpoint"].as<std::string>();
        if (!boost::urls::parse_absolute_uri(*ret.endpoint)) {
            throw boost::program_options::error{std::format("invalid endpoint URL {}", *ret.endpoint)};
        }
    }

    auto &credentials = ret.credentials;
    if (!access_key_file.empty()) {
        credentials.access_key_id = file_to_string(access_key_file);
    } else if (auto env = from_env("AWS_ACCESS_KEY_ID")) {
        credentials.access_key_id = std::move(*env);
    }
    if (!secret_key_file.empty()) {
        credentials.secret_access_key = file_to_string(secret_key_file);
    } else if (auto env = from_env("AWS_SECRET_ACCESS_KEY")) {
        credentials.secret_access_key = std::move(*env);
    }
    credentials.session_token = from_env("AWS_SESSION_TOKEN");
    boost::algorithm::trim(credentials.access_key_id);
    boost::algorithm::trim(credentials.secret_access_key);
    if (credentials.access_key_id.empty() || credentials.secret_access_key.empty()) {
        throw boost::program_options::error{
            "no credentials, pass --access-key-file and --secret-access-key-file or set AWS_ACCESS_KEY_ID and "
            "AWS_SECRET_ACCESS_KEY"};
    }

    return ret;
}

[[nodiscard]] boost::urls::url parse_endpoint(std::string_view endpoint) {
    auto parsed = boost::urls::parse_absolute_uri(endpoint);
    if (!parsed) {
        throw std::runtime_error{std::format("invalid endpoint {}: {}", endpoint, parsed.error().message())};
    }
    return boost::urls::url{*parsed};
}

// Asks the global endpoint where the bucket lives.
[[nodiscard]] std::expected<std::string, std::string> discover_region(const std::string &bucket,
                                                                      s3pull::aws::iam::Credentials credentials) {
    boost::asio::io_context context;
    credentials.region = default_region;
    const s3pull::aws::s3::Client client{std::make_shared<const s3pull::aws::s3::Session>(
        std::move(credentials), parse_endpoint("https://s3.amazonaws.com"), context.get_executor())};

    auto res = run_blocking(context, client.get_bucket_location({.Bucket = bucket}));
    if (!res) {
        return std::unexpected{std::move(res.error())};
    }
    if (!*res) {
        return std::unexpected{s3pull::aws::s3::describe_error(res->error())};
    }
    return std::move((*res)->Region);
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    Options options;
    try {
        options = parse_opts(argc, argv);
    } catch (const std::exception &e) {
        std::println(std::cerr, "ERROR invalid configuration: {}", e.what());
        return 1;
    }

    if (options.region) {
        options.credentials.region = *options.region;
    } else if (options.endpoint) {
        options.credentials.region = default_region;
    } else {
        auto region = discover_region(options.mirror.bucket, options.credentials);
        if (!region) {
            std::println(std::cerr, "ERROR failed to discover the region of bucket {}: {}", options.mirror.bucket,
                         region.error());
            return 1;
        }
        options.credentials.region = std::move(*region);
    }
    const std::string endpoint =
        options.endpoint.value_or(std::format("https://s3.{}.amazonaws.com", options.credentials.region));

    if (std::error_code ec; !std::filesystem::create_directories(options.mirror.destination, ec) && ec) {
        std::println(std::cerr, "ERROR failed to create destination {}: {}", options.mirror.destination.string(),
                     ec.message());
        return 1;
    }

    auto pool = std::make_unique<boost::asio::thread_pool>(std::max(std::thread::hardware_concurrency(), 1U));
    const auto session = std::make_shared<const s3pull::aws::s3::Session>(
        options.credentials, parse_endpoint(endpoint), pool->get_executor());
    const s3pull::aws::s3::Client client{session};

    const MirrorConfig config = options.mirror;
    s3pull::aws::s3::Downloader downloader{std::make_shared<s3pull::aws::s3::ClientObjectReader>(client),
                                           options.download};
    WorkerManager worker_manager{std::make_shared<S3KeyListing>(client),
                                 std::make_shared<S3ObjectFetcher>(std::move(downloader)),
                                 std::make_shared<LocalFileSystem>(), config, std::move(pool)};

    std::optional<StatsReporter> stats_reporter;
    if (options.stats_interval_seconds > 0) {
        stats_reporter.emplace(
            worker_manager.progress(), [&worker_manager] { return worker_manager.running_workers(); },
            std::chrono::seconds{static_cast<std::chrono::seconds::rep>(options.stats_interval_seconds)},
            std::cout);
    }

    const auto summary = worker_manager.run();
    stats_reporter.reset();

    if (!summary) {
        std::println(std::cerr, "ERROR {}", summary.error());
        return 1;
    }
    if (summary->listing_error) {
        std::println(std::cerr, "WARN listing ended early, objects after the failed page were not mirrored: {}",
                     *summary->listing_error);
    }
    std::println("downloaded {} objects from s3://{}/{}", summary->completed, config.bucket, config.prefix);
    return 0;
}
