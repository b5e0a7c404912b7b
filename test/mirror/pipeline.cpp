#include "fakes.hpp"
#include "local_filesystem.hpp"
#include "misc.hpp"
#include "worker_manager.hpp"

#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace s3pull::tools::mirror_prefix;

namespace {

using Objects = std::map<std::string, s3pull::test::ScriptedObject>;

[[nodiscard]] std::expected<RunSummary, FatalError>
mirror(const std::filesystem::path &destination, std::shared_ptr<KeyListing> listing,
       std::shared_ptr<ObjectFetcher> fetcher, std::shared_ptr<FileSystem> filesystem, std::size_t concurrency,
       std::size_t queue_capacity = 1000) {
    WorkerManager manager{std::move(listing), std::move(fetcher), std::move(filesystem),
                          MirrorConfig{.bucket = "bucket",
                                       .prefix = "prefix",
                                       .destination = destination,
                                       .concurrency = concurrency,
                                       .queue_capacity = queue_capacity},
                          std::make_unique<boost::asio::thread_pool>(4)};
    return manager.run();
}

[[nodiscard]] bool check_files(const std::filesystem::path &destination, const Objects &objects) {
    for (const auto &[key, object] : objects) {
        if (const auto content = s3pull::test::file_contents(destination / key); content != object.content) {
            std::cerr << key << " has content " << content.value_or("<missing>") << "\n";
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool check_fetched_once(s3pull::test::ScriptedFetcher &fetcher, const Objects &objects) {
    for (const auto &[key, object] : objects) {
        if (const int calls = fetcher.calls_for(key); calls != 1) {
            std::cerr << key << " was fetched " << calls << " times\n";
            return false;
        }
    }
    return true;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    // two pages, two workers, every key ends up on disk exactly once
    {
        const s3pull::test::TempDir destination;
        const Objects objects{{"a/1.txt", {.content = "one"}},
                              {"a/2.txt", {.content = "two", .failures = 1}},
                              {"b/3.txt", {.content = "three"}}};
        const auto fetcher = std::make_shared<s3pull::test::ScriptedFetcher>(objects);
        const auto summary =
            mirror(destination.path(),
                   std::make_shared<s3pull::test::FakeListing>(
                       std::vector<std::vector<std::string>>{{"a/1.txt", "a/2.txt"}, {"b/3.txt"}}),
                   fetcher, std::make_shared<LocalFileSystem>(), 2);
        if (!summary) {
            std::cerr << "end to end run failed: " << std::format("{}", summary.error()) << "\n";
            return 1;
        }
        if (summary->discovered != 3 || summary->completed != 3 || summary->listing_error) {
            std::cerr << "end to end run reported " << summary->completed << "/" << summary->discovered << "\n";
            return 1;
        }
        if (!check_files(destination.path(), objects)) {
            return 1;
        }
        if (fetcher->calls_for("a/1.txt") != 1 || fetcher->calls_for("a/2.txt") != 2 ||
            fetcher->calls_for("b/3.txt") != 1) {
            std::cerr << "end to end run fetched keys more often than needed\n";
            return 1;
        }
    }

    // a tiny queue and slow downloads make the lister wait, nothing may get lost and no more than
    // concurrency downloads may run at once
    {
        const s3pull::test::TempDir destination;
        constexpr std::size_t concurrency = 3;
        Objects objects;
        std::vector<std::vector<std::string>> pages(8);
        for (std::size_t i = 0; i < 200; i++) {
            std::string key = std::format("dir{}/object-{}", i % 7, i);
            objects.emplace(key, s3pull::test::ScriptedObject{.content = std::format("content of {}", i)});
            pages[i % pages.size()].emplace_back(std::move(key));
        }
        const auto fetcher =
            std::make_shared<s3pull::test::ScriptedFetcher>(objects, std::chrono::milliseconds{1});
        const auto summary =
            mirror(destination.path(), std::make_shared<s3pull::test::FakeListing>(std::move(pages)), fetcher,
                   std::make_shared<LocalFileSystem>(), concurrency, 2);
        if (!summary) {
            std::cerr << "backpressure run failed: " << std::format("{}", summary.error()) << "\n";
            return 1;
        }
        if (summary->discovered != objects.size() || summary->completed != objects.size()) {
            std::cerr << "backpressure run reported " << summary->completed << "/" << summary->discovered
                      << "\n";
            return 1;
        }
        if (!check_files(destination.path(), objects) || !check_fetched_once(*fetcher, objects)) {
            return 1;
        }
        if (fetcher->max_in_flight() > concurrency || fetcher->max_in_flight() == 0) {
            std::cerr << fetcher->max_in_flight() << " downloads ran at once\n";
            return 1;
        }
    }

    // a failed page ends the listing, keys listed before it are still mirrored
    {
        const s3pull::test::TempDir destination;
        const Objects objects{{"a/1.txt", {.content = "one"}}, {"a/2.txt", {.content = "two"}}};
        const auto fetcher = std::make_shared<s3pull::test::ScriptedFetcher>(objects);
        const auto summary = mirror(destination.path(),
                                    std::make_shared<s3pull::test::FakeListing>(
                                        std::vector<std::vector<std::string>>{
                                            {"a/1.txt", "a/2.txt"}, {"a/3.txt"}, {"a/4.txt"}},
                                        1),
                                    fetcher, std::make_shared<LocalFileSystem>(), 2);
        if (!summary) {
            std::cerr << "listing failure aborted the run: " << std::format("{}", summary.error()) << "\n";
            return 1;
        }
        if (!summary->listing_error || summary->discovered != 2 || summary->completed != 2) {
            std::cerr << "listing failure was not reported\n";
            return 1;
        }
        if (!check_files(destination.path(), objects) || fetcher->calls_for("a/3.txt") != 0) {
            return 1;
        }
    }

    // a file that can't be created aborts the whole run
    {
        const s3pull::test::TempDir destination;
        const Objects objects{{"a/1.txt", {.content = "one"}}, {"b/3.txt", {.content = "three"}}};
        const auto summary =
            mirror(destination.path(),
                   std::make_shared<s3pull::test::FakeListing>(
                       std::vector<std::vector<std::string>>{{"a/1.txt", "b/3.txt"}}),
                   std::make_shared<s3pull::test::ScriptedFetcher>(objects),
                   std::make_shared<s3pull::test::FailingFileSystem>(
                       s3pull::test::FileSystemFailures{.create_file = destination.path() / "b/3.txt"}),
                   1);
        if (summary || summary.error().reason != FatalReason::CREATE_FILE || summary.error().key != "b/3.txt") {
            std::cerr << "filesystem failure did not abort the run\n";
            return 1;
        }
    }

    // exhausted retries abort the run, idle workers and the lister wind down instead of hanging
    {
        const s3pull::test::TempDir destination;
        Objects objects{{"broken", {.content = "never", .failures = max_attempts}}};
        std::vector<std::string> keys{"broken"};
        for (std::size_t i = 0; i < 50; i++) {
            keys.emplace_back(std::format("fine-{}", i));
            objects.emplace(keys.back(), s3pull::test::ScriptedObject{.content = "fine"});
        }
        const auto fetcher = std::make_shared<s3pull::test::ScriptedFetcher>(objects);
        const auto summary = mirror(destination.path(),
                                    std::make_shared<s3pull::test::FakeListing>(
                                        std::vector<std::vector<std::string>>{std::move(keys)}),
                                    fetcher, std::make_shared<LocalFileSystem>(), 4, 1);
        if (summary || summary.error().reason != FatalReason::RETRIES_EXHAUSTED ||
            summary.error().key != "broken") {
            std::cerr << "exhausted retries did not abort the run\n";
            return 1;
        }
        if (std::filesystem::exists(destination.path() / "broken")) {
            std::cerr << "partial file of the broken key was kept\n";
            return 1;
        }
    }
}
