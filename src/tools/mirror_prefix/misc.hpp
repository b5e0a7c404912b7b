#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/io_context.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>

namespace s3pull::tools::mirror_prefix {

// attempts per key, including the first one
constexpr int max_attempts = 3;

// Pending keys between the lister and the workers. Keys still buffered when the lister closes the
// channel are delivered before receivers see channel_closed.
using KeyQueue = boost::asio::experimental::concurrent_channel<void(boost::system::error_code, std::string)>;

struct MirrorConfig {
    std::string bucket;
    std::string prefix;
    std::filesystem::path destination;
    std::size_t concurrency = 50;
    std::size_t queue_capacity = 1000;
};

struct ProgressSnapshot {
    std::size_t completed{};
    std::size_t discovered{};
};

// Only ever touched through atomic increments. completed never overtakes discovered because a key
// is counted as discovered before it enters the queue. A snapshot reads completed first, with
// acquire, so the discovered value it reads afterwards includes every key counted in completed.
class Progress {
private:
    std::atomic<std::size_t> discovered_{0};
    std::atomic<std::size_t> completed_{0};

public:
    void add_discovered() { discovered_.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] ProgressSnapshot record_completed() {
        const std::size_t completed = completed_.fetch_add(1, std::memory_order_acq_rel) + 1;
        return {.completed = completed, .discovered = discovered_.load(std::memory_order_relaxed)};
    }

    [[nodiscard]] ProgressSnapshot snapshot() const {
        const std::size_t completed = completed_.load(std::memory_order_acquire);
        return {.completed = completed, .discovered = discovered_.load(std::memory_order_relaxed)};
    }

    [[nodiscard]] std::size_t discovered() const { return discovered_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t completed() const { return completed_.load(std::memory_order_relaxed); }
};

enum class FatalReason : std::uint8_t {
    INVALID_KEY,
    CREATE_DIRECTORY,
    CREATE_FILE,
    RESET_FILE,
    RETRIES_EXHAUSTED,
    INTERNAL
};
BOOST_DESCRIBE_ENUM(FatalReason, INVALID_KEY, CREATE_DIRECTORY, CREATE_FILE, RESET_FILE, RETRIES_EXHAUSTED,
                    INTERNAL);

// An error that ends the whole run.
struct FatalError {
    FatalReason reason{};
    std::string key;
    std::string detail;
};

struct RunSummary {
    std::size_t discovered{};
    std::size_t completed{};
    // set if the listing ended on a failed page, keys after it were never seen
    std::optional<std::string> listing_error;
};

[[nodiscard]] inline std::string describe_exception(const std::exception_ptr &exception) {
    try {
        std::rethrow_exception(exception);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

// Runs task on context until the context runs out of work. An exception escaping the task is
// returned as its description instead of leaving context.run().
template <typename T>
[[nodiscard]] std::expected<T, std::string> run_blocking(boost::asio::io_context &context,
                                                         boost::asio::awaitable<T> task) {
    std::optional<std::expected<T, std::string>> ret;
    boost::asio::co_spawn(context, std::move(task), [&ret](std::exception_ptr exception, T value) {
        if (exception) {
            ret.emplace(std::unexpect, describe_exception(exception));
        } else {
            ret.emplace(std::move(value));
        }
    });
    context.run();
    if (!ret) {
        return std::unexpected{"the operation did not complete"};
    }
    return std::move(*ret);
}

} // namespace s3pull::tools::mirror_prefix

template <> struct std::formatter<s3pull::tools::mirror_prefix::FatalError> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const s3pull::tools::mirror_prefix::FatalError &error, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{} on key {}: {}",
                              boost::describe::enum_to_string(error.reason, "UNKNOWN"), error.key, error.detail);
    }
};
