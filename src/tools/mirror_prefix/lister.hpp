#pragma once

#include "capabilities.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace s3pull::tools::mirror_prefix {

struct ListingOutcome {
    std::size_t pages{};
    // set if a page failed, the listing is not retried
    std::optional<std::string> error;
};

// Streams every key under prefix into queue, counting each one as discovered before it is queued.
// Suspends while the queue is full. Closes the queue on every exit path, it is the only sender.
[[nodiscard]] meta::crt<boost::asio::awaitable<ListingOutcome>>
run_lister(KeyListing &listing, std::string bucket, std::string prefix, KeyQueue &queue, Progress &progress);

} // namespace s3pull::tools::mirror_prefix
