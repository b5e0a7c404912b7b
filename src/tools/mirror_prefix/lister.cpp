#include "lister.hpp"

#include "capabilities.hpp"
#include "misc.hpp"
#include "s3pull/meta.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/scope/scope_exit.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <utility>

namespace s3pull::tools::mirror_prefix {

meta::crt<boost::asio::awaitable<ListingOutcome>>
run_lister(KeyListing &listing, std::string bucket, std::string prefix, KeyQueue &queue, Progress &progress) {
    const boost::scope::scope_exit close_queue{[&queue]() { queue.close(); }};

    ListingOutcome outcome;
    std::optional<std::string> continuation_token;
    do {
        auto page = co_await listing.list_page(bucket, prefix, std::move(continuation_token));
        if (!page) {
            std::println(std::cerr, "ERROR listing s3://{}/{} failed on page {}, stopping the listing: {}", bucket,
                         prefix, outcome.pages + 1, page.error());
            outcome.error = std::move(page.error());
            co_return outcome;
        }
        outcome.pages++;

        for (auto &key : page->keys) {
            progress.add_discovered();
            const auto [send_ec] = co_await queue.async_send(boost::system::error_code{}, std::move(key),
                                                             boost::asio::as_tuple(boost::asio::use_awaitable));
            if (send_ec.failed()) {
                // the run was aborted and the queue cancelled
                co_return outcome;
            }
        }

        continuation_token = std::move(page->continuation_token);
    } while (continuation_token.has_value());

    co_return outcome;
}

} // namespace s3pull::tools::mirror_prefix
