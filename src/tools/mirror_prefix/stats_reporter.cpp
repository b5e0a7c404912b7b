#include "stats_reporter.hpp"

#include "misc.hpp"

#include <boost/accumulators/framework/accumulator_set.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/rolling_window.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <print>
#include <stop_token>
#include <utility>

namespace s3pull::tools::mirror_prefix {

StatsReporter::StatsReporter(std::shared_ptr<const Progress> progress,
                             std::function<std::size_t()> running_workers, std::chrono::milliseconds interval,
                             std::ostream &out) {
    thread = std::jthread{[this, progress = std::move(progress), running_workers = std::move(running_workers),
                           interval, &out](const std::stop_token &token) {
        using namespace boost::accumulators;
        accumulator_set<std::size_t, stats<tag::rolling_mean>> objects_accumulator{
            tag::rolling_window::window_size = 60};
        const double seconds = std::chrono::duration<double>{interval}.count();

        std::size_t previous_completed = progress->snapshot().completed;
        std::unique_lock lock{mutex};
        while (!wakeup.wait_for(lock, token, interval, [&token] { return token.stop_requested(); })) {
            const ProgressSnapshot snapshot = progress->snapshot();
            objects_accumulator(snapshot.completed - previous_completed);
            previous_completed = snapshot.completed;

            std::println(out, "{} active workers, {} discovered, {} completed, {:.2f} objects/s",
                         running_workers(), snapshot.discovered, snapshot.completed,
                         rolling_mean(objects_accumulator) / seconds);
            out.flush();
        }
    }};
}

void StatsReporter::stop() {
    thread.request_stop();
    if (thread.joinable()) {
        thread.join();
    }
}

} // namespace s3pull::tools::mirror_prefix
