#pragma once

#include "misc.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>

namespace s3pull::tools::mirror_prefix {

// Prints a progress line every interval on its own thread. Stopping wakes the thread right away
// instead of waiting for the current interval to pass.
class StatsReporter {
private:
    std::mutex mutex;
    std::condition_variable_any wakeup;
    // declared last so that it is joined before the members it waits on go away
    std::jthread thread;

public:
    [[nodiscard]] StatsReporter(std::shared_ptr<const Progress> progress,
                                std::function<std::size_t()> running_workers, std::chrono::milliseconds interval,
                                std::ostream &out);
    StatsReporter(const StatsReporter &) = delete;
    StatsReporter &operator=(const StatsReporter &) = delete;
    StatsReporter(StatsReporter &&) = delete;
    StatsReporter &operator=(StatsReporter &&) = delete;
    ~StatsReporter() = default;

    void stop();
};

} // namespace s3pull::tools::mirror_prefix
