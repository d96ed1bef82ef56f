/**
 * \file crawler/worker/CrawlWorkerBase.cpp
 * \brief Run-count semantics and interruptible waits.
 */
#include "CrawlWorkerBase.hpp"
#include "settings/SettingsLoader.hpp"

#include <algorithm>

namespace DocCrawler::Workers {

CrawlWorkerBase::CrawlWorkerBase(WorkerKind kind, WorkerContext context)
    : kind_(kind)
    , context_(std::move(context))
    , monitor_(std::make_shared<CancellationMonitor>()) {}

void CrawlWorkerBase::set_retry_policy(RetryPolicy policy) {
    policy.max = (std::min)(policy.max, MAX_SLEEP_RETRY_TIME);
    policy.initial = (std::min)(policy.initial, policy.max);
    retry_ = policy;
}

std::chrono::milliseconds CrawlWorkerBase::backoff_delay(int failures, const RetryPolicy& policy) {
    if (failures <= 1) return (std::min)(policy.initial, policy.max);
    auto delay = policy.initial;
    for (int i = 1; i < failures && delay < policy.max; ++i) {
        delay *= 2;
    }
    return (std::min)(delay, policy.max);
}

bool CrawlWorkerBase::wait_or_closed(std::chrono::milliseconds timeout) {
    if (is_closed()) return true;
    return monitor_->wait_for(timeout, [this]() { return is_closed(); });
}

void CrawlWorkerBase::run() {
    const auto& name = settings().name;
    const int loop = context_.loop;
    int consecutive_failures = 0;

    if (logger()) logger()->debug("Crawl worker [" + name + "] (" + std::string(to_string(kind_)) + ") started");

    while (!is_closed()) {
        const int run = runs_.fetch_add(1, std::memory_order_relaxed) + 1;
        bool succeeded = true;

        try {
            run_pass();
            consecutive_failures = 0;
        } catch (const std::exception& e) {
            succeeded = false;
            ++consecutive_failures;
            if (logger()) logger()->warning("Crawl pass #" + std::to_string(run) + " of [" + name + "] failed: " + e.what());
        }

        if (loop > 0 && run >= loop) {
            if (logger()) logger()->info("Reached the number of runs for [" + name + "]: " + std::to_string(loop));
            set_closed(true);
            break;
        }

        if (is_closed()) break;

        const auto wait = succeeded
            ? settings().fs.update_rate
            : backoff_delay(consecutive_failures, retry_);
        if (logger()) {
            logger()->debug("Crawl worker [" + name + "] waiting " + Config::SettingsLoader::format_duration(wait) +
                            (succeeded ? " before next pass" : " before retry"));
        }
        if (wait_or_closed(wait)) break;
    }

    if (logger()) logger()->debug("Crawl worker [" + name + "] stopped after " + std::to_string(runs()) + " run(s)");
}

} // namespace DocCrawler::Workers
