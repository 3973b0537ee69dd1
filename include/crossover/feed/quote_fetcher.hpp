// include/crossover/feed/quote_fetcher.hpp
#pragma once
#include <chrono>
#include "crossover/core/clock.hpp"
#include "crossover/feed/quote_source.hpp"
#include "crossover/utils/cancellation_token.hpp"

namespace crossover {
namespace feed {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{5000};
};

/**
 * @class QuoteFetcher
 * @brief Caller-side retry policy over a QuoteSource
 *
 * RATE_LIMITED answers are retried up to max_attempts calls in total with
 * `delay` between calls. UNAVAILABLE answers are returned at once. An
 * exception thrown by the source is logged and reported as UNAVAILABLE.
 */
class QuoteFetcher {
public:
    QuoteFetcher(QuoteSource& source, core::Clock& clock, RetryPolicy policy);

    FetchResult fetch(const core::Instrument& instrument, core::Resolution resolution,
                      const utils::CancellationToken& token);

    // Single call, no retry.
    FetchResult fetch_once(const core::Instrument& instrument, core::Resolution resolution);

private:
    QuoteSource& source_;
    core::Clock& clock_;
    RetryPolicy policy_;
};

} // namespace feed
} // namespace crossover
