// src/crossover/feed/quote_fetcher.cpp
#include "crossover/feed/quote_fetcher.hpp"
#include "crossover/utils/logger.hpp"
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>

namespace crossover {
namespace feed {

QuoteFetcher::QuoteFetcher(QuoteSource& source, core::Clock& clock, RetryPolicy policy)
    : source_(source), clock_(clock), policy_(policy) {
    if (policy_.max_attempts < 1) {
        throw std::invalid_argument("retry policy needs at least one attempt");
    }
}

FetchResult QuoteFetcher::fetch_once(const core::Instrument& instrument, core::Resolution resolution) {
    FetchResult result;
    try {
        result = source_.fetch(instrument, resolution);
    } catch (const std::exception& e) {
        utils::Logger::error() << instrument.symbol << ": quote source threw: " << e.what() << utils::Logger::endl;
        return FetchResult::unavailable(e.what());
    } catch (...) {
        utils::Logger::error() << instrument.symbol << ": quote source threw an unknown exception"
                               << utils::Logger::endl;
        return FetchResult::unavailable("unknown exception");
    }

    if (result.ok() && !(std::isfinite(result.price) && result.price > 0.0)) {
        return FetchResult::unavailable("non-positive price " + std::to_string(result.price));
    }
    return result;
}

FetchResult QuoteFetcher::fetch(const core::Instrument& instrument, core::Resolution resolution,
                                const utils::CancellationToken& token) {
    auto delay_seconds = std::chrono::duration<double>(policy_.delay).count();

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        FetchResult result = fetch_once(instrument, resolution);

        if (result.status == FetchStatus::OK) {
            return result;
        }
        if (result.status == FetchStatus::UNAVAILABLE) {
            utils::Logger::warn() << "Error fetching price for " << instrument.symbol
                                  << " (" << resolution << "): " << result.detail << utils::Logger::endl;
            return result;
        }

        if (attempt == policy_.max_attempts) {
            break;
        }

        utils::Logger::warn() << instrument.symbol << ": Rate limit hit (429). Retrying in "
                              << delay_seconds << "s... (" << attempt << "/" << policy_.max_attempts << ")"
                              << utils::Logger::endl;
        if (!clock_.sleep_for(policy_.delay, token)) {
            return FetchResult::rate_limited("cancelled during retry delay");
        }
    }

    utils::Logger::warn() << instrument.symbol << ": Failed after " << policy_.max_attempts
                          << " attempts due to rate limits." << utils::Logger::endl;
    return FetchResult::rate_limited("retry budget exhausted");
}

} // namespace feed
} // namespace crossover
